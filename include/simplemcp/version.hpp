#pragma once
#include <array>
#include <string_view>

namespace simplemcp {

constexpr std::string_view LIBRARY_VERSION     = "0.1.1";
constexpr std::string_view PROTOCOL_VERSION    = "2025-06-18";
constexpr std::string_view JSONRPC_VERSION     = "2.0";

/// Protocol revisions accepted from a client during initialize.
constexpr std::array<std::string_view, 4> SUPPORTED_PROTOCOL_VERSIONS = {
    "2025-06-18",
    "2025-03-26",
    "2024-11-05",
    "2024-10-07",
};

} // namespace simplemcp
