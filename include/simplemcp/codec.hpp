#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <optional>
#include <string>
#include <string_view>

namespace simplemcp {

class Codec {
public:
    /// Parse raw bytes into a JSON value.
    /// Throws FramingError if the bytes are not one valid JSON document.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Turn a parsed JSON value into a typed message.
    /// Throws InvalidRequestError if it is not a JSON-RPC 2.0 message.
    [[nodiscard]] static JsonRpcMessage decode(const nlohmann::json& j);

    /// parse_json followed by decode.
    [[nodiscard]] static JsonRpcMessage parse(std::string_view raw);

    /// Serialize a message to a compact JSON string (no trailing newline).
    [[nodiscard]] static std::string serialize(const JsonRpcMessage& msg);

    /// Best-effort id extraction from a value that failed to decode, so the
    /// error can still be correlated by the client.
    [[nodiscard]] static std::optional<RequestId> recover_id(const nlohmann::json& j) noexcept;
};

} // namespace simplemcp
