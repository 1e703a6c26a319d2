#pragma once
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <spdlog/logger.h>

#define SIMPLEMCP_LOG_TRACE(...) ::simplemcp::logging::get()->trace(__VA_ARGS__)
#define SIMPLEMCP_LOG_DEBUG(...) ::simplemcp::logging::get()->debug(__VA_ARGS__)
#define SIMPLEMCP_LOG_INFO(...) ::simplemcp::logging::get()->info(__VA_ARGS__)
#define SIMPLEMCP_LOG_WARN(...) ::simplemcp::logging::get()->warn(__VA_ARGS__)
#define SIMPLEMCP_LOG_ERROR(...) ::simplemcp::logging::get()->error(__VA_ARGS__)

namespace simplemcp {
namespace logging {

constexpr const char* LOGGER_NAME = "simplemcp";

struct LogOptions {
    /// trace, debug, info, warn, error, critical or off
    std::string level = "warn";
    /// Also log to this rotating file when set.
    std::optional<std::string> file;
    std::size_t max_file_size = 5 * 1024 * 1024;
    std::size_t max_files = 3;
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v";
};

/// Library logger. Writes to stderr only; stdout carries the protocol.
/// Created on first use with default options if configure() was not called.
std::shared_ptr<spdlog::logger> get();

/// Replace the library logger. Throws McpError on an unknown level name
/// or a file sink that cannot be opened.
void configure(const LogOptions& opts);

/// Parse a level name. Throws McpError on unknown names.
spdlog::level::level_enum parse_level(const std::string& name);

void set_level(const std::string& name);

} // namespace logging
} // namespace simplemcp
