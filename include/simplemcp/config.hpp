#pragma once
#include "logger.hpp"
#include "server.hpp"
#include <string>
#include <nlohmann/json.hpp>

namespace simplemcp {

/// Server and logging settings, loadable from a JSON document:
///
///     {
///       "server":  {"name": "...", "version": "...", "instructions": "...",
///                   "page_size": 50, "framing": "newline" | "content-length",
///                   "max_message_size": 4194304, "redact_handler_errors": false},
///       "logging": {"level": "info", "file": "server.log",
///                   "max_file_size": 5242880, "max_files": 3, "pattern": "..."}
///     }
///
/// Every key is optional; unknown keys are ignored.
struct ServerConfig {
    McpServer::Options server;
    logging::LogOptions logging;
};

/// Throws McpError on wrongly typed or invalid values.
ServerConfig parse_server_config(const nlohmann::json& j);

/// Throws McpError if the file cannot be read or parsed.
ServerConfig load_server_config(const std::string& path);

FramingMode parse_framing_mode(const std::string& name);

} // namespace simplemcp
