#include "simplemcp/config.hpp"
#include "simplemcp/error.hpp"
#include <cstdint>
#include <fstream>
#include <sstream>
#include <type_traits>

namespace simplemcp {

namespace {

template<typename T>
void read_optional(const nlohmann::json& section, const char* key, T& out) {
    auto it = section.find(key);
    if (it == section.end() || it->is_null()) return;
    if constexpr (std::is_unsigned_v<T> && !std::is_same_v<T, bool>) {
        // get<std::size_t>() would wrap a negative number around
        if (!it->is_number_integer() ||
            (!it->is_number_unsigned() && it->get<std::int64_t>() < 0)) {
            throw McpError(std::string("Invalid config value for '") + key +
                           "': expected a non-negative integer");
        }
    }
    try {
        out = it->get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw McpError(std::string("Invalid config value for '") + key + "': " + e.what());
    }
}

const nlohmann::json& section(const nlohmann::json& j, const char* name) {
    static const nlohmann::json empty = nlohmann::json::object();
    auto it = j.find(name);
    if (it == j.end() || it->is_null()) return empty;
    if (!it->is_object()) {
        throw McpError(std::string("Config section '") + name + "' must be an object");
    }
    return *it;
}

} // anonymous namespace

FramingMode parse_framing_mode(const std::string& name) {
    if (name == "newline" || name == "ndjson") return FramingMode::NewlineDelimited;
    if (name == "content-length") return FramingMode::ContentLength;
    throw McpError("Unknown framing mode: " + name);
}

ServerConfig parse_server_config(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw McpError("Config must be a JSON object");
    }
    ServerConfig cfg;

    const auto& server = section(j, "server");
    read_optional(server, "name", cfg.server.server_info.name);
    read_optional(server, "version", cfg.server.server_info.version);
    std::string instructions;
    read_optional(server, "instructions", instructions);
    if (!instructions.empty()) cfg.server.instructions = instructions;
    read_optional(server, "page_size", cfg.server.page_size);
    read_optional(server, "max_message_size", cfg.server.max_message_size);
    read_optional(server, "redact_handler_errors", cfg.server.redact_handler_errors);
    std::string framing;
    read_optional(server, "framing", framing);
    if (!framing.empty()) cfg.server.framing = parse_framing_mode(framing);
    if (cfg.server.max_message_size == 0) {
        throw McpError("max_message_size must be positive");
    }

    const auto& log = section(j, "logging");
    read_optional(log, "level", cfg.logging.level);
    std::string file;
    read_optional(log, "file", file);
    if (!file.empty()) cfg.logging.file = file;
    read_optional(log, "max_file_size", cfg.logging.max_file_size);
    read_optional(log, "max_files", cfg.logging.max_files);
    read_optional(log, "pattern", cfg.logging.pattern);
    // Reject typos early instead of at configure() time
    logging::parse_level(cfg.logging.level);

    return cfg;
}

ServerConfig load_server_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw McpError("Cannot open config file: " + path);
    }
    std::stringstream ss;
    ss << in.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(ss.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw McpError("Invalid config file " + path + ": " + e.what());
    }
    return parse_server_config(j);
}

} // namespace simplemcp
