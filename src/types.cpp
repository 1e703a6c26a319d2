#include "simplemcp/types.hpp"

namespace simplemcp {

// ---------- Content helpers ----------

nlohmann::json text_content(const std::string& text) {
    return nlohmann::json::array({{{"type", "text"}, {"text", text}}});
}

nlohmann::json prompt_message(const std::string& role, const std::string& text) {
    return {{"role", role}, {"content", {{"type", "text"}, {"text", text}}}};
}

nlohmann::json text_resource(const std::string& uri, const std::string& mime_type,
                             const std::string& text) {
    return nlohmann::json::array({{{"uri", uri}, {"mimeType", mime_type}, {"text", text}}});
}

// ---------- Implementation ----------

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.at("name").get<std::string>();
    t.version = j.value("version", std::string{});
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}};
    j["inputSchema"] = t.input_schema ? *t.input_schema
                                      : nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}};
    if (t.title) j["title"] = *t.title;
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string{});
    if (j.contains("title")) t.title = j.at("title").get<std::string>();
    if (j.contains("inputSchema")) t.input_schema = j.at("inputSchema");
}

// ---------- PromptDefinition ----------

void to_json(nlohmann::json& j, const PromptArgument& t) {
    j = {{"name", t.name}, {"required", t.required}};
    if (t.description) j["description"] = *t.description;
}

void from_json(const nlohmann::json& j, PromptArgument& t) {
    t.name = j.at("name").get<std::string>();
    if (j.contains("description")) t.description = j.at("description").get<std::string>();
    t.required = j.value("required", false);
}

void to_json(nlohmann::json& j, const PromptDefinition& t) {
    j = {{"name", t.name}, {"description", t.description}};
    if (!t.arguments.empty()) j["arguments"] = t.arguments;
}

void from_json(const nlohmann::json& j, PromptDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string{});
    if (j.contains("arguments")) {
        t.arguments = j.at("arguments").get<std::vector<PromptArgument>>();
    }
}

// ---------- ResourceDefinition ----------

void to_json(nlohmann::json& j, const ResourceDefinition& t) {
    j = {{"uri", t.uri}, {"name", t.name}, {"description", t.description},
         {"mimeType", t.mime_type}};
}

void from_json(const nlohmann::json& j, ResourceDefinition& t) {
    t.uri = j.at("uri").get<std::string>();
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string{});
    t.mime_type = j.value("mimeType", std::string("text/plain"));
}

// ---------- ServerCapabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = {{"tools", t.tools}, {"prompts", t.prompts}, {"resources", t.resources}};
}

// Booleans, or MCP capability objects where a present key means advertised
void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    auto advertised = [&j](const char* key) {
        auto it = j.find(key);
        if (it == j.end() || it->is_null()) return false;
        if (it->is_boolean()) return it->get<bool>();
        return true;
    };
    t.tools = advertised("tools");
    t.prompts = advertised("prompts");
    t.resources = advertised("resources");
}

// ---------- InitializeResult ----------

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {{"protocolVersion", t.protocol_version},
         {"capabilities", t.capabilities},
         {"serverInfo", t.server_info}};
    if (t.instructions) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    if (j.contains("instructions")) t.instructions = j.at("instructions").get<std::string>();
}

} // namespace simplemcp
