#pragma once
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace simplemcp {

// ---------- Implementation info ----------

struct Implementation {
    std::string name;
    std::string version;

    bool operator==(const Implementation& o) const {
        return name == o.name && version == o.version;
    }
};

// ---------- Tool ----------

struct ToolDefinition {
    std::string name;
    std::string description;
    std::optional<std::string> title;
    /// JSON Schema of the arguments object. Arguments are validated against
    /// it before the handler runs; an empty object schema is advertised when unset.
    std::optional<nlohmann::json> input_schema;

    bool operator==(const ToolDefinition& o) const {
        return name == o.name && description == o.description && title == o.title
               && input_schema == o.input_schema;
    }
};

// ---------- Prompt ----------

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;

    bool operator==(const PromptArgument& o) const {
        return name == o.name && description == o.description && required == o.required;
    }
};

struct PromptDefinition {
    std::string name;
    std::string description;
    std::vector<PromptArgument> arguments;

    bool operator==(const PromptDefinition& o) const {
        return name == o.name && description == o.description && arguments == o.arguments;
    }
};

// ---------- Resource ----------

struct ResourceDefinition {
    std::string uri;
    std::string name;
    std::string description;
    std::string mime_type = "text/plain";

    bool operator==(const ResourceDefinition& o) const {
        return uri == o.uri && name == o.name && description == o.description
               && mime_type == o.mime_type;
    }
};

// ---------- Capabilities / initialize ----------

/// Which capability kinds the server advertises.
struct ServerCapabilities {
    bool tools = false;
    bool prompts = false;
    bool resources = false;

    bool operator==(const ServerCapabilities& o) const {
        return tools == o.tools && prompts == o.prompts && resources == o.resources;
    }
};

struct InitializeResult {
    std::string protocol_version;
    ServerCapabilities capabilities;
    Implementation server_info;
    std::optional<std::string> instructions;
};

// ---------- Content helpers ----------

/// [{"type":"text","text":...}], the usual tool content payload.
nlohmann::json text_content(const std::string& text);

/// {"role":role,"content":{"type":"text","text":...}} for prompt messages.
nlohmann::json prompt_message(const std::string& role, const std::string& text);

/// [{"uri":...,"mimeType":...,"text":...}] for resource contents.
nlohmann::json text_resource(const std::string& uri, const std::string& mime_type,
                             const std::string& text);

// ---------- JSON serialization ----------

void to_json(nlohmann::json& j, const Implementation& t);
void from_json(const nlohmann::json& j, Implementation& t);

void to_json(nlohmann::json& j, const ToolDefinition& t);
void from_json(const nlohmann::json& j, ToolDefinition& t);

void to_json(nlohmann::json& j, const PromptArgument& t);
void from_json(const nlohmann::json& j, PromptArgument& t);

void to_json(nlohmann::json& j, const PromptDefinition& t);
void from_json(const nlohmann::json& j, PromptDefinition& t);

void to_json(nlohmann::json& j, const ResourceDefinition& t);
void from_json(const nlohmann::json& j, ResourceDefinition& t);

void to_json(nlohmann::json& j, const ServerCapabilities& t);
void from_json(const nlohmann::json& j, ServerCapabilities& t);

void to_json(nlohmann::json& j, const InitializeResult& t);
void from_json(const nlohmann::json& j, InitializeResult& t);

} // namespace simplemcp
