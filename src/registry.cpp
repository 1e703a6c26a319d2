#include "simplemcp/registry.hpp"
#include "simplemcp/error.hpp"
#include "simplemcp/logger.hpp"

namespace simplemcp {

namespace {

template<typename Entry>
std::vector<std::string> keys_of(const OrderedIndex<Entry>& index) {
    std::vector<std::string> keys;
    keys.reserve(index.size());
    for (const auto& e : index.items()) keys.push_back(e.key());
    return keys;
}

} // anonymous namespace

const char* to_string(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::Tool:     return "tool";
        case CapabilityKind::Prompt:   return "prompt";
        case CapabilityKind::Resource: return "resource";
    }
    return "unknown";
}

// ---------- Registry ----------

const ToolEntry& Registry::tool(const std::string& name) const {
    const auto* e = tools_.find(name);
    if (!e) throw NotFoundError("Unknown tool: " + name);
    return *e;
}

const PromptEntry& Registry::prompt(const std::string& name) const {
    const auto* e = prompts_.find(name);
    if (!e) throw NotFoundError("Unknown prompt: " + name);
    return *e;
}

const ResourceEntry& Registry::resource(const std::string& uri) const {
    const auto* e = resources_.find(uri);
    if (!e) throw NotFoundError("Resource not found: " + uri);
    return *e;
}

bool Registry::contains(CapabilityKind kind, const std::string& key) const {
    switch (kind) {
        case CapabilityKind::Tool:     return tools_.find(key) != nullptr;
        case CapabilityKind::Prompt:   return prompts_.find(key) != nullptr;
        case CapabilityKind::Resource: return resources_.find(key) != nullptr;
    }
    return false;
}

std::vector<std::string> Registry::keys(CapabilityKind kind) const {
    switch (kind) {
        case CapabilityKind::Tool:     return keys_of(tools_);
        case CapabilityKind::Prompt:   return keys_of(prompts_);
        case CapabilityKind::Resource: return keys_of(resources_);
    }
    return {};
}

std::size_t Registry::size(CapabilityKind kind) const {
    switch (kind) {
        case CapabilityKind::Tool:     return tools_.size();
        case CapabilityKind::Prompt:   return prompts_.size();
        case CapabilityKind::Resource: return resources_.size();
    }
    return 0;
}

// ---------- RegistryBuilder ----------

void RegistryBuilder::check_open(CapabilityKind kind, const std::string& key) const {
    if (frozen_) {
        throw RegistryFrozenError(std::string("Cannot register ") + to_string(kind) + " '" + key +
                                  "': registry already built");
    }
    if (key.empty()) {
        throw McpError(std::string("Cannot register ") + to_string(kind) + " with an empty " +
                       (kind == CapabilityKind::Resource ? "uri" : "name"));
    }
}

RegistryBuilder& RegistryBuilder::add_tool(ToolDefinition def, ToolHandler handler) {
    check_open(CapabilityKind::Tool, def.name);
    if (!handler) {
        throw McpError("Tool '" + def.name + "' has no handler");
    }
    std::string name = def.name;
    if (!registry_.tools_.insert(ToolEntry{std::move(def), std::move(handler)})) {
        throw DuplicateKeyError("Tool already registered: " + name);
    }
    SIMPLEMCP_LOG_DEBUG("registered tool '{}'", name);
    return *this;
}

RegistryBuilder& RegistryBuilder::add_prompt(PromptDefinition def, PromptHandler handler) {
    check_open(CapabilityKind::Prompt, def.name);
    if (!handler) {
        throw McpError("Prompt '" + def.name + "' has no handler");
    }
    std::string name = def.name;
    if (!registry_.prompts_.insert(PromptEntry{std::move(def), std::move(handler)})) {
        throw DuplicateKeyError("Prompt already registered: " + name);
    }
    SIMPLEMCP_LOG_DEBUG("registered prompt '{}'", name);
    return *this;
}

RegistryBuilder& RegistryBuilder::add_resource(ResourceDefinition def, ResourceHandler handler) {
    check_open(CapabilityKind::Resource, def.uri);
    std::string uri = def.uri;
    if (!registry_.resources_.insert(ResourceEntry{std::move(def), std::move(handler)})) {
        throw DuplicateKeyError("Resource already registered: " + uri);
    }
    SIMPLEMCP_LOG_DEBUG("registered resource '{}'", uri);
    return *this;
}

Registry RegistryBuilder::build() {
    if (frozen_) {
        throw RegistryFrozenError("Registry already built");
    }
    frozen_ = true;
    return std::move(registry_);
}

} // namespace simplemcp
