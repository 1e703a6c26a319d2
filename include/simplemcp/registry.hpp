#pragma once
#include "types.hpp"
#include <cstddef>
#include <functional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json.hpp>

namespace simplemcp {

enum class CapabilityKind {
    Tool,
    Prompt,
    Resource
};

const char* to_string(CapabilityKind kind);

/// Handler types, one per capability kind.
/// The returned value becomes the "content", "messages" or "contents" field
/// of the result. Throwing reports a failure to the client.
using ToolHandler = std::function<nlohmann::json(const nlohmann::json& arguments)>;
using PromptHandler = std::function<nlohmann::json(const nlohmann::json& arguments)>;
using ResourceHandler = std::function<nlohmann::json(const std::string& uri)>;

struct ToolEntry {
    ToolDefinition definition;
    ToolHandler handler;

    const std::string& key() const { return definition.name; }
};

struct PromptEntry {
    PromptDefinition definition;
    PromptHandler handler;

    const std::string& key() const { return definition.name; }
};

struct ResourceEntry {
    ResourceDefinition definition;
    /// Empty for static resources; reads then return a payload built from
    /// the definition.
    ResourceHandler handler;

    const std::string& key() const { return definition.uri; }
};

/// Unique-key store that remembers insertion order.
template<typename Entry>
class OrderedIndex {
public:
    /// Returns false and leaves the index unchanged if the key exists.
    bool insert(Entry entry) {
        auto [it, inserted] = index_.emplace(entry.key(), items_.size());
        if (!inserted) return false;
        items_.push_back(std::move(entry));
        return true;
    }

    const Entry* find(const std::string& key) const {
        auto it = index_.find(key);
        return it == index_.end() ? nullptr : &items_[it->second];
    }

    const std::vector<Entry>& items() const { return items_; }
    std::size_t size() const { return items_.size(); }
    bool empty() const { return items_.empty(); }

private:
    std::vector<Entry> items_;
    std::unordered_map<std::string, std::size_t> index_;
};

/// Immutable set of registered tools, prompts and resources.
/// Produced by RegistryBuilder::build(); read-only afterwards, so it is safe
/// to share between threads without locking.
class Registry {
public:
    Registry() = default;

    /// Lookup by name (tools, prompts) or URI (resources).
    /// Throws NotFoundError if absent.
    const ToolEntry& tool(const std::string& name) const;
    const PromptEntry& prompt(const std::string& name) const;
    const ResourceEntry& resource(const std::string& uri) const;

    /// Lookup returning nullptr if absent.
    const ToolEntry* find_tool(const std::string& name) const { return tools_.find(name); }
    const PromptEntry* find_prompt(const std::string& name) const { return prompts_.find(name); }
    const ResourceEntry* find_resource(const std::string& uri) const { return resources_.find(uri); }

    /// Entries in registration order.
    const std::vector<ToolEntry>& tools() const { return tools_.items(); }
    const std::vector<PromptEntry>& prompts() const { return prompts_.items(); }
    const std::vector<ResourceEntry>& resources() const { return resources_.items(); }

    bool contains(CapabilityKind kind, const std::string& key) const;
    /// Names (or URIs) of one kind, in registration order.
    std::vector<std::string> keys(CapabilityKind kind) const;
    std::size_t size(CapabilityKind kind) const;
    bool empty(CapabilityKind kind) const { return size(kind) == 0; }

private:
    friend class RegistryBuilder;

    OrderedIndex<ToolEntry> tools_;
    OrderedIndex<PromptEntry> prompts_;
    OrderedIndex<ResourceEntry> resources_;
};

/// Accumulates registrations and hands out the finished Registry once.
///
/// Duplicate names (or URIs) are rejected with DuplicateKeyError; the first
/// registration stays. Any add_* after build() throws RegistryFrozenError.
class RegistryBuilder {
public:
    RegistryBuilder& add_tool(ToolDefinition def, ToolHandler handler);
    RegistryBuilder& add_prompt(PromptDefinition def, PromptHandler handler);
    RegistryBuilder& add_resource(ResourceDefinition def, ResourceHandler handler = nullptr);

    /// Move the accumulated entries out. The builder is frozen afterwards.
    [[nodiscard]] Registry build();

    [[nodiscard]] bool frozen() const { return frozen_; }

private:
    void check_open(CapabilityKind kind, const std::string& key) const;

    Registry registry_;
    bool frozen_{false};
};

} // namespace simplemcp
