#include <mcp_base/mcp/registry.hpp>

#include <mcp_base/core/log.hpp>

#include <stdexcept>

namespace mcp_base {

namespace {

constexpr const char* kComponent = "registry";

template <typename Entry>
auto Definitions(const std::vector<Entry>& entries) {
    std::vector<decltype(Entry::definition)> out;
    out.reserve(entries.size());
    for (const auto& entry : entries) {
        out.push_back(entry.definition);
    }
    return out;
}

} // anonymous namespace

void Registry::RequireMutable(const char* operation) const {
    if (frozen_) {
        throw std::logic_error(std::string(operation) +
                               ": registry is frozen while the server is serving");
    }
}

void Registry::RegisterTool(ToolDefinition definition, ToolHandler handler) {
    RequireMutable("RegisterTool");
    auto key = definition.name;
    tools_.Upsert(key, ToolEntry{std::move(definition), std::move(handler)});
    LogDebug(kComponent, "Tool registered", {{"tool", key}});
}

void Registry::RegisterResource(ResourceDefinition definition,
                                ResourceHandler handler) {
    RequireMutable("RegisterResource");
    auto key = definition.uri;
    resources_.Upsert(key, ResourceEntry{std::move(definition), std::move(handler)});
    LogDebug(kComponent, "Resource registered", {{"uri", key}});
}

void Registry::RegisterPrompt(PromptDefinition definition, PromptHandler handler) {
    RequireMutable("RegisterPrompt");
    auto key = definition.name;
    prompts_.Upsert(key, PromptEntry{std::move(definition), std::move(handler)});
    LogDebug(kComponent, "Prompt registered", {{"prompt", key}});
}

std::vector<ToolDefinition> Registry::ListTools() const {
    return Definitions(tools_.Entries());
}

std::vector<ResourceDefinition> Registry::ListResources() const {
    return Definitions(resources_.Entries());
}

std::vector<PromptDefinition> Registry::ListPrompts() const {
    return Definitions(prompts_.Entries());
}

const ToolEntry* Registry::FindTool(const std::string& name) const {
    return tools_.Find(name);
}

const ResourceEntry* Registry::FindResource(const std::string& uri) const {
    return resources_.Find(uri);
}

const PromptEntry* Registry::FindPrompt(const std::string& name) const {
    return prompts_.Find(name);
}

bool Registry::RemoveTool(const std::string& name) {
    RequireMutable("RemoveTool");
    return tools_.Erase(name);
}

bool Registry::RemoveResource(const std::string& uri) {
    RequireMutable("RemoveResource");
    return resources_.Erase(uri);
}

bool Registry::RemovePrompt(const std::string& name) {
    RequireMutable("RemovePrompt");
    return prompts_.Erase(name);
}

} // namespace mcp_base
