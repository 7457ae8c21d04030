#pragma once

#include <mcp_base/mcp/types.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace mcp_base {

// A registered definition together with its handler.
template <typename Definition, typename Handler>
struct RegistryEntry {
    Definition definition;
    Handler handler;
};

using ToolEntry = RegistryEntry<ToolDefinition, ToolHandler>;
using ResourceEntry = RegistryEntry<ResourceDefinition, ResourceHandler>;
using PromptEntry = RegistryEntry<PromptDefinition, PromptHandler>;

// ---------------------------------------------------------------------------
// Registry: tools by name, resources by URI, prompts by name.
//
// Registering an existing key overwrites the entry in place, so listings stay
// in first-registration order without duplicates. Once frozen (the server
// freezes it when it starts serving) the tables are read-only and Register*
// / Remove* throw std::logic_error; entry pointers stay valid from then on.
// ---------------------------------------------------------------------------
class Registry {
public:
    void RegisterTool(ToolDefinition definition, ToolHandler handler);
    void RegisterResource(ResourceDefinition definition, ResourceHandler handler);
    void RegisterPrompt(PromptDefinition definition, PromptHandler handler);

    [[nodiscard]] std::vector<ToolDefinition> ListTools() const;
    [[nodiscard]] std::vector<ResourceDefinition> ListResources() const;
    [[nodiscard]] std::vector<PromptDefinition> ListPrompts() const;

    // nullptr when absent.
    [[nodiscard]] const ToolEntry* FindTool(const std::string& name) const;
    [[nodiscard]] const ResourceEntry* FindResource(const std::string& uri) const;
    [[nodiscard]] const PromptEntry* FindPrompt(const std::string& name) const;

    // Administrative removal; not reachable from the protocol.
    bool RemoveTool(const std::string& name);
    bool RemoveResource(const std::string& uri);
    bool RemovePrompt(const std::string& name);

    [[nodiscard]] std::size_t ToolCount() const noexcept { return tools_.Size(); }
    [[nodiscard]] std::size_t ResourceCount() const noexcept { return resources_.Size(); }
    [[nodiscard]] std::size_t PromptCount() const noexcept { return prompts_.Size(); }

    void Freeze() noexcept { frozen_ = true; }
    [[nodiscard]] bool IsFrozen() const noexcept { return frozen_; }

private:
    template <typename Entry>
    class Table {
    public:
        void Upsert(const std::string& key, Entry entry) {
            auto it = index_.find(key);
            if (it != index_.end()) {
                entries_[it->second] = std::move(entry);
                return;
            }
            index_[key] = entries_.size();
            entries_.push_back(std::move(entry));
        }

        const Entry* Find(const std::string& key) const {
            auto it = index_.find(key);
            return it == index_.end() ? nullptr : &entries_[it->second];
        }

        bool Erase(const std::string& key) {
            auto it = index_.find(key);
            if (it == index_.end()) return false;
            const auto pos = it->second;
            entries_.erase(entries_.begin() + static_cast<std::ptrdiff_t>(pos));
            index_.erase(it);
            for (auto& [name, idx] : index_) {
                if (idx > pos) --idx;
            }
            return true;
        }

        const std::vector<Entry>& Entries() const noexcept { return entries_; }
        std::size_t Size() const noexcept { return entries_.size(); }

    private:
        std::vector<Entry> entries_;
        std::map<std::string, std::size_t> index_;
    };

    void RequireMutable(const char* operation) const;

    Table<ToolEntry> tools_;
    Table<ResourceEntry> resources_;
    Table<PromptEntry> prompts_;
    bool frozen_ = false;
};

} // namespace mcp_base
