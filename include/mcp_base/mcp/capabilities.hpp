#pragma once

#include <mcp_base/mcp/registry.hpp>

#include <nlohmann/json.hpp>

namespace mcp_base {

// Static capability flags from configuration. They are only announced inside
// a category that is present.
struct CapabilityOptions {
    bool tools_list_changed = false;
    bool resources_subscribe = false;
    bool resources_list_changed = false;
    bool prompts_list_changed = false;
    bool logging = false;
};

struct ServerCapabilities {
    bool tools = false;
    bool resources = false;
    bool prompts = false;
    CapabilityOptions flags;
};

// Presence per category is derived from the registry each time; nothing is
// cached.
[[nodiscard]] ServerCapabilities ComputeCapabilities(
    const Registry& registry, const CapabilityOptions& options = {});

nlohmann::json ToJson(const ServerCapabilities& capabilities);

} // namespace mcp_base
