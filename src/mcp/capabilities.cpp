#include <mcp_base/mcp/capabilities.hpp>

namespace mcp_base {

ServerCapabilities ComputeCapabilities(const Registry& registry,
                                       const CapabilityOptions& options) {
    ServerCapabilities caps;
    caps.tools = registry.ToolCount() > 0;
    caps.resources = registry.ResourceCount() > 0;
    caps.prompts = registry.PromptCount() > 0;
    caps.flags = options;
    return caps;
}

nlohmann::json ToJson(const ServerCapabilities& capabilities) {
    auto j = nlohmann::json::object();
    const auto& flags = capabilities.flags;

    if (capabilities.tools) {
        auto tools = nlohmann::json::object();
        if (flags.tools_list_changed) tools["listChanged"] = true;
        j["tools"] = std::move(tools);
    }
    if (capabilities.resources) {
        auto resources = nlohmann::json::object();
        if (flags.resources_subscribe) resources["subscribe"] = true;
        if (flags.resources_list_changed) resources["listChanged"] = true;
        j["resources"] = std::move(resources);
    }
    if (capabilities.prompts) {
        auto prompts = nlohmann::json::object();
        if (flags.prompts_list_changed) prompts["listChanged"] = true;
        j["prompts"] = std::move(prompts);
    }
    if (flags.logging) {
        j["logging"] = nlohmann::json::object();
    }
    return j;
}

} // namespace mcp_base
