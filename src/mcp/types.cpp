#include <mcp_base/mcp/types.hpp>

namespace mcp_base {

PromptMessage PromptMessage::Text(Role role, const std::string& text) {
    return PromptMessage{role, {{"type", "text"}, {"text", text}}};
}

const char* RoleName(Role role) noexcept {
    switch (role) {
        case Role::User:      return "user";
        case Role::Assistant: return "assistant";
    }
    return "user";
}

nlohmann::json ToJson(const ToolDefinition& tool) {
    return {
        {"name", tool.name},
        {"description", tool.description},
        {"inputSchema", tool.input_schema}
    };
}

nlohmann::json ToJson(const ResourceDefinition& resource) {
    nlohmann::json j = {
        {"uri", resource.uri},
        {"name", resource.name}
    };
    if (resource.description) {
        j["description"] = *resource.description;
    }
    if (resource.mime_type) {
        j["mimeType"] = *resource.mime_type;
    }
    return j;
}

nlohmann::json ToJson(const PromptDefinition& prompt) {
    nlohmann::json j = {{"name", prompt.name}};
    if (prompt.description) {
        j["description"] = *prompt.description;
    }
    if (!prompt.arguments.empty()) {
        auto args = nlohmann::json::array();
        for (const auto& arg : prompt.arguments) {
            nlohmann::json a = {{"name", arg.name}, {"required", arg.required}};
            if (arg.description) {
                a["description"] = *arg.description;
            }
            args.push_back(std::move(a));
        }
        j["arguments"] = std::move(args);
    }
    return j;
}

nlohmann::json ToJson(const ResourceContents& contents) {
    nlohmann::json j = {{"uri", contents.uri}};
    if (contents.mime_type) {
        j["mimeType"] = *contents.mime_type;
    }
    if (contents.text) {
        j["text"] = *contents.text;
    }
    if (contents.blob) {
        j["blob"] = *contents.blob;
    }
    return j;
}

nlohmann::json ToJson(const PromptMessage& message) {
    return {
        {"role", RoleName(message.role)},
        {"content", message.content}
    };
}

} // namespace mcp_base
