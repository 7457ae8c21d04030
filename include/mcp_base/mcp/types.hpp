#pragma once

#include <functional>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace mcp_base {

// ---------------------------------------------------------------------------
// Declarative definitions, as listed by tools/list, resources/list and
// prompts/list.
// ---------------------------------------------------------------------------
struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema = nlohmann::json::object();  // JSON Schema
};

struct ResourceDefinition {
    std::string uri;
    std::string name;
    std::optional<std::string> description;
    std::optional<std::string> mime_type;
};

struct PromptArgument {
    std::string name;
    std::optional<std::string> description;
    bool required = false;
};

struct PromptDefinition {
    std::string name;
    std::optional<std::string> description;
    std::vector<PromptArgument> arguments;
};

// ---------------------------------------------------------------------------
// Handler results.
// ---------------------------------------------------------------------------

// One entry of a resources/read result. Exactly one of text / blob is
// normally set; blob is base64 encoded.
struct ResourceContents {
    std::string uri;
    std::optional<std::string> mime_type;
    std::optional<std::string> text;
    std::optional<std::string> blob;
};

enum class Role {
    User,
    Assistant,
};

struct PromptMessage {
    Role role = Role::User;
    nlohmann::json content;  // {"type": "text", "text": "..."} etc.

    static PromptMessage Text(Role role, const std::string& text);
};

// Tool handlers receive the call's `arguments` object; their return value is
// sent back as the tools/call result unchanged.
using ToolHandler = std::function<nlohmann::json(const nlohmann::json& arguments)>;
using ResourceHandler = std::function<ResourceContents(const std::string& uri)>;
using PromptHandler =
    std::function<std::vector<PromptMessage>(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// Typed params per route.
// ---------------------------------------------------------------------------
struct ClientInfo {
    std::string name;
    std::string version;
};

struct InitializeParams {
    std::optional<std::string> protocol_version;
    std::optional<ClientInfo> client_info;
    nlohmann::json capabilities = nlohmann::json::object();
};

struct ToolCallParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

struct ResourceReadParams {
    std::string uri;
};

struct PromptGetParams {
    std::string name;
    nlohmann::json arguments = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// Wire encoding (camelCase member names, optional members omitted).
// ---------------------------------------------------------------------------
nlohmann::json ToJson(const ToolDefinition& tool);
nlohmann::json ToJson(const ResourceDefinition& resource);
nlohmann::json ToJson(const PromptDefinition& prompt);
nlohmann::json ToJson(const ResourceContents& contents);
nlohmann::json ToJson(const PromptMessage& message);

const char* RoleName(Role role) noexcept;

} // namespace mcp_base
