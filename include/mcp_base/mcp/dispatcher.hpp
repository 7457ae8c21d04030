#pragma once

#include <mcp_base/mcp/capabilities.hpp>
#include <mcp_base/mcp/message.hpp>
#include <mcp_base/mcp/registry.hpp>
#include <mcp_base/mcp/types.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_base {

// Identity announced in the initialize handshake.
struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;  // used when the client names none
    std::optional<std::string> instructions;
};

// What the client told us during the handshake.
struct SessionInfo {
    bool initialize_received = false;
    bool initialized = false;  // notifications/initialized seen
    std::string protocol_version;
    std::optional<ClientInfo> client;
    nlohmann::json client_capabilities = nlohmann::json::object();
};

// ---------------------------------------------------------------------------
// Dispatcher: routes a well-formed request to the registry or to the
// handshake and turns every outcome into a response carrying the request id.
//
// HandleRequest is safe to call from several threads at once: the registry is
// only read, and the session record has its own lock.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(std::shared_ptr<const Registry> registry,
               ServerInfo info,
               CapabilityOptions capability_options = {});

    // Never throws; handler failures become error responses.
    [[nodiscard]] Response HandleRequest(const Request& request) noexcept;

    // Notifications never produce a response.
    void HandleNotification(const Request& notification) noexcept;

    [[nodiscard]] ServerCapabilities Capabilities() const;
    [[nodiscard]] SessionInfo Session() const;
    [[nodiscard]] const ServerInfo& Info() const noexcept { return info_; }

private:
    nlohmann::json Route(Method method, const nlohmann::json& params);

    nlohmann::json HandleInitialize(const nlohmann::json& params);
    nlohmann::json HandleToolsList() const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params) const;
    nlohmann::json HandleResourcesList() const;
    nlohmann::json HandleResourcesRead(const nlohmann::json& params) const;
    nlohmann::json HandlePromptsList() const;
    nlohmann::json HandlePromptsGet(const nlohmann::json& params) const;

    std::shared_ptr<const Registry> registry_;
    ServerInfo info_;
    CapabilityOptions capability_options_;

    mutable std::mutex session_mutex_;
    SessionInfo session_;
};

} // namespace mcp_base
