#pragma once

#include <mcp_base/core/result.hpp>
#include <mcp_base/mcp/capabilities.hpp>
#include <mcp_base/mcp/dispatcher.hpp>
#include <mcp_base/mcp/registry.hpp>
#include <mcp_base/mcp/transport.hpp>
#include <mcp_base/validation/schema_validator.hpp>

#include <chrono>
#include <functional>
#include <iostream>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_base {

struct ServerOptions {
    ServerInfo info;
    CapabilityOptions capabilities;
    // How long Start() waits for in-flight requests after EOF before closing
    // the transport.
    std::chrono::milliseconds drain_timeout{5000};
};

// Populates the registry (and compiles any schemas the handlers use) before
// the server starts reading. Exceptions abort Start().
using SetupFn = std::function<void(Registry& registry, SchemaValidator& validator)>;

// ---------------------------------------------------------------------------
// McpServer: MCP server over newline-delimited JSON on stdin/stdout.
//
// Composition of Registry + Dispatcher + StdioTransport. Each request line is
// dispatched on its own worker thread so a slow handler never blocks the read
// loop; responses may therefore leave in a different order than requests
// arrived. Notifications are handled inline and never answered.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(ServerOptions options,
              SetupFn setup,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);
    ~McpServer();

    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // Run setup, freeze the registry, then serve until EOF or Stop().
    // Returns an error only when setup fails (nothing is read in that case).
    Result<void, Error> Start();

    // Close the transport and make the read loop exit. Idempotent; in-flight
    // handlers are not interrupted, their responses are dropped.
    void Stop();

    [[nodiscard]] bool IsRunning() const noexcept;

    // Handle one raw input line. Exposed for tests and for embedding the
    // server behind a different reader.
    void ProcessLine(const std::string& line);

    // Block until no request is in flight; false on timeout.
    bool WaitForIdle(std::chrono::milliseconds timeout);

    // Name, version, transport and current capabilities.
    [[nodiscard]] nlohmann::json Describe() const;

    [[nodiscard]] const Registry& GetRegistry() const noexcept;
    [[nodiscard]] const Dispatcher& GetDispatcher() const noexcept;
    [[nodiscard]] const ITransport& GetTransport() const noexcept;

private:
    struct State;

    void Dispatch(Request request);

    SetupFn setup_;
    std::istream& in_;
    std::chrono::milliseconds drain_timeout_;
    std::shared_ptr<State> state_;
};

} // namespace mcp_base
