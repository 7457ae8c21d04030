#pragma once

#include <mcp_base/mcp/message.hpp>

#include <mutex>
#include <ostream>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_base {

// ---------------------------------------------------------------------------
// ITransport: the outbound half of the channel.
// ---------------------------------------------------------------------------
class ITransport {
public:
    virtual ~ITransport() = default;

    // Throws std::logic_error once the transport is closed.
    virtual void Send(const Response& response) = 0;

    // Idempotent.
    virtual void Close() = 0;

    [[nodiscard]] virtual bool IsConnected() const = 0;
};

// ---------------------------------------------------------------------------
// StdioTransport: newline-delimited JSON on an output stream (stdout in
// production). Send is serialized by a mutex so that responses completed on
// different threads never interleave within a line.
// ---------------------------------------------------------------------------
class StdioTransport : public ITransport {
public:
    explicit StdioTransport(std::ostream& out);

    void Send(const Response& response) override;
    void Close() override;
    [[nodiscard]] bool IsConnected() const override;

private:
    std::ostream& out_;
    mutable std::mutex mutex_;
    bool closed_ = false;
};

// One-line encoding of a message: control characters escaped, invalid UTF-8
// replaced by U+FFFD instead of throwing.
[[nodiscard]] std::string SerializeLine(const nlohmann::json& message);

} // namespace mcp_base
