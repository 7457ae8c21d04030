#include <mcp_base/mcp/transport.hpp>

#include <mcp_base/core/log.hpp>

#include <stdexcept>

namespace mcp_base {

namespace {
constexpr const char* kComponent = "transport";
} // anonymous namespace

std::string SerializeLine(const nlohmann::json& message) {
    return message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

StdioTransport::StdioTransport(std::ostream& out) : out_(out) {}

void StdioTransport::Send(const Response& response) {
    auto line = SerializeLine(response.ToJson());

    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        throw std::logic_error("Transport not connected");
    }
    LogDebug(kComponent, "Sending message", {{"bytes", std::to_string(line.size())}});
    out_ << line << '\n';
    out_.flush();
}

void StdioTransport::Close() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_) {
        return;
    }
    closed_ = true;
    out_.flush();
    LogInfo(kComponent, "Stdio transport closed");
}

bool StdioTransport::IsConnected() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return !closed_;
}

} // namespace mcp_base
