#pragma once

#include <exception>
#include <string>

#include <nlohmann/json.hpp>

namespace mcp_base {

// ---------------------------------------------------------------------------
// ErrorCode: JSON-RPC 2.0 codes plus the MCP domain range. Values are part of
// the wire contract.
// ---------------------------------------------------------------------------
enum class ErrorCode : int {
    ParseError          = -32700,
    InvalidRequest      = -32600,
    MethodNotFound      = -32601,
    InvalidParams       = -32602,
    InternalError       = -32603,

    ResourceNotFound    = -32001,
    ResourceUnavailable = -32002,
    ToolExecutionError  = -32003,
    PromptNotFound      = -32004,
};

// Malformed input or dispatcher-internal failure.
[[nodiscard]] bool IsProtocolError(ErrorCode code) noexcept;

// Well-formed request that could not be satisfied by registered handlers.
[[nodiscard]] bool IsDomainError(ErrorCode code) noexcept;

[[nodiscard]] const char* ErrorCodeName(ErrorCode code) noexcept;

// ---------------------------------------------------------------------------
// RpcError: the `error` member of a response.
// ---------------------------------------------------------------------------
struct RpcError {
    ErrorCode code = ErrorCode::InternalError;
    std::string message;
    nlohmann::json data;  // null when absent

    [[nodiscard]] nlohmann::json ToJson() const;

    bool operator==(const RpcError& other) const {
        return code == other.code && message == other.message &&
               data == other.data;
    }
};

// Factories, one per code. Messages and data members are fixed so that clients
// can match on them.
RpcError ParseError(const std::string& detail);
RpcError InvalidRequest(const std::string& detail);
RpcError MethodNotFound(const std::string& method);
RpcError InvalidParams(const std::string& detail);
RpcError InternalError(const std::string& message,
                       nlohmann::json data = nullptr);
RpcError ResourceNotFound(const std::string& uri);
RpcError ResourceUnavailable(const std::string& uri, const std::string& reason);
RpcError ToolExecutionError(const std::string& tool, const std::string& reason);
RpcError PromptNotFound(const std::string& name);

// INTERNAL_ERROR carrying the exception's type name, message and the call
// stack at the point of conversion in `data`.
RpcError FromException(const std::exception& e);

// ---------------------------------------------------------------------------
// RpcException: thrown by a handler that wants a specific structured error
// returned to the client. The dispatcher passes it through unchanged.
// ---------------------------------------------------------------------------
class RpcException : public std::exception {
public:
    explicit RpcException(RpcError error) : error_(std::move(error)) {}

    [[nodiscard]] const RpcError& Error() const noexcept { return error_; }
    const char* what() const noexcept override { return error_.message.c_str(); }

private:
    RpcError error_;
};

} // namespace mcp_base
