#include <mcp_base/mcp/rpc_error.hpp>

#include <boost/stacktrace.hpp>

#include <cstddef>
#include <typeinfo>
#include <utility>

#if defined(__GNUG__)
#include <cstdlib>
#include <cxxabi.h>
#include <memory>
#endif

namespace mcp_base {

namespace {

constexpr std::size_t kMaxStackFrames = 32;

RpcError Make(ErrorCode code, std::string message,
              nlohmann::json data = nullptr) {
    return RpcError{code, std::move(message), std::move(data)};
}

std::string TypeName(const std::type_info& type) {
#if defined(__GNUG__)
    int status = 0;
    std::unique_ptr<char, void (*)(void*)> demangled(
        abi::__cxa_demangle(type.name(), nullptr, nullptr, &status),
        std::free);
    if (status == 0 && demangled) {
        return demangled.get();
    }
#endif
    return type.name();
}

} // anonymous namespace

bool IsProtocolError(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ParseError:
        case ErrorCode::InvalidRequest:
        case ErrorCode::MethodNotFound:
        case ErrorCode::InvalidParams:
        case ErrorCode::InternalError:
            return true;
        case ErrorCode::ResourceNotFound:
        case ErrorCode::ResourceUnavailable:
        case ErrorCode::ToolExecutionError:
        case ErrorCode::PromptNotFound:
            return false;
    }
    return false;
}

bool IsDomainError(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ResourceNotFound:
        case ErrorCode::ResourceUnavailable:
        case ErrorCode::ToolExecutionError:
        case ErrorCode::PromptNotFound:
            return true;
        default:
            return false;
    }
}

const char* ErrorCodeName(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::ParseError:          return "PARSE_ERROR";
        case ErrorCode::InvalidRequest:      return "INVALID_REQUEST";
        case ErrorCode::MethodNotFound:      return "METHOD_NOT_FOUND";
        case ErrorCode::InvalidParams:       return "INVALID_PARAMS";
        case ErrorCode::InternalError:       return "INTERNAL_ERROR";
        case ErrorCode::ResourceNotFound:    return "RESOURCE_NOT_FOUND";
        case ErrorCode::ResourceUnavailable: return "RESOURCE_UNAVAILABLE";
        case ErrorCode::ToolExecutionError:  return "TOOL_EXECUTION_ERROR";
        case ErrorCode::PromptNotFound:      return "PROMPT_NOT_FOUND";
    }
    return "UNKNOWN";
}

nlohmann::json RpcError::ToJson() const {
    nlohmann::json j = {
        {"code", static_cast<int>(code)},
        {"message", message}
    };
    if (!data.is_null()) {
        j["data"] = data;
    }
    return j;
}

RpcError ParseError(const std::string& detail) {
    return Make(ErrorCode::ParseError, "Parse error: " + detail);
}

RpcError InvalidRequest(const std::string& detail) {
    return Make(ErrorCode::InvalidRequest, "Invalid request: " + detail);
}

RpcError MethodNotFound(const std::string& method) {
    return Make(ErrorCode::MethodNotFound, "Method not found: " + method,
                {{"method", method}});
}

RpcError InvalidParams(const std::string& detail) {
    return Make(ErrorCode::InvalidParams, "Invalid params: " + detail);
}

RpcError InternalError(const std::string& message, nlohmann::json data) {
    return Make(ErrorCode::InternalError, message, std::move(data));
}

RpcError ResourceNotFound(const std::string& uri) {
    return Make(ErrorCode::ResourceNotFound, "Resource not found: " + uri,
                {{"uri", uri}});
}

RpcError ResourceUnavailable(const std::string& uri, const std::string& reason) {
    std::string message = "Resource unavailable: " + uri;
    if (!reason.empty()) {
        message += " (" + reason + ")";
    }
    return Make(ErrorCode::ResourceUnavailable, std::move(message),
                {{"uri", uri}, {"reason", reason}});
}

RpcError ToolExecutionError(const std::string& tool, const std::string& reason) {
    return Make(ErrorCode::ToolExecutionError,
                "Tool execution failed: " + tool + " - " + reason,
                {{"tool", tool}, {"reason", reason}});
}

RpcError PromptNotFound(const std::string& name) {
    return Make(ErrorCode::PromptNotFound, "Prompt not found: " + name,
                {{"name", name}});
}

RpcError FromException(const std::exception& e) {
    // Frames of the catching site; skip this function itself.
    auto stack = nlohmann::json::array();
    for (const auto& frame : boost::stacktrace::stacktrace(1, kMaxStackFrames)) {
        stack.push_back(boost::stacktrace::to_string(frame));
    }
    return InternalError(e.what(), {
        {"name", TypeName(typeid(e))},
        {"message", e.what()},
        {"stack", std::move(stack)}
    });
}

} // namespace mcp_base
