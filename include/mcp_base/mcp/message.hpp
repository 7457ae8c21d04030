#pragma once

#include <mcp_base/core/result.hpp>
#include <mcp_base/mcp/rpc_error.hpp>

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace mcp_base {

constexpr const char* kJsonRpcVersion = "2.0";

// Deepest array/object nesting accepted on a line. Deeper input is rejected
// before it is decoded, since copying or serializing a json value recurses.
constexpr std::size_t kMaxNestingDepth = 512;

// ---------------------------------------------------------------------------
// Method: the fixed routing table. Lookup is exact and case-sensitive.
// ---------------------------------------------------------------------------
enum class Method {
    Initialize,
    ToolsList,
    ToolsCall,
    ResourcesList,
    ResourcesRead,
    PromptsList,
    PromptsGet,
};

[[nodiscard]] std::optional<Method> ParseMethod(std::string_view name);
[[nodiscard]] const char* MethodName(Method method) noexcept;

// ---------------------------------------------------------------------------
// Request: a decoded, well-formed request or notification.
// ---------------------------------------------------------------------------
struct Request {
    nlohmann::json id;      // string or integer; null for notifications
    std::string method;
    nlohmann::json params;  // object, array, or null when absent

    [[nodiscard]] bool IsNotification() const noexcept { return id.is_null(); }
};

// ---------------------------------------------------------------------------
// Response: carries exactly one of a result or an error.
// ---------------------------------------------------------------------------
class Response {
public:
    static Response Success(nlohmann::json id, nlohmann::json result);
    static Response Failure(nlohmann::json id, RpcError error);

    [[nodiscard]] const nlohmann::json& Id() const noexcept { return id_; }
    [[nodiscard]] bool IsError() const noexcept {
        return std::holds_alternative<RpcError>(payload_);
    }
    [[nodiscard]] const nlohmann::json& ResultValue() const;
    [[nodiscard]] const RpcError& ErrorValue() const;

    [[nodiscard]] nlohmann::json ToJson() const;

private:
    Response(nlohmann::json id, std::variant<nlohmann::json, RpcError> payload)
        : id_(std::move(id)), payload_(std::move(payload)) {}

    nlohmann::json id_;
    std::variant<nlohmann::json, RpcError> payload_;
};

// Decode one line into a Request. On failure returns the error Response to
// send back (PARSE_ERROR or INVALID_REQUEST); such input never reaches the
// dispatcher. Lines nested deeper than kMaxNestingDepth are a PARSE_ERROR.
[[nodiscard]] Result<Request, Response> ParseRequest(std::string_view line);

// True for values usable as a correlation id (string or integer).
[[nodiscard]] bool IsValidId(const nlohmann::json& id) noexcept;

} // namespace mcp_base
