#include <mcp_base/mcp/message.hpp>

#include <array>
#include <string>
#include <utility>

namespace mcp_base {

namespace {

struct MethodEntry {
    std::string_view name;
    Method method;
};

constexpr std::array<MethodEntry, 7> kMethodTable = {{
    {"initialize",     Method::Initialize},
    {"tools/list",     Method::ToolsList},
    {"tools/call",     Method::ToolsCall},
    {"resources/list", Method::ResourcesList},
    {"resources/read", Method::ResourcesRead},
    {"prompts/list",   Method::PromptsList},
    {"prompts/get",    Method::PromptsGet},
}};

// The id to echo in an error for a message that failed validation. Only a
// usable id is echoed; anything else becomes null.
nlohmann::json EchoableId(const nlohmann::json& message) {
    auto it = message.find("id");
    if (it != message.end() && IsValidId(*it)) {
        return *it;
    }
    return nullptr;
}

// Deepest bracket nesting in a JSON text, ignoring brackets inside strings.
// Stops counting once `limit` is exceeded.
std::size_t NestingDepth(std::string_view text, std::size_t limit) {
    std::size_t depth = 0;
    std::size_t deepest = 0;
    bool in_string = false;
    bool escaped = false;
    for (char c : text) {
        if (in_string) {
            if (escaped) {
                escaped = false;
            } else if (c == '\\') {
                escaped = true;
            } else if (c == '"') {
                in_string = false;
            }
            continue;
        }
        switch (c) {
            case '"':
                in_string = true;
                break;
            case '[':
            case '{':
                if (++depth > deepest) {
                    deepest = depth;
                    if (deepest > limit) return deepest;
                }
                break;
            case ']':
            case '}':
                if (depth > 0) --depth;
                break;
            default:
                break;
        }
    }
    return deepest;
}

Result<Request, Response> Reject(nlohmann::json id, RpcError error) {
    return Result<Request, Response>::Err(
        Response::Failure(std::move(id), std::move(error)));
}

} // anonymous namespace

std::optional<Method> ParseMethod(std::string_view name) {
    for (const auto& entry : kMethodTable) {
        if (entry.name == name) {
            return entry.method;
        }
    }
    return std::nullopt;
}

const char* MethodName(Method method) noexcept {
    for (const auto& entry : kMethodTable) {
        if (entry.method == method) {
            return entry.name.data();
        }
    }
    return "";
}

bool IsValidId(const nlohmann::json& id) noexcept {
    return id.is_string() || id.is_number_integer();
}

// ---------------------------------------------------------------------------
// Response
// ---------------------------------------------------------------------------
Response Response::Success(nlohmann::json id, nlohmann::json result) {
    return Response(std::move(id), std::move(result));
}

Response Response::Failure(nlohmann::json id, RpcError error) {
    return Response(std::move(id), std::move(error));
}

const nlohmann::json& Response::ResultValue() const {
    return std::get<nlohmann::json>(payload_);
}

const RpcError& Response::ErrorValue() const {
    return std::get<RpcError>(payload_);
}

nlohmann::json Response::ToJson() const {
    nlohmann::json j = {
        {"jsonrpc", kJsonRpcVersion},
        {"id", id_}
    };
    if (IsError()) {
        j["error"] = ErrorValue().ToJson();
    } else {
        j["result"] = ResultValue();
    }
    return j;
}

// ---------------------------------------------------------------------------
// ParseRequest
// ---------------------------------------------------------------------------
Result<Request, Response> ParseRequest(std::string_view line) {
    if (NestingDepth(line, kMaxNestingDepth) > kMaxNestingDepth) {
        return Reject(nullptr, ParseError("nesting deeper than " +
                                          std::to_string(kMaxNestingDepth) + " levels"));
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Reject(nullptr, ParseError(e.what()));
    }

    if (!message.is_object()) {
        return Reject(nullptr, ParseError("message is not a JSON object"));
    }

    auto version = message.find("jsonrpc");
    if (version == message.end() || !version->is_string() ||
        version->get<std::string>() != kJsonRpcVersion) {
        return Reject(EchoableId(message),
                      ParseError("missing or unsupported 'jsonrpc' version"));
    }

    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        return Reject(EchoableId(message),
                      ParseError("missing or non-string 'method'"));
    }

    Request request;
    request.method = method->get<std::string>();

    auto id = message.find("id");
    if (id != message.end() && !id->is_null()) {
        if (!IsValidId(*id)) {
            return Reject(nullptr,
                          InvalidRequest("'id' must be a string or an integer"));
        }
        request.id = std::move(*id);
    }

    auto params = message.find("params");
    if (params != message.end() && !params->is_null()) {
        if (!params->is_object() && !params->is_array()) {
            return Reject(request.id,
                          InvalidRequest("'params' must be an object or an array"));
        }
        request.params = std::move(*params);
    }

    return Result<Request, Response>::Ok(std::move(request));
}

} // namespace mcp_base
