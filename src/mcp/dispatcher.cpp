#include <mcp_base/mcp/dispatcher.hpp>

#include <mcp_base/core/log.hpp>

#include <string>
#include <utility>

namespace mcp_base {

namespace {

constexpr const char* kComponent = "dispatcher";

// Caller-built values may hold strings that are not valid UTF-8; a plain dump
// would throw on them.
std::string ForLog(const nlohmann::json& value) {
    return value.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

// -- Param decoding ---------------------------------------------------------
// Each helper throws RpcException(INVALID_PARAMS) on a shape mismatch.

const nlohmann::json& RequireObject(const nlohmann::json& params,
                                    const char* method) {
    static const nlohmann::json kEmpty = nlohmann::json::object();
    if (params.is_null()) {
        return kEmpty;
    }
    if (!params.is_object()) {
        throw RpcException(InvalidParams(std::string(method) +
                                         " expects an object"));
    }
    return params;
}

std::string RequireString(const nlohmann::json& params, const char* key) {
    auto it = params.find(key);
    if (it == params.end() || !it->is_string()) {
        throw RpcException(InvalidParams(std::string("missing or non-string '") +
                                         key + "'"));
    }
    return it->get<std::string>();
}

nlohmann::json OptionalArguments(const nlohmann::json& params) {
    auto it = params.find("arguments");
    if (it == params.end() || it->is_null()) {
        return nlohmann::json::object();
    }
    if (!it->is_object()) {
        throw RpcException(InvalidParams("'arguments' must be an object"));
    }
    return *it;
}

InitializeParams DecodeInitialize(const nlohmann::json& raw) {
    const auto& params = RequireObject(raw, "initialize");
    InitializeParams out;

    if (auto it = params.find("protocolVersion"); it != params.end()) {
        if (!it->is_string()) {
            throw RpcException(InvalidParams("'protocolVersion' must be a string"));
        }
        out.protocol_version = it->get<std::string>();
    }
    if (auto it = params.find("clientInfo"); it != params.end() && it->is_object()) {
        out.client_info = ClientInfo{it->value("name", ""), it->value("version", "")};
    }
    if (auto it = params.find("capabilities"); it != params.end() && it->is_object()) {
        out.capabilities = *it;
    }
    return out;
}

ToolCallParams DecodeToolCall(const nlohmann::json& raw) {
    const auto& params = RequireObject(raw, "tools/call");
    return ToolCallParams{RequireString(params, "name"), OptionalArguments(params)};
}

ResourceReadParams DecodeResourceRead(const nlohmann::json& raw) {
    const auto& params = RequireObject(raw, "resources/read");
    return ResourceReadParams{RequireString(params, "uri")};
}

PromptGetParams DecodePromptGet(const nlohmann::json& raw) {
    const auto& params = RequireObject(raw, "prompts/get");
    return PromptGetParams{RequireString(params, "name"), OptionalArguments(params)};
}

template <typename Definition>
nlohmann::json ListOf(const std::vector<Definition>& definitions) {
    auto out = nlohmann::json::array();
    for (const auto& definition : definitions) {
        out.push_back(ToJson(definition));
    }
    return out;
}

} // anonymous namespace

Dispatcher::Dispatcher(std::shared_ptr<const Registry> registry,
                       ServerInfo info,
                       CapabilityOptions capability_options)
    : registry_(std::move(registry)),
      info_(std::move(info)),
      capability_options_(capability_options) {}

ServerCapabilities Dispatcher::Capabilities() const {
    return ComputeCapabilities(*registry_, capability_options_);
}

SessionInfo Dispatcher::Session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

// ---------------------------------------------------------------------------
// HandleRequest
// ---------------------------------------------------------------------------
Response Dispatcher::HandleRequest(const Request& request) noexcept {
    const auto id_text = ForLog(request.id);
    LogInfo(kComponent, "Handling request",
            {{"method", request.method}, {"id", id_text}});

    try {
        auto method = ParseMethod(request.method);
        if (!method) {
            LogWarn(kComponent, "Unknown method", {{"method", request.method}});
            return Response::Failure(request.id, MethodNotFound(request.method));
        }
        return Response::Success(request.id, Route(*method, request.params));
    } catch (const RpcException& e) {
        const auto& error = e.Error();
        LogWarn(kComponent, "Request failed",
                {{"method", request.method},
                 {"id", id_text},
                 {"code", ErrorCodeName(error.code)},
                 {"error", error.message}});
        return Response::Failure(request.id, error);
    } catch (const std::exception& e) {
        LogError(kComponent, "Request failed with unexpected exception",
                 {{"method", request.method}, {"id", id_text}, {"error", e.what()}});
        return Response::Failure(request.id, FromException(e));
    } catch (...) {
        LogError(kComponent, "Request failed with non-standard exception",
                 {{"method", request.method}, {"id", id_text}});
        return Response::Failure(
            request.id,
            InternalError("Unknown error", {{"name", "unknown"},
                                            {"message", "non-standard exception"}}));
    }
}

nlohmann::json Dispatcher::Route(Method method, const nlohmann::json& params) {
    switch (method) {
        case Method::Initialize:    return HandleInitialize(params);
        case Method::ToolsList:     return HandleToolsList();
        case Method::ToolsCall:     return HandleToolsCall(params);
        case Method::ResourcesList: return HandleResourcesList();
        case Method::ResourcesRead: return HandleResourcesRead(params);
        case Method::PromptsList:   return HandlePromptsList();
        case Method::PromptsGet:    return HandlePromptsGet(params);
    }
    throw RpcException(InternalError("unroutable method"));
}

// ---------------------------------------------------------------------------
// HandleNotification
// ---------------------------------------------------------------------------
void Dispatcher::HandleNotification(const Request& notification) noexcept {
    if (notification.method == "notifications/initialized") {
        {
            std::lock_guard<std::mutex> lock(session_mutex_);
            session_.initialized = true;
        }
        LogInfo(kComponent, "Client initialized");
        return;
    }
    LogDebug(kComponent, "Ignoring notification",
             {{"method", notification.method}});
}

// ---------------------------------------------------------------------------
// initialize
// ---------------------------------------------------------------------------
nlohmann::json Dispatcher::HandleInitialize(const nlohmann::json& raw) {
    auto params = DecodeInitialize(raw);

    // No version negotiation: the client's revision is echoed back.
    const auto protocol_version = params.protocol_version.value_or(info_.protocol_version);

    {
        std::lock_guard<std::mutex> lock(session_mutex_);
        session_.initialize_received = true;
        session_.protocol_version = protocol_version;
        session_.client = params.client_info;
        session_.client_capabilities = params.capabilities;
    }

    LogInfo(kComponent, "Initializing",
            {{"client", params.client_info ? params.client_info->name : "unknown"},
             {"protocolVersion", protocol_version}});

    nlohmann::json result = {
        {"protocolVersion", protocol_version},
        {"capabilities", ToJson(Capabilities())},
        {"serverInfo", {
            {"name", info_.name},
            {"version", info_.version}
        }}
    };
    if (info_.instructions) {
        result["instructions"] = *info_.instructions;
    }
    return result;
}

// ---------------------------------------------------------------------------
// tools
// ---------------------------------------------------------------------------
nlohmann::json Dispatcher::HandleToolsList() const {
    return {{"tools", ListOf(registry_->ListTools())}};
}

nlohmann::json Dispatcher::HandleToolsCall(const nlohmann::json& raw) const {
    auto call = DecodeToolCall(raw);

    const auto* tool = registry_->FindTool(call.name);
    if (tool == nullptr) {
        throw RpcException(ToolExecutionError(call.name, "Tool not found"));
    }

    LogDebug(kComponent, "Executing tool",
             {{"tool", call.name}, {"arguments", ForLog(call.arguments)}});

    try {
        return tool->handler(call.arguments);
    } catch (const RpcException&) {
        throw;
    } catch (const std::exception& e) {
        throw RpcException(ToolExecutionError(call.name, e.what()));
    } catch (...) {
        throw RpcException(ToolExecutionError(call.name, "unknown error"));
    }
}

// ---------------------------------------------------------------------------
// resources
// ---------------------------------------------------------------------------
nlohmann::json Dispatcher::HandleResourcesList() const {
    return {{"resources", ListOf(registry_->ListResources())}};
}

nlohmann::json Dispatcher::HandleResourcesRead(const nlohmann::json& raw) const {
    auto read = DecodeResourceRead(raw);

    const auto* resource = registry_->FindResource(read.uri);
    if (resource == nullptr) {
        throw RpcException(ResourceNotFound(read.uri));
    }

    LogDebug(kComponent, "Reading resource", {{"uri", read.uri}});

    ResourceContents contents;
    try {
        contents = resource->handler(read.uri);
    } catch (const RpcException&) {
        throw;
    } catch (const std::exception& e) {
        throw RpcException(ResourceUnavailable(read.uri, e.what()));
    } catch (...) {
        throw RpcException(ResourceUnavailable(read.uri, "unknown error"));
    }

    if (contents.uri.empty()) {
        contents.uri = read.uri;
    }
    return {{"contents", nlohmann::json::array({ToJson(contents)})}};
}

// ---------------------------------------------------------------------------
// prompts
// ---------------------------------------------------------------------------
nlohmann::json Dispatcher::HandlePromptsList() const {
    return {{"prompts", ListOf(registry_->ListPrompts())}};
}

nlohmann::json Dispatcher::HandlePromptsGet(const nlohmann::json& raw) const {
    auto get = DecodePromptGet(raw);

    const auto* prompt = registry_->FindPrompt(get.name);
    if (prompt == nullptr) {
        throw RpcException(PromptNotFound(get.name));
    }

    LogDebug(kComponent, "Getting prompt",
             {{"prompt", get.name}, {"arguments", ForLog(get.arguments)}});

    std::vector<PromptMessage> messages;
    try {
        messages = prompt->handler(get.arguments);
    } catch (const RpcException&) {
        throw;
    } catch (const std::exception& e) {
        throw RpcException(InternalError(
            std::string("Prompt execution failed: ") + e.what(),
            {{"prompt", get.name}}));
    } catch (...) {
        throw RpcException(InternalError("Prompt execution failed: unknown error",
                                         {{"prompt", get.name}}));
    }

    auto encoded = nlohmann::json::array();
    for (const auto& message : messages) {
        encoded.push_back(ToJson(message));
    }

    nlohmann::json result = {{"messages", std::move(encoded)}};
    if (prompt->definition.description) {
        result["description"] = *prompt->definition.description;
    }
    return result;
}

} // namespace mcp_base
