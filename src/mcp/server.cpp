#include <mcp_base/mcp/server.hpp>

#include <mcp_base/core/log.hpp>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <system_error>
#include <thread>
#include <utility>

namespace mcp_base {

namespace {

constexpr const char* kComponent = "server";

bool IsBlank(const std::string& line) {
    return std::all_of(line.begin(), line.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

} // anonymous namespace

// Everything a worker thread touches. Workers hold a shared_ptr so a dispatch
// that outlives the server object still finds valid state.
struct McpServer::State {
    std::shared_ptr<Registry> registry;
    std::shared_ptr<SchemaValidator> validator;
    std::shared_ptr<Dispatcher> dispatcher;
    std::shared_ptr<ITransport> transport;

    std::mutex mutex;
    std::condition_variable idle;
    std::size_t in_flight = 0;

    std::atomic<bool> started{false};
    std::atomic<bool> stopped{false};

    void Deliver(const Response& response) {
        try {
            transport->Send(response);
        } catch (const std::logic_error& e) {
            LogWarn(kComponent, "Dropping response",
                    {{"id", SerializeLine(response.Id())}, {"reason", e.what()}});
        }
    }

    void Finish() {
        std::lock_guard<std::mutex> lock(mutex);
        --in_flight;
        if (in_flight == 0) {
            idle.notify_all();
        }
    }
};

McpServer::McpServer(ServerOptions options,
                     SetupFn setup,
                     std::istream& in,
                     std::ostream& out)
    : setup_(std::move(setup)),
      in_(in),
      drain_timeout_(options.drain_timeout),
      state_(std::make_shared<State>()) {
    state_->registry = std::make_shared<Registry>();
    state_->validator = std::make_shared<SchemaValidator>();
    state_->dispatcher = std::make_shared<Dispatcher>(
        state_->registry, std::move(options.info), options.capabilities);
    state_->transport = std::make_shared<StdioTransport>(out);
}

McpServer::~McpServer() {
    Stop();
}

Result<void, Error> McpServer::Start() {
    const auto& info = state_->dispatcher->Info();
    if (state_->started.exchange(true)) {
        return Result<void, Error>::Err(
            Error{"Start", "server already started", ErrorCategory::Startup});
    }

    LogInfo(kComponent, "Starting MCP server",
            {{"name", info.name}, {"version", info.version}, {"transport", "stdio"}});

    try {
        if (setup_) {
            setup_(*state_->registry, *state_->validator);
        }
    } catch (const std::exception& e) {
        LogError(kComponent, "Failed to start server", {{"error", e.what()}});
        Stop();
        return Result<void, Error>::Err(
            Error{"Setup", e.what(), ErrorCategory::Startup});
    }
    state_->registry->Freeze();

    LogInfo(kComponent, "Listening on stdio",
            {{"tools", std::to_string(state_->registry->ToolCount())},
             {"resources", std::to_string(state_->registry->ResourceCount())},
             {"prompts", std::to_string(state_->registry->PromptCount())}});

    std::string line;
    while (!state_->stopped && std::getline(in_, line)) {
        ProcessLine(line);
    }

    LogInfo(kComponent, "Stdio closed");
    if (!WaitForIdle(drain_timeout_)) {
        LogWarn(kComponent, "Requests still in flight at shutdown",
                {{"drain_timeout_ms", std::to_string(drain_timeout_.count())}});
    }
    Stop();
    return Result<void, Error>::Ok();
}

void McpServer::Stop() {
    if (state_->stopped.exchange(true)) {
        return;
    }
    LogInfo(kComponent, "Stopping MCP server");
    state_->transport->Close();
}

bool McpServer::IsRunning() const noexcept {
    return state_->started && !state_->stopped;
}

void McpServer::ProcessLine(const std::string& line) {
    if (IsBlank(line)) {
        return;
    }

    auto parsed = ParseRequest(line);
    if (parsed.IsErr()) {
        const auto& rejection = parsed.Error();
        LogWarn(kComponent, "Rejected malformed message",
                {{"code", ErrorCodeName(rejection.ErrorValue().code)},
                 {"error", rejection.ErrorValue().message}});
        state_->Deliver(rejection);
        return;
    }

    auto request = std::move(parsed).Value();
    if (request.IsNotification()) {
        state_->dispatcher->HandleNotification(request);
        return;
    }
    Dispatch(std::move(request));
}

void McpServer::Dispatch(Request request) {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        ++state_->in_flight;
    }

    auto state = state_;
    auto shared = std::make_shared<const Request>(std::move(request));
    auto work = [state, shared] {
        auto response = state->dispatcher->HandleRequest(*shared);
        state->Deliver(response);
        state->Finish();
    };

    try {
        std::thread(work).detach();
    } catch (const std::system_error& e) {
        LogWarn(kComponent, "Worker thread unavailable, dispatching inline",
                {{"error", e.what()}});
        work();
    }
}

bool McpServer::WaitForIdle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->idle.wait_for(lock, timeout,
                                 [this] { return state_->in_flight == 0; });
}

nlohmann::json McpServer::Describe() const {
    const auto& info = state_->dispatcher->Info();
    return {
        {"name", info.name},
        {"version", info.version},
        {"transport", "stdio"},
        {"capabilities", ToJson(state_->dispatcher->Capabilities())}
    };
}

const Registry& McpServer::GetRegistry() const noexcept {
    return *state_->registry;
}

const Dispatcher& McpServer::GetDispatcher() const noexcept {
    return *state_->dispatcher;
}

const ITransport& McpServer::GetTransport() const noexcept {
    return *state_->transport;
}

} // namespace mcp_base
