#include <mcp_base/config/config_loader.hpp>
#include <mcp_base/core/log.hpp>
#include <mcp_base/core/terminal.hpp>
#include <mcp_base/core/version.hpp>
#include <mcp_base/demo/demo_handlers.hpp>
#include <mcp_base/mcp/server.hpp>

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <string_view>
#include <thread>

namespace {

constexpr int kExitSuccess = 0;

volatile std::sig_atomic_t g_shutdown_requested = 0;

void HandleShutdownSignal(int /*signal*/) {
    g_shutdown_requested = 1;
}

void PrintUsage(std::ostream& out) {
    out << "Usage: mcp-base [options]\n"
        << "\n"
        << "Serve the Model Context Protocol over stdin/stdout.\n"
        << "\n"
        << "Options:\n"
        << "  -c, --config <path>          YAML config file\n"
        << "  --name <name>                Server name (default: mcp-base)\n"
        << "  --server-version <version>   Server version\n"
        << "  --protocol-version <rev>     Protocol revision when the client names none\n"
        << "  --log-level <level>          debug, info, warn or error (default: warn)\n"
        << "  -v, -vv                      Shorthand for --log-level info / debug\n"
        << "  --log-format <format>        text or json (default: text)\n"
        << "  --log-file <path>            Write logs to a file instead of stderr\n"
        << "  --color, --no-color          Force or disable colored logs\n"
        << "  --drain-timeout <ms>         Wait for in-flight requests after EOF\n"
        << "  -h, --help                   Show this help\n"
        << "  --version                    Show version\n";
}

bool HasFlag(int argc, const char* const* argv, std::string_view flag,
             std::string_view alias = {}) {
    for (int i = 1; i < argc; ++i) {
        auto arg = std::string_view{argv[i]};
        if (arg == flag || (!alias.empty() && arg == alias)) {
            return true;
        }
    }
    return false;
}

void PrintError(const mcp_base::Error& error, bool use_color) {
    if (use_color) {
        std::cerr << "\033[31mError:\033[0m " << error.ToString() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

// Build the log sink from the merged configuration. Logs never go to stdout.
mcp_base::Result<std::unique_ptr<mcp_base::ILogSink>, mcp_base::Error> MakeLogSink(
    const mcp_base::LogConfig& log) {
    using namespace mcp_base;
    using SinkResult = Result<std::unique_ptr<ILogSink>, Error>;

    if (log.file) {
        auto stream = std::make_unique<std::ofstream>(*log.file, std::ios::app);
        if (!stream->is_open()) {
            return SinkResult::Err(Error{"LogFile", "Cannot open log file: " + *log.file,
                                         ErrorCategory::Config});
        }
        std::unique_ptr<ILogSink> inner;
        if (log.format == LogFormat::Json) {
            inner = std::make_unique<JsonSink>(*stream);
        } else {
            inner = std::make_unique<ColorConsoleSink>(log.color.value_or(false), *stream);
        }
        return SinkResult::Ok(
            std::make_unique<OwningStreamSink>(std::move(stream), std::move(inner)));
    }

    if (log.format == LogFormat::Json) {
        return SinkResult::Ok(std::make_unique<JsonSink>(std::cerr));
    }

    // NO_COLOR env var (https://no-color.org/) wins over auto-detection but
    // not over an explicit --color.
    bool use_color = log.color.value_or(!NoColorEnvSet() && IsStderrTty());
    return SinkResult::Ok(std::make_unique<ColorConsoleSink>(use_color));
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace mcp_base;

    if (HasFlag(argc, argv, "--version")) {
        std::cout << "mcp-base " << kVersion << "\n";
        return kExitSuccess;
    }
    if (HasFlag(argc, argv, "--help", "-h")) {
        PrintUsage(std::cout);
        return kExitSuccess;
    }

    const bool error_color = !NoColorEnvSet() && IsStderrTty();

    // Step 1: CLI flags.
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintError(cli_result.Error(), error_color);
        return cli_result.Error().ExitCode();
    }
    const auto& cli = cli_result.Value();

    // Step 2: YAML file, if any, underneath the flags.
    ServerConfig base;
    if (cli.config_path) {
        auto yaml_result = LoadFromYaml(*cli.config_path);
        if (yaml_result.IsErr()) {
            PrintError(yaml_result.Error(), error_color);
            return yaml_result.Error().ExitCode();
        }
        base = yaml_result.Value();
    }

    // Step 3: merge and validate.
    auto config = MergeConfigs(base, cli);
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintError(valid.Error(), error_color);
        return valid.Error().ExitCode();
    }

    // Step 4: logging.
    auto sink = MakeLogSink(config.log);
    if (sink.IsErr()) {
        PrintError(sink.Error(), error_color);
        return sink.Error().ExitCode();
    }
    InitGlobalLogger(std::move(sink).Value(), config.log.level);

    // Step 5: serve.
    auto options = MakeServerOptions(config);
    const auto info = options.info;
    const auto drain_timeout = options.drain_timeout;
    McpServer server(std::move(options),
                     [info](Registry& registry, SchemaValidator& validator) {
                         RegisterDemoHandlers(registry, validator, info);
                     });

    std::signal(SIGINT, HandleShutdownSignal);
    std::signal(SIGTERM, HandleShutdownSignal);

    // The read loop blocks in getline and cannot observe the signal flag, so
    // a watcher drains in-flight requests and terminates the process itself.
    std::atomic<bool> finished{false};
    std::thread watcher([&server, &finished, drain_timeout] {
        while (!finished) {
            if (g_shutdown_requested != 0) {
                LogInfo("main", "Shutdown signal received");
                if (!server.WaitForIdle(drain_timeout)) {
                    LogWarn("main", "Requests still in flight at shutdown");
                }
                server.Stop();
                std::cout.flush();
                std::cerr.flush();
                std::_Exit(kExitSuccess);
            }
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
    });

    auto started = server.Start();
    finished = true;
    watcher.join();

    const int exit_code = started.IsErr() ? started.Error().ExitCode() : kExitSuccess;
    if (started.IsErr()) {
        PrintError(started.Error(), error_color);
    }

    // Workers that outlived the drain timeout still hold the global logger.
    // Static destructors must not run under them.
    if (!server.WaitForIdle(std::chrono::milliseconds(0))) {
        LogWarn("main", "Abandoning requests still in flight after drain timeout");
        std::cout.flush();
        std::cerr.flush();
        std::_Exit(exit_code);
    }
    return exit_code;
}
