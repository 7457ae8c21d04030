#include <mcp_base/config/config_loader.hpp>

#include <mcp_base/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace mcp_base {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config};
}

Result<LogLevel, Error> ParseLevel(const std::string& value) {
    LogLevel level = LogLevel::Warn;
    if (!ParseLogLevel(value, level)) {
        return Result<LogLevel, Error>::Err(MakeConfigError(
            "Unknown log level '" + value + "' (expected debug, info, warn or error)"));
    }
    return Result<LogLevel, Error>::Ok(level);
}

Result<LogFormat, Error> ParseFormat(const std::string& value) {
    if (value == "text") return Result<LogFormat, Error>::Ok(LogFormat::Text);
    if (value == "json") return Result<LogFormat, Error>::Ok(LogFormat::Json);
    return Result<LogFormat, Error>::Err(MakeConfigError(
        "Unknown log format '" + value + "' (expected text or json)"));
}

void ReadFlag(const YAML::Node& node, const char* key, bool& out) {
    if (node && node[key]) {
        out = node[key].as<bool>();
    }
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    ServerConfig config;

    try {
        // -- Server identity --
        if (const auto server = root["server"]) {
            if (server["name"]) {
                config.name = server["name"].as<std::string>();
            }
            if (server["version"]) {
                config.version = server["version"].as<std::string>();
            }
            if (server["instructions"]) {
                config.instructions = server["instructions"].as<std::string>();
            }
        }
        if (root["protocol_version"]) {
            config.protocol_version = root["protocol_version"].as<std::string>();
        }

        // -- Logging --
        if (const auto log = root["log"]) {
            if (log["level"]) {
                auto level = ParseLevel(log["level"].as<std::string>());
                if (level.IsErr()) {
                    return Result<ServerConfig, Error>::Err(std::move(level).Error());
                }
                config.log.level = level.Value();
            }
            if (log["format"]) {
                auto format = ParseFormat(log["format"].as<std::string>());
                if (format.IsErr()) {
                    return Result<ServerConfig, Error>::Err(std::move(format).Error());
                }
                config.log.format = format.Value();
            }
            if (log["file"]) {
                config.log.file = log["file"].as<std::string>();
            }
            if (log["color"]) {
                config.log.color = log["color"].as<bool>();
            }
        }

        // -- Static capability flags --
        if (const auto caps = root["capabilities"]) {
            ReadFlag(caps["tools"], "list_changed", config.capabilities.tools_list_changed);
            ReadFlag(caps["resources"], "subscribe", config.capabilities.resources_subscribe);
            ReadFlag(caps["resources"], "list_changed",
                     config.capabilities.resources_list_changed);
            ReadFlag(caps["prompts"], "list_changed", config.capabilities.prompts_list_changed);
            if (caps["logging"]) {
                config.capabilities.logging = caps["logging"].as<bool>();
            }
        }

        // -- Shutdown --
        if (const auto shutdown = root["shutdown"]) {
            if (shutdown["drain_timeout_ms"]) {
                config.drain_timeout_ms = shutdown["drain_timeout_ms"].as<int64_t>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("mcp-base", kVersion,
                                     argparse::default_arguments::none);

    int verbosity = 0;

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--name")
        .help("Server name announced during initialize");
    program.add_argument("--server-version")
        .help("Server version announced during initialize");
    program.add_argument("--protocol-version")
        .help("Protocol version used when the client names none");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--log-format")
        .help("text or json");
    program.add_argument("--log-file")
        .help("Write logs to this file instead of stderr");
    program.add_argument("--color")
        .help("Force colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--drain-timeout")
        .help("Milliseconds to wait for in-flight requests after EOF")
        .scan<'i', int>();
    program.add_argument("-v", "--verbose")
        .help("More log output (-v info, -vv debug)")
        .action([&](const auto&) { ++verbosity; })
        .append()
        .default_value(false)
        .implicit_value(true)
        .nargs(0);

    try {
        program.parse_args(argc, argv);
    } catch (const std::runtime_error& e) {
        return Result<CliOverrides, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOverrides cli;
    cli.config_path = program.present("--config");
    cli.name = program.present("--name");
    cli.version = program.present("--server-version");
    cli.protocol_version = program.present("--protocol-version");
    cli.log_file = program.present("--log-file");

    if (verbosity >= 2) {
        cli.log_level = LogLevel::Debug;
    } else if (verbosity == 1) {
        cli.log_level = LogLevel::Info;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLevel(*val);
        if (level.IsErr()) {
            return Result<CliOverrides, Error>::Err(std::move(level).Error());
        }
        cli.log_level = level.Value();
    }
    if (auto val = program.present("--log-format")) {
        auto format = ParseFormat(*val);
        if (format.IsErr()) {
            return Result<CliOverrides, Error>::Err(std::move(format).Error());
        }
        cli.log_format = format.Value();
    }

    if (program.get<bool>("--color")) {
        cli.color = true;
    }
    if (program.get<bool>("--no-color")) {
        cli.color = false;
    }
    if (auto val = program.present<int>("--drain-timeout")) {
        cli.drain_timeout_ms = *val;
    }

    return Result<CliOverrides, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
ServerConfig MergeConfigs(const ServerConfig& base, const CliOverrides& cli) {
    ServerConfig merged = base;

    if (cli.name) merged.name = *cli.name;
    if (cli.version) merged.version = *cli.version;
    if (cli.protocol_version) merged.protocol_version = *cli.protocol_version;
    if (cli.log_level) merged.log.level = *cli.log_level;
    if (cli.log_format) merged.log.format = *cli.log_format;
    if (cli.log_file) merged.log.file = cli.log_file;
    if (cli.color) merged.log.color = cli.color;
    if (cli.drain_timeout_ms) merged.drain_timeout_ms = *cli.drain_timeout_ms;

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const ServerConfig& config) {
    if (config.name.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: server.name"));
    }
    if (config.version.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: server.version"));
    }
    if (config.protocol_version.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: protocol_version"));
    }
    if (config.log.file && config.log.file->empty()) {
        return Result<void, Error>::Err(MakeConfigError("log.file must not be empty"));
    }
    if (config.drain_timeout_ms < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Drain timeout must not be negative, got " +
                            std::to_string(config.drain_timeout_ms)));
    }
    return Result<void, Error>::Ok();
}

ServerOptions MakeServerOptions(const ServerConfig& config) {
    ServerOptions options;
    options.info = ServerInfo{config.name, config.version,
                              config.protocol_version, config.instructions};
    options.capabilities = config.capabilities;
    options.drain_timeout = std::chrono::milliseconds(config.drain_timeout_ms);
    return options;
}

} // namespace mcp_base
