#pragma once

#include <mcp_base/config/app_config.hpp>
#include <mcp_base/core/result.hpp>
#include <mcp_base/mcp/server.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace mcp_base {

// Parse a YAML config file into a ServerConfig. Missing keys keep defaults.
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path);

// Flags given on the command line. Unset members leave the base untouched.
struct CliOverrides {
    std::optional<std::string> config_path;
    std::optional<std::string> name;
    std::optional<std::string> version;
    std::optional<std::string> protocol_version;
    std::optional<LogLevel> log_level;
    std::optional<LogFormat> log_format;
    std::optional<std::string> log_file;
    std::optional<bool> color;
    std::optional<int64_t> drain_timeout_ms;
};

// Parse command-line arguments.
Result<CliOverrides, Error> LoadFromCli(int argc, const char* const* argv);

// Apply CLI overrides on top of a base config (defaults or YAML).
ServerConfig MergeConfigs(const ServerConfig& base, const CliOverrides& cli);

// Validate that required fields are present and values are sane.
Result<void, Error> ValidateConfig(const ServerConfig& config);

// Translate the validated config into server construction options.
ServerOptions MakeServerOptions(const ServerConfig& config);

} // namespace mcp_base
