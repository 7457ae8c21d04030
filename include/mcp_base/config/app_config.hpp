#pragma once

#include <mcp_base/core/log.hpp>
#include <mcp_base/core/version.hpp>
#include <mcp_base/mcp/capabilities.hpp>

#include <cstdint>
#include <optional>
#include <string>

namespace mcp_base {

enum class LogFormat {
    Text,
    Json,
};

struct LogConfig {
    LogLevel level = LogLevel::Warn;
    LogFormat format = LogFormat::Text;
    std::optional<std::string> file;  // stderr when unset
    std::optional<bool> color;        // auto-detect when unset
};

struct ServerConfig {
    std::string name = "mcp-base";
    std::string version = kVersion;
    std::optional<std::string> instructions;
    std::string protocol_version = kDefaultProtocolVersion;
    LogConfig log;
    CapabilityOptions capabilities;
    int64_t drain_timeout_ms = 5000;
};

} // namespace mcp_base
