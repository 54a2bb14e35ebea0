#pragma once
#include "command_tool.hpp"
#include "../types.hpp"
#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace llmtools {

/// Everything needed to expose one external CLI as an MCP server.
struct BridgeConfig {
    Implementation server_info;
    std::optional<std::string> instructions;

    std::string binary;                     // name or path, resolved at startup
    std::vector<std::string> fallback_dirs; // searched after PATH
    std::chrono::milliseconds timeout{std::chrono::seconds(120)};

    std::vector<std::string> append_args;   // added after every tool's args
    // Each value emitted as "flag value", e.g. --allowed-dirs /srv/a
    std::map<std::string, std::vector<std::string>> repeated_args;

    std::vector<CommandToolSpec> tools;
};

/// Throws McpError naming the offending key.
[[nodiscard]] BridgeConfig parse_bridge_config(const nlohmann::json& j);

/// Read and parse a config file. Throws McpError on I/O or JSON errors.
[[nodiscard]] BridgeConfig load_bridge_config(const std::string& path);

/// Find an executable: paths containing '/' are checked as-is, otherwise
/// each PATH entry and then each fallback directory is tried.
/// Throws McpError when nothing executable is found.
[[nodiscard]] std::string resolve_binary(const std::string& name,
                                         const std::vector<std::string>& fallback_dirs);

} // namespace llmtools
