#pragma once
#include "bridge_config.hpp"
#include "command_tool.hpp"
#include "../tool_registry.hpp"

namespace llmtools {

class McpServer;

/// Handler running config.binary with the spec's arguments, then
/// config.append_args and config.repeated_args, under config.timeout.
/// Throws ToolError on timeout, or on a failing exit with no output.
[[nodiscard]] ToolHandler make_command_handler(const BridgeConfig& config, CommandToolSpec spec);

/// Register every tool in config.tools. Returns the number registered.
std::size_t register_command_tools(McpServer& server, const BridgeConfig& config);

} // namespace llmtools
