#pragma once

/// Umbrella header for the llmtools stdio MCP library.

#include "version.hpp"
#include "error.hpp"
#include "log.hpp"
#include "types.hpp"
#include "json_rpc.hpp"
#include "codec.hpp"
#include "session.hpp"
#include "router.hpp"
#include "tool_registry.hpp"
#include "server.hpp"
#include "transport/transport.hpp"
#include "transport/framing.hpp"
#include "transport/stdio_transport.hpp"
#include "bridge/process_runner.hpp"
#include "bridge/command_tool.hpp"
#include "bridge/bridge_config.hpp"
#include "bridge/command_bridge.hpp"
