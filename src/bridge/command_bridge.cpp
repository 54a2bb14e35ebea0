#include "llmtools/bridge/command_bridge.hpp"
#include "llmtools/bridge/process_runner.hpp"
#include "llmtools/error.hpp"
#include "llmtools/log.hpp"
#include "llmtools/server.hpp"

namespace llmtools {

namespace {

std::string format_seconds(std::chrono::milliseconds ms) {
    if (ms.count() % 1000 == 0) return std::to_string(ms.count() / 1000) + "s";
    return std::to_string(ms.count()) + "ms";
}

} // anonymous namespace

ToolHandler make_command_handler(const BridgeConfig& config, CommandToolSpec spec) {
    std::vector<std::string> trailing = config.append_args;
    for (const auto& [flag, values] : config.repeated_args) {
        for (const auto& v : values) {
            trailing.push_back(flag);
            trailing.push_back(v);
        }
    }

    return [binary = config.binary, timeout = config.timeout,
            trailing = std::move(trailing), spec = std::move(spec)](const nlohmann::json& args) {
        std::vector<std::string> argv = build_command_args(spec, args);
        argv.insert(argv.end(), trailing.begin(), trailing.end());

        logger()->debug("tool {}: running {} with {} args", spec.name, binary, argv.size());
        ProcessResult r = run_process(binary, argv, timeout);

        if (r.timed_out) {
            throw ToolError("command timed out after " + format_seconds(timeout));
        }
        if (r.exit_code != 0) {
            logger()->info("tool {}: exit code {}", spec.name, r.exit_code);
            // The output usually carries the CLI's own error message
            if (r.output.empty()) {
                throw ToolError("command failed with exit code " + std::to_string(r.exit_code));
            }
        }
        return std::move(r.output);
    };
}

std::size_t register_command_tools(McpServer& server, const BridgeConfig& config) {
    for (const auto& spec : config.tools) {
        server.add_tool(spec.definition(), make_command_handler(config, spec));
    }
    return config.tools.size();
}

} // namespace llmtools
