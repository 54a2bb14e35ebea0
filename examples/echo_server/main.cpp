/// Echo server: minimal MCP server demonstrating tool registration.
/// Usage: ./echo_server
/// Reads raw or Content-Length framed JSON-RPC on stdin, answers with
/// newline-delimited JSON on stdout.

#include <llmtools/llmtools.hpp>
#include <algorithm>
#include <cctype>

int main() {
    llmtools::McpServer::Options opts;
    opts.server_info = {"echo-server", "1.0.0"};
    opts.instructions = "A simple echo server that returns whatever you send it.";

    llmtools::McpServer server{std::move(opts)};

    llmtools::ToolDefinition echo_tool;
    echo_tool.name = "echo";
    echo_tool.description = "Echo the input text back to the caller";
    echo_tool.input_schema = {
        {"type", "object"},
        {"properties", {
            {"text", {{"type", "string"}, {"description", "The text to echo"}}}
        }},
        {"required", {"text"}}
    };
    server.add_tool(echo_tool, [](const nlohmann::json& args) {
        if (!args.contains("text") || !args["text"].is_string()) {
            throw llmtools::ToolError("'text' must be a string");
        }
        return args["text"].get<std::string>();
    });

    llmtools::ToolDefinition upper_tool;
    upper_tool.name = "upper";
    upper_tool.description = "Return the input text in upper case";
    upper_tool.input_schema = echo_tool.input_schema;
    server.add_tool(upper_tool, [](const nlohmann::json& args) {
        std::string text = args.value("text", std::string());
        std::transform(text.begin(), text.end(), text.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return text;
    });

    // Blocks until end of input
    server.serve_stdio();
    return 0;
}
