#pragma once
#include "types.hpp"
#include "json_rpc.hpp"
#include "session.hpp"
#include "tool_registry.hpp"
#include "transport/transport.hpp"
#include <memory>
#include <optional>
#include <string>

namespace llmtools {

/// Stdio MCP server: a tool registry behind the initialize / tools/list /
/// tools/call lifecycle.
///
/// Tool failures (unknown tool, handler exception) are answered as
/// successful results flagged isError; only envelope and method problems
/// become JSON-RPC errors.
class McpServer {
public:
    struct Options {
        Implementation server_info;
        std::optional<std::string> instructions;
    };

    explicit McpServer(Options opts);
    ~McpServer();

    // Non-copyable, non-movable
    McpServer(const McpServer&) = delete;
    McpServer& operator=(const McpServer&) = delete;

    // ---- Tool registration ----
    void add_tool(ToolDefinition def, ToolHandler handler);
    bool remove_tool(const std::string& name);
    [[nodiscard]] const ToolRegistry& tools() const;

    // ---- Dispatch ----

    /// Route one request. std::nullopt means no response must be written.
    [[nodiscard]] std::optional<JsonRpcResponse> handle(const JsonRpcRequest& req);

    /// Read one message from the transport, dispatch it and write the
    /// response. Framing and envelope errors are answered with a null id.
    /// Returns false at end-of-stream.
    bool handle_one(ITransport& transport);

    // ---- Transport ----

    /// Serve until end-of-stream or shutdown(). Blocks.
    void serve(std::unique_ptr<ITransport> transport);
    void serve_stdio();

    /// Stop serving after the current request. Safe from any thread.
    void shutdown();

    bool is_running() const;

    [[nodiscard]] SessionState state() const;
    [[nodiscard]] std::optional<Implementation> client_info() const;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace llmtools
