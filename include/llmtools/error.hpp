#pragma once
#include <stdexcept>
#include <string>

namespace llmtools {

class McpError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// A request could not be serviced at all. Carries the JSON-RPC error code
/// the response must report.
class McpProtocolError : public McpError {
public:
    int code;
    McpProtocolError(int code, const std::string& msg)
        : McpError(msg), code(code) {}
};

class McpTransportError : public McpError {
public:
    using McpError::McpError;
};

/// Failure of a tool handler. Reported to the client as tool output
/// (isError: true), never as a JSON-RPC error.
class ToolError : public McpError {
public:
    using McpError::McpError;
};

namespace error {
    constexpr int ParseError       = -32700;
    constexpr int InvalidRequest   = -32600;
    constexpr int MethodNotFound   = -32601;
    constexpr int InvalidParams    = -32602;
    constexpr int InternalError    = -32603;
} // namespace error

} // namespace llmtools
