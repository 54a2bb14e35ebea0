#pragma once
#include "json_rpc.hpp"
#include "error.hpp"
#include <string>
#include <string_view>

namespace llmtools {

class Codec {
public:
    /// Parse raw bytes into a JSON object.
    /// Throws McpProtocolError(ParseError) on malformed JSON or a non-object.
    [[nodiscard]] static nlohmann::json parse_json(std::string_view raw);

    /// Parse and validate one request envelope.
    /// ParseError for malformed JSON, InvalidRequest for a malformed envelope.
    [[nodiscard]] static JsonRpcRequest parse_request(std::string_view raw);

    /// Validate an already-parsed envelope (jsonrpc == "2.0", non-empty
    /// method, id a number, string or null).
    [[nodiscard]] static JsonRpcRequest validate_request(const nlohmann::json& j);

    [[nodiscard]] static JsonRpcResponse parse_response(std::string_view raw);

    /// Compact JSON, no trailing newline. Throws nlohmann::json::type_error
    /// when a string is not valid UTF-8.
    [[nodiscard]] static std::string serialize(const JsonRpcResponse& resp);
};

} // namespace llmtools
