#pragma once
#include "json_rpc.hpp"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <variant>

namespace llmtools {

using HandlerResult = std::variant<nlohmann::json, JsonRpcError>;
using RequestHandler = std::function<HandlerResult(const nlohmann::json& params)>;
using NotificationHandler = std::function<void(const nlohmann::json& params)>;

/// Maps JSON-RPC method names to handlers and shapes the response envelope.
///
/// Handlers receive the request params, or an empty object when the request
/// has none. A handler throwing McpProtocolError produces an error response
/// with that code; any other exception produces InternalError.
class Router {
public:
    /// Register a request handler for a method.
    void on_request(const std::string& method, RequestHandler handler);

    /// Register a notification handler. Methods registered here are never
    /// answered, even when the message carries an id.
    void on_notification(const std::string& method, NotificationHandler handler);

    /// Dispatch one request. Returns the response to write, or std::nullopt
    /// when nothing must be written (notifications).
    [[nodiscard]] std::optional<JsonRpcResponse> dispatch(const JsonRpcRequest& req);

    [[nodiscard]] bool has_handler(const std::string& method) const;

private:
    mutable std::mutex mutex_;
    std::unordered_map<std::string, RequestHandler> request_handlers_;
    std::unordered_map<std::string, NotificationHandler> notification_handlers_;
};

} // namespace llmtools
