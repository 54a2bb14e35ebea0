#include "llmtools/router.hpp"
#include "llmtools/error.hpp"
#include "llmtools/log.hpp"

namespace llmtools {

void Router::on_request(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    request_handlers_[method] = std::move(handler);
}

void Router::on_notification(const std::string& method, NotificationHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    notification_handlers_[method] = std::move(handler);
}

bool Router::has_handler(const std::string& method) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return request_handlers_.count(method) > 0 || notification_handlers_.count(method) > 0;
}

std::optional<JsonRpcResponse> Router::dispatch(const JsonRpcRequest& req) {
    const RequestId id = req.id ? *req.id : RequestId();
    nlohmann::json params = req.params && !req.params->is_null()
        ? *req.params
        : nlohmann::json::object();

    // Hold lock only to look up the handler
    NotificationHandler notification;
    RequestHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto nit = notification_handlers_.find(req.method);
        if (nit != notification_handlers_.end()) {
            notification = nit->second;
        } else {
            auto it = request_handlers_.find(req.method);
            if (it != request_handlers_.end()) handler = it->second;
        }
    }

    if (notification) {
        try {
            notification(params);
        } catch (const std::exception& e) {
            logger()->warn("notification {} failed: {}", req.method, e.what());
        }
        return std::nullopt;
    }

    if (!handler) {
        if (req.is_notification()) {
            logger()->debug("ignoring unknown notification {}", req.method);
            return std::nullopt;
        }
        return make_method_not_found(id, req.method);
    }

    // Call handler WITHOUT holding the lock
    JsonRpcResponse resp;
    try {
        auto result = handler(params);
        if (auto* ok = std::get_if<nlohmann::json>(&result)) {
            resp = make_result_response(id, std::move(*ok));
        } else {
            resp.id = id;
            resp.error = std::get<JsonRpcError>(std::move(result));
        }
    } catch (const McpProtocolError& e) {
        resp = make_error_response(id, e.code, e.what());
    } catch (const std::exception& e) {
        logger()->error("{} failed: {}", req.method, e.what());
        resp = make_internal_error(id, e.what());
    }

    if (req.is_notification()) {
        logger()->debug("dropping response to notification {}", req.method);
        return std::nullopt;
    }
    return resp;
}

} // namespace llmtools
