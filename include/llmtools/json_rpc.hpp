#pragma once
#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace llmtools {

/// Request identifier. Opaque to the engine: a JSON number, string or null,
/// echoed back verbatim in the response.
using RequestId = nlohmann::json;

struct JsonRpcError {
    int code;
    std::string message;
    std::optional<nlohmann::json> data;

    bool operator==(const JsonRpcError& o) const {
        return code == o.code && message == o.message && data == o.data;
    }
    bool operator!=(const JsonRpcError& o) const { return !(*this == o); }
};

inline void to_json(nlohmann::json& j, const JsonRpcError& e) {
    j = nlohmann::json{{"code", e.code}, {"message", e.message}};
    if (e.data) j["data"] = *e.data;
}

inline void from_json(const nlohmann::json& j, JsonRpcError& e) {
    e.code = j.at("code").get<int>();
    e.message = j.at("message").get<std::string>();
    if (j.contains("data")) e.data = j.at("data");
}

struct JsonRpcRequest {
    // Absent for notifications.
    std::optional<RequestId> id;
    std::string method;
    std::optional<nlohmann::json> params;

    bool is_notification() const { return !id.has_value(); }

    bool operator==(const JsonRpcRequest& o) const {
        return id == o.id && method == o.method && params == o.params;
    }
};

/// Exactly one of result / error is set.
struct JsonRpcResponse {
    RequestId id;
    std::optional<nlohmann::json> result;
    std::optional<JsonRpcError> error;

    bool operator==(const JsonRpcResponse& o) const {
        return id == o.id && result == o.result && error == o.error;
    }
};

void to_json(nlohmann::json& j, const JsonRpcRequest& r);
void from_json(const nlohmann::json& j, JsonRpcRequest& r);

void to_json(nlohmann::json& j, const JsonRpcResponse& r);
void from_json(const nlohmann::json& j, JsonRpcResponse& r);

// ---- Error response constructors ----

[[nodiscard]] JsonRpcResponse make_error_response(const RequestId& id, int code,
                                                  const std::string& message);
[[nodiscard]] JsonRpcResponse make_parse_error(const RequestId& id, const std::string& message);
[[nodiscard]] JsonRpcResponse make_invalid_request(const RequestId& id, const std::string& message);
[[nodiscard]] JsonRpcResponse make_method_not_found(const RequestId& id, const std::string& method);
[[nodiscard]] JsonRpcResponse make_invalid_params(const RequestId& id, const std::string& message);
[[nodiscard]] JsonRpcResponse make_internal_error(const RequestId& id, const std::string& message);

[[nodiscard]] JsonRpcResponse make_result_response(const RequestId& id, nlohmann::json result);

} // namespace llmtools
