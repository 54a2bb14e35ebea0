#include "llmtools/json_rpc.hpp"
#include "llmtools/error.hpp"
#include "llmtools/version.hpp"

namespace llmtools {

void to_json(nlohmann::json& j, const JsonRpcRequest& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    if (r.id) j["id"] = *r.id;
    j["method"] = r.method;
    if (r.params) j["params"] = *r.params;
}

void from_json(const nlohmann::json& j, JsonRpcRequest& r) {
    if (j.contains("id")) r.id = j.at("id");
    r.method = j.at("method").get<std::string>();
    if (j.contains("params")) r.params = j.at("params");
}

void to_json(nlohmann::json& j, const JsonRpcResponse& r) {
    j = nlohmann::json::object();
    j["jsonrpc"] = std::string(JSONRPC_VERSION);
    j["id"] = r.id;
    if (r.error) {
        j["error"] = *r.error;
    } else {
        j["result"] = r.result ? *r.result : nlohmann::json::object();
    }
}

void from_json(const nlohmann::json& j, JsonRpcResponse& r) {
    r.id = j.contains("id") ? j.at("id") : nlohmann::json();
    if (j.contains("result")) r.result = j.at("result");
    if (j.contains("error")) r.error = j.at("error").get<JsonRpcError>();
}

JsonRpcResponse make_error_response(const RequestId& id, int code, const std::string& message) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.error = JsonRpcError{code, message, std::nullopt};
    return resp;
}

JsonRpcResponse make_parse_error(const RequestId& id, const std::string& message) {
    return make_error_response(id, error::ParseError, message);
}

JsonRpcResponse make_invalid_request(const RequestId& id, const std::string& message) {
    return make_error_response(id, error::InvalidRequest, message);
}

JsonRpcResponse make_method_not_found(const RequestId& id, const std::string& method) {
    return make_error_response(id, error::MethodNotFound, "Method not found: " + method);
}

JsonRpcResponse make_invalid_params(const RequestId& id, const std::string& message) {
    return make_error_response(id, error::InvalidParams, message);
}

JsonRpcResponse make_internal_error(const RequestId& id, const std::string& message) {
    return make_error_response(id, error::InternalError, message);
}

JsonRpcResponse make_result_response(const RequestId& id, nlohmann::json result) {
    JsonRpcResponse resp;
    resp.id = id;
    resp.result = std::move(result);
    return resp;
}

} // namespace llmtools
