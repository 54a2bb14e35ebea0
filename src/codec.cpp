#include "llmtools/codec.hpp"
#include "llmtools/error.hpp"
#include "llmtools/version.hpp"
#include <nlohmann/json.hpp>
#include <simdjson.h>
#include <string>

namespace llmtools {

namespace {

// Convert simdjson value to nlohmann::json recursively
nlohmann::json simdjson_to_nlohmann(simdjson::ondemand::value val) {
    switch (val.type()) {
        case simdjson::ondemand::json_type::object: {
            nlohmann::json obj = nlohmann::json::object();
            for (auto field : val.get_object()) {
                std::string_view key = field.unescaped_key();
                obj[std::string(key)] = simdjson_to_nlohmann(field.value());
            }
            return obj;
        }
        case simdjson::ondemand::json_type::array: {
            nlohmann::json arr = nlohmann::json::array();
            for (auto elem : val.get_array()) {
                arr.push_back(simdjson_to_nlohmann(elem.value()));
            }
            return arr;
        }
        case simdjson::ondemand::json_type::string: {
            std::string_view sv = val.get_string();
            return nlohmann::json(std::string(sv));
        }
        case simdjson::ondemand::json_type::number: {
            // Try integer first, then double
            auto result_int = val.get_int64();
            if (result_int.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_int.value());
            }
            auto result_uint = val.get_uint64();
            if (result_uint.error() == simdjson::SUCCESS) {
                return nlohmann::json(result_uint.value());
            }
            return nlohmann::json(val.get_double().value());
        }
        case simdjson::ondemand::json_type::boolean:
            return nlohmann::json(val.get_bool().value());
        case simdjson::ondemand::json_type::null:
            return nlohmann::json(nullptr);
        default:
            return nlohmann::json(nullptr);
    }
}

std::string describe(const nlohmann::json& j) {
    return std::string(j.type_name());
}

} // anonymous namespace

nlohmann::json Codec::parse_json(std::string_view raw) {
    if (raw.empty()) {
        throw McpProtocolError(error::ParseError, "Parse error: empty message");
    }

    simdjson::ondemand::parser parser;
    // simdjson requires padded input
    simdjson::padded_string padded(raw.data(), raw.size());

    simdjson::ondemand::document doc;
    auto err = parser.iterate(padded).get(doc);
    if (err) {
        throw McpProtocolError(error::ParseError,
            std::string("Parse error: ") + simdjson::error_message(err));
    }

    nlohmann::json j;
    bool is_object = false;
    bool trailing = false;
    try {
        simdjson::ondemand::json_type type = doc.type();
        is_object = type == simdjson::ondemand::json_type::object;
        if (is_object) {
            j = simdjson_to_nlohmann(doc.get_value());
            trailing = !doc.at_end();
        }
    } catch (const simdjson::simdjson_error& e) {
        throw McpProtocolError(error::ParseError, std::string("Parse error: ") + e.what());
    }

    if (!is_object) {
        throw McpProtocolError(error::ParseError, "Parse error: message must be a JSON object");
    }
    if (trailing) {
        throw McpProtocolError(error::ParseError, "Parse error: trailing data after JSON object");
    }
    return j;
}

JsonRpcRequest Codec::validate_request(const nlohmann::json& j) {
    if (!j.contains("jsonrpc")) {
        throw McpProtocolError(error::InvalidRequest, "Invalid Request: missing jsonrpc field");
    }
    const auto& version = j.at("jsonrpc");
    if (!version.is_string() || version.get<std::string>() != JSONRPC_VERSION) {
        throw McpProtocolError(error::InvalidRequest, "Invalid Request: jsonrpc must be '2.0'");
    }

    if (!j.contains("method")) {
        throw McpProtocolError(error::InvalidRequest, "Invalid Request: missing method field");
    }
    const auto& method = j.at("method");
    if (!method.is_string()) {
        throw McpProtocolError(error::InvalidRequest,
            "Invalid Request: method must be a string, got " + describe(method));
    }
    if (method.get<std::string>().empty()) {
        throw McpProtocolError(error::InvalidRequest, "Invalid Request: missing method field");
    }

    if (j.contains("id")) {
        const auto& id = j.at("id");
        if (!id.is_number() && !id.is_string() && !id.is_null()) {
            throw McpProtocolError(error::InvalidRequest,
                "Invalid Request: id must be a number, string or null, got " + describe(id));
        }
    }

    JsonRpcRequest req;
    from_json(j, req);
    return req;
}

JsonRpcRequest Codec::parse_request(std::string_view raw) {
    return validate_request(parse_json(raw));
}

JsonRpcResponse Codec::parse_response(std::string_view raw) {
    nlohmann::json j = parse_json(raw);
    auto version = j.find("jsonrpc");
    if (version == j.end() || !version->is_string() || version->get<std::string>() != JSONRPC_VERSION) {
        throw McpProtocolError(error::InvalidRequest, "Invalid Response: jsonrpc must be '2.0'");
    }
    if (j.contains("result") == j.contains("error")) {
        throw McpProtocolError(error::InvalidRequest,
            "Invalid Response: exactly one of result or error is required");
    }
    try {
        return j.get<JsonRpcResponse>();
    } catch (const nlohmann::json::exception& e) {
        throw McpProtocolError(error::InvalidRequest, std::string("Invalid Response: ") + e.what());
    }
}

std::string Codec::serialize(const JsonRpcResponse& resp) {
    nlohmann::json j;
    to_json(j, resp);
    return j.dump();
}

} // namespace llmtools
