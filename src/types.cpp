#include "llmtools/types.hpp"
#include <stdexcept>

namespace llmtools {

// ---------- TextContent ----------

void to_json(nlohmann::json& j, const TextContent& t) {
    j = {{"type", "text"}, {"text", t.text}};
}

void from_json(const nlohmann::json& j, TextContent& t) {
    const std::string type = j.at("type").get<std::string>();
    if (type != "text") {
        throw std::invalid_argument("Unsupported content type: " + type);
    }
    t.text = j.at("text").get<std::string>();
}

// ---------- ToolDefinition ----------

void to_json(nlohmann::json& j, const ToolDefinition& t) {
    j = {{"name", t.name}, {"inputSchema", t.input_schema}};
    if (!t.description.empty()) j["description"] = t.description;
}

void from_json(const nlohmann::json& j, ToolDefinition& t) {
    t.name = j.at("name").get<std::string>();
    t.input_schema = j.at("inputSchema");
    t.description = j.value("description", std::string());
}

// ---------- CallToolParams ----------

void from_json(const nlohmann::json& j, CallToolParams& t) {
    if (!j.is_object()) {
        throw std::invalid_argument("params must be an object");
    }
    // A missing name is reported as an unknown tool, not a protocol error.
    if (j.contains("name") && !j.at("name").is_null()) {
        t.name = j.at("name").get<std::string>();
    }
    if (j.contains("arguments") && !j.at("arguments").is_null()) {
        const auto& args = j.at("arguments");
        if (!args.is_object()) {
            throw std::invalid_argument("arguments must be an object");
        }
        t.arguments = args;
    }
}

// ---------- CallToolResult ----------

void to_json(nlohmann::json& j, const CallToolResult& t) {
    j = nlohmann::json::object();
    j["content"] = t.content;
    if (t.is_error) j["isError"] = true;
}

void from_json(const nlohmann::json& j, CallToolResult& t) {
    if (j.contains("content")) t.content = j.at("content").get<std::vector<TextContent>>();
    if (j.contains("isError")) t.is_error = j.at("isError").get<bool>();
}

// ---------- Capabilities ----------

void to_json(nlohmann::json& j, const ServerCapabilities& t) {
    j = nlohmann::json::object();
    if (t.tools) j["tools"] = *t.tools;
}

void from_json(const nlohmann::json& j, ServerCapabilities& t) {
    if (j.contains("tools")) t.tools = j.at("tools");
}

void to_json(nlohmann::json& j, const Implementation& t) {
    j = {{"name", t.name}, {"version", t.version}};
}

void from_json(const nlohmann::json& j, Implementation& t) {
    t.name = j.value("name", std::string());
    t.version = j.value("version", std::string());
}

// ---------- Initialize ----------

void from_json(const nlohmann::json& j, InitializeParams& t) {
    if (!j.is_object()) {
        throw std::invalid_argument("params must be an object");
    }
    t.protocol_version = j.value("protocolVersion", std::string());
    if (j.contains("capabilities") && !j.at("capabilities").is_null()) {
        if (!j.at("capabilities").is_object()) {
            throw std::invalid_argument("capabilities must be an object");
        }
        t.capabilities = j.at("capabilities");
    }
    if (j.contains("clientInfo") && !j.at("clientInfo").is_null()) {
        t.client_info = j.at("clientInfo").get<Implementation>();
    }
}

void to_json(nlohmann::json& j, const InitializeResult& t) {
    j = {
        {"protocolVersion", t.protocol_version},
        {"capabilities", t.capabilities},
        {"serverInfo", t.server_info}
    };
    if (t.instructions && !t.instructions->empty()) j["instructions"] = *t.instructions;
}

void from_json(const nlohmann::json& j, InitializeResult& t) {
    t.protocol_version = j.at("protocolVersion").get<std::string>();
    t.capabilities = j.at("capabilities").get<ServerCapabilities>();
    t.server_info = j.at("serverInfo").get<Implementation>();
    if (j.contains("instructions")) t.instructions = j.at("instructions").get<std::string>();
}

} // namespace llmtools
