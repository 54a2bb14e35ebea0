#include "llmtools/bridge/bridge_config.hpp"
#include "llmtools/error.hpp"
#include "llmtools/log.hpp"
#include <unistd.h>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace llmtools {

namespace {

const nlohmann::json* find_key(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    return it == j.end() ? nullptr : &*it;
}

std::string string_at(const nlohmann::json& j, const char* key, const std::string& where) {
    const auto* v = find_key(j, key);
    if (!v) throw McpError("config: missing key '" + where + key + "'");
    if (!v->is_string()) throw McpError("config: '" + where + key + "' must be a string");
    return v->get<std::string>();
}

std::vector<std::string> string_list(const nlohmann::json& v, const std::string& key) {
    if (!v.is_array()) throw McpError("config: '" + key + "' must be an array of strings");
    std::vector<std::string> out;
    out.reserve(v.size());
    for (const auto& item : v) {
        if (!item.is_string()) {
            throw McpError("config: '" + key + "' must be an array of strings");
        }
        out.push_back(item.get<std::string>());
    }
    return out;
}

bool is_executable(const std::string& path) {
    return ::access(path.c_str(), X_OK) == 0;
}

} // anonymous namespace

BridgeConfig parse_bridge_config(const nlohmann::json& j) {
    if (!j.is_object()) throw McpError("config: top level must be an object");

    BridgeConfig cfg;

    const auto* server = find_key(j, "server");
    if (!server) throw McpError("config: missing key 'server'");
    if (!server->is_object()) throw McpError("config: 'server' must be an object");
    cfg.server_info.name = string_at(*server, "name", "server.");
    cfg.server_info.version = string_at(*server, "version", "server.");
    if (find_key(*server, "instructions")) {
        cfg.instructions = string_at(*server, "instructions", "server.");
    }

    cfg.binary = string_at(j, "binary", "");
    if (cfg.binary.empty()) throw McpError("config: 'binary' must not be empty");

    if (const auto* v = find_key(j, "fallback_dirs")) {
        cfg.fallback_dirs = string_list(*v, "fallback_dirs");
    }

    if (const auto* v = find_key(j, "timeout_seconds")) {
        if (!v->is_number() || v->get<double>() <= 0 || !std::isfinite(v->get<double>())) {
            throw McpError("config: 'timeout_seconds' must be a positive number");
        }
        cfg.timeout = std::chrono::milliseconds(
            static_cast<std::int64_t>(std::llround(v->get<double>() * 1000.0)));
    }

    if (const auto* v = find_key(j, "append_args")) {
        cfg.append_args = string_list(*v, "append_args");
    }

    if (const auto* v = find_key(j, "repeated_args")) {
        if (!v->is_object()) throw McpError("config: 'repeated_args' must be an object");
        for (auto it = v->begin(); it != v->end(); ++it) {
            cfg.repeated_args[it.key()] = string_list(it.value(), "repeated_args." + it.key());
        }
    }

    const auto* tools = find_key(j, "tools");
    if (!tools) throw McpError("config: missing key 'tools'");
    if (!tools->is_array()) throw McpError("config: 'tools' must be an array");
    for (std::size_t i = 0; i < tools->size(); ++i) {
        try {
            cfg.tools.push_back((*tools)[i].get<CommandToolSpec>());
        } catch (const nlohmann::json::exception& e) {
            throw McpError("config: tools[" + std::to_string(i) + "]: " + e.what());
        } catch (const std::invalid_argument& e) {
            throw McpError("config: tools[" + std::to_string(i) + "]: " + e.what());
        }
        if (cfg.tools.back().name.empty()) {
            throw McpError("config: tools[" + std::to_string(i) + "]: 'name' must not be empty");
        }
    }

    return cfg;
}

BridgeConfig load_bridge_config(const std::string& path) {
    std::ifstream in(path);
    if (!in) throw McpError("config: cannot open " + path);
    std::stringstream ss;
    ss << in.rdbuf();

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(ss.str());
    } catch (const nlohmann::json::parse_error& e) {
        throw McpError("config: " + path + ": " + e.what());
    }
    logger()->debug("loaded config {}", path);
    return parse_bridge_config(j);
}

std::string resolve_binary(const std::string& name,
                           const std::vector<std::string>& fallback_dirs) {
    if (name.find('/') != std::string::npos) {
        if (is_executable(name)) return name;
        throw McpError(name + " not found or not executable");
    }

    std::vector<std::string> dirs;
    if (const char* path = std::getenv("PATH")) {
        std::string p(path);
        std::size_t start = 0;
        while (start <= p.size()) {
            std::size_t end = p.find(':', start);
            if (end == std::string::npos) end = p.size();
            // Empty PATH entries mean the current directory
            dirs.push_back(end == start ? "." : p.substr(start, end - start));
            start = end + 1;
        }
    }
    dirs.insert(dirs.end(), fallback_dirs.begin(), fallback_dirs.end());

    for (const auto& dir : dirs) {
        std::string candidate = dir;
        if (!candidate.empty() && candidate.back() != '/') candidate += '/';
        candidate += name;
        if (is_executable(candidate)) {
            logger()->debug("resolved {} to {}", name, candidate);
            return candidate;
        }
    }
    throw McpError(name + " not found in PATH or fallback directories");
}

} // namespace llmtools
