#include "llmtools/bridge/command_tool.hpp"
#include "llmtools/error.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>

namespace llmtools {

namespace {

std::string integer_word(const ArgumentSpec& arg, const nlohmann::json& v) {
    if (v.is_number_integer()) {
        return v.is_number_unsigned() ? std::to_string(v.get<std::uint64_t>())
                                      : std::to_string(v.get<std::int64_t>());
    }
    // JSON clients frequently send 30.0 for 30
    if (v.is_number_float()) {
        double d = v.get<double>();
        if (std::isfinite(d) && std::trunc(d) == d &&
            d >= static_cast<double>(std::numeric_limits<std::int64_t>::min()) &&
            d <= static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return std::to_string(static_cast<std::int64_t>(d));
        }
    }
    throw ToolError("argument '" + arg.property + "' must be an integer");
}

void push_flagged(std::vector<std::string>& argv, const ArgumentSpec& arg, std::string word) {
    if (!arg.flag.empty()) argv.push_back(arg.flag);
    argv.push_back(std::move(word));
}

void append_value(std::vector<std::string>& argv, const ArgumentSpec& arg,
                  const nlohmann::json& v) {
    switch (arg.kind) {
        case ArgumentKind::String: {
            if (!v.is_string()) {
                throw ToolError("argument '" + arg.property + "' must be a string");
            }
            std::string word = v.get<std::string>();
            if (!arg.choices.empty() &&
                std::find(arg.choices.begin(), arg.choices.end(), word) == arg.choices.end()) {
                std::string allowed;
                for (const auto& c : arg.choices) {
                    if (!allowed.empty()) allowed += ", ";
                    allowed += c;
                }
                throw ToolError("argument '" + arg.property + "' must be one of: " + allowed);
            }
            push_flagged(argv, arg, std::move(word));
            break;
        }
        case ArgumentKind::Integer:
            push_flagged(argv, arg, integer_word(arg, v));
            break;
        case ArgumentKind::Number:
            if (!v.is_number()) {
                throw ToolError("argument '" + arg.property + "' must be a number");
            }
            push_flagged(argv, arg, v.is_number_float() ? v.dump() : integer_word(arg, v));
            break;
        case ArgumentKind::Boolean: {
            if (!v.is_boolean()) {
                throw ToolError("argument '" + arg.property + "' must be a boolean");
            }
            const std::string& word = v.get<bool>() ? arg.flag : arg.off_flag;
            if (!word.empty()) argv.push_back(word);
            break;
        }
        case ArgumentKind::StringList:
            if (!v.is_array()) {
                throw ToolError("argument '" + arg.property + "' must be an array of strings");
            }
            for (const auto& item : v) {
                if (!item.is_string()) {
                    throw ToolError("argument '" + arg.property + "' must be an array of strings");
                }
            }
            for (const auto& item : v) push_flagged(argv, arg, item.get<std::string>());
            break;
        case ArgumentKind::IntegerList: {
            if (!v.is_array()) {
                throw ToolError("argument '" + arg.property + "' must be an array of integers");
            }
            // Validate every item before emitting any of them
            std::vector<std::string> words;
            for (const auto& item : v) words.push_back(integer_word(arg, item));
            for (auto& w : words) push_flagged(argv, arg, std::move(w));
            break;
        }
        case ArgumentKind::Json:
            push_flagged(argv, arg, v.dump());
            break;
    }
}

} // anonymous namespace

const char* to_string(ArgumentKind kind) {
    switch (kind) {
        case ArgumentKind::String:      return "string";
        case ArgumentKind::Integer:     return "integer";
        case ArgumentKind::Number:      return "number";
        case ArgumentKind::Boolean:     return "boolean";
        case ArgumentKind::StringList:  return "string_list";
        case ArgumentKind::IntegerList: return "integer_list";
        case ArgumentKind::Json:        return "json";
    }
    return "unknown";
}

ToolDefinition CommandToolSpec::definition() const {
    ToolDefinition def;
    def.name = name;
    def.description = description;
    def.input_schema = input_schema.is_null() ? generate_input_schema(arguments) : input_schema;
    return def;
}

std::vector<std::string> build_command_args(const CommandToolSpec& spec,
                                            const nlohmann::json& arguments) {
    if (!arguments.is_null() && !arguments.is_object()) {
        throw ToolError("arguments must be an object");
    }

    std::vector<std::string> argv = spec.command;
    for (const auto& arg : spec.arguments) {
        const nlohmann::json* value = nullptr;
        if (arguments.is_object()) {
            auto it = arguments.find(arg.property);
            if (it != arguments.end() && !it->is_null()) value = &*it;
        }
        if (!value && arg.default_value) value = &*arg.default_value;
        if (!value) {
            if (arg.required) {
                throw ToolError("missing required argument '" + arg.property + "'");
            }
            continue;
        }
        append_value(argv, arg, *value);
    }
    return argv;
}

nlohmann::json generate_input_schema(const std::vector<ArgumentSpec>& arguments) {
    nlohmann::json properties = nlohmann::json::object();
    nlohmann::json required = nlohmann::json::array();
    for (const auto& arg : arguments) {
        nlohmann::json prop;
        switch (arg.kind) {
            case ArgumentKind::String:
                prop["type"] = "string";
                if (!arg.choices.empty()) prop["enum"] = arg.choices;
                break;
            case ArgumentKind::Integer: prop["type"] = "integer"; break;
            case ArgumentKind::Number:  prop["type"] = "number"; break;
            case ArgumentKind::Boolean: prop["type"] = "boolean"; break;
            case ArgumentKind::StringList:
                prop["type"] = "array";
                prop["items"] = {{"type", "string"}};
                break;
            case ArgumentKind::IntegerList:
                prop["type"] = "array";
                prop["items"] = {{"type", "integer"}};
                break;
            case ArgumentKind::Json:
                // Free-form, no type constraint
                prop = nlohmann::json::object();
                break;
        }
        if (!arg.description.empty()) prop["description"] = arg.description;
        if (arg.default_value) prop["default"] = *arg.default_value;
        properties[arg.property] = std::move(prop);
        if (arg.required) required.push_back(arg.property);
    }
    nlohmann::json schema = {{"type", "object"}, {"properties", properties}};
    if (!required.empty()) schema["required"] = required;
    return schema;
}

// ---------- JSON ----------

void from_json(const nlohmann::json& j, ArgumentKind& k) {
    const std::string s = j.get<std::string>();
    if (s == "string") k = ArgumentKind::String;
    else if (s == "integer") k = ArgumentKind::Integer;
    else if (s == "number") k = ArgumentKind::Number;
    else if (s == "boolean") k = ArgumentKind::Boolean;
    else if (s == "string_list") k = ArgumentKind::StringList;
    else if (s == "integer_list") k = ArgumentKind::IntegerList;
    else if (s == "json") k = ArgumentKind::Json;
    else throw std::invalid_argument("unknown argument type: " + s);
}

void from_json(const nlohmann::json& j, ArgumentSpec& a) {
    a.property = j.at("property").get<std::string>();
    a.flag = j.value("flag", std::string());
    a.off_flag = j.value("off_flag", std::string());
    if (j.contains("type")) a.kind = j.at("type").get<ArgumentKind>();
    if (j.contains("enum")) a.choices = j.at("enum").get<std::vector<std::string>>();
    a.required = j.value("required", false);
    if (j.contains("default")) a.default_value = j.at("default");
    a.description = j.value("description", std::string());
    if (a.kind == ArgumentKind::Boolean && a.flag.empty() && a.off_flag.empty()) {
        throw std::invalid_argument("boolean argument '" + a.property + "' needs a flag");
    }
    if (a.kind != ArgumentKind::Boolean && !a.off_flag.empty()) {
        throw std::invalid_argument("argument '" + a.property + "': off_flag needs type boolean");
    }
    if (a.kind != ArgumentKind::String && !a.choices.empty()) {
        throw std::invalid_argument("argument '" + a.property + "': enum needs type string");
    }
}

void from_json(const nlohmann::json& j, CommandToolSpec& t) {
    t.name = j.at("name").get<std::string>();
    t.description = j.value("description", std::string());
    if (j.contains("inputSchema")) t.input_schema = j.at("inputSchema");
    if (j.contains("command")) {
        const auto& cmd = j.at("command");
        t.command = cmd.is_string() ? std::vector<std::string>{cmd.get<std::string>()}
                                    : cmd.get<std::vector<std::string>>();
    }
    if (j.contains("arguments")) t.arguments = j.at("arguments").get<std::vector<ArgumentSpec>>();
}

} // namespace llmtools
