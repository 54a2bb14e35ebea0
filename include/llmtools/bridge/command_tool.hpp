#pragma once
#include "../types.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace llmtools {

enum class ArgumentKind {
    String,
    Integer,
    Number,
    Boolean,
    StringList,
    IntegerList,
    Json            // any JSON value, passed as one compact JSON word
};

/// How one tool argument becomes command-line words.
struct ArgumentSpec {
    std::string property;           // key in the tools/call arguments object
    std::string flag;               // e.g. "--file"; empty for a positional value
    std::string off_flag;           // Boolean only: word emitted for false, e.g. "--backup=false"
    ArgumentKind kind = ArgumentKind::String;
    std::vector<std::string> choices;   // String only: allowed values
    bool required = false;
    std::optional<nlohmann::json> default_value;
    std::string description;        // used when the input schema is generated
};

/// A tool backed by one subcommand of an external CLI.
struct CommandToolSpec {
    std::string name;
    std::string description;
    // Generated from `arguments` when the config does not provide one.
    nlohmann::json input_schema;
    std::vector<std::string> command;   // leading words, e.g. {"match-clarification"}
    std::vector<ArgumentSpec> arguments;

    ToolDefinition definition() const;
};

const char* to_string(ArgumentKind kind);

/// Build the argument vector (without the binary) for a call.
/// Throws ToolError when arguments is not an object, a required argument is
/// missing, or a value has the wrong type.
[[nodiscard]] std::vector<std::string> build_command_args(const CommandToolSpec& spec,
                                                          const nlohmann::json& arguments);

/// JSON schema describing spec.arguments.
[[nodiscard]] nlohmann::json generate_input_schema(const std::vector<ArgumentSpec>& arguments);

void from_json(const nlohmann::json& j, ArgumentKind& k);
void from_json(const nlohmann::json& j, ArgumentSpec& a);
void from_json(const nlohmann::json& j, CommandToolSpec& t);

} // namespace llmtools
