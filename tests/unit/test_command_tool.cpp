#include <gtest/gtest.h>
#include "llmtools/bridge/command_tool.hpp"
#include "llmtools/error.hpp"

using namespace llmtools;

namespace {

using Args = std::vector<std::string>;

CommandToolSpec match_spec() {
    return nlohmann::json::parse(R"({
        "name": "llm_clarify_match",
        "description": "Match a question",
        "command": ["match-clarification"],
        "arguments": [
            {"property": "question", "flag": "--question", "required": true, "description": "The question"},
            {"property": "timeout", "flag": "--timeout", "type": "integer"},
            {"property": "force", "flag": "--force", "type": "boolean"},
            {"property": "json", "flag": "--json", "type": "boolean", "default": true},
            {"property": "tags", "flag": "--tag", "type": "string_list"}
        ]
    })").get<CommandToolSpec>();
}

} // anonymous namespace

TEST(CommandToolSpec, FromJson) {
    auto spec = match_spec();
    EXPECT_EQ(spec.name, "llm_clarify_match");
    EXPECT_EQ(spec.command, Args{"match-clarification"});
    ASSERT_EQ(spec.arguments.size(), 5u);
    EXPECT_EQ(spec.arguments[1].kind, ArgumentKind::Integer);
    EXPECT_EQ(spec.arguments[4].kind, ArgumentKind::StringList);
    EXPECT_TRUE(spec.arguments[0].required);
    ASSERT_TRUE(spec.arguments[3].default_value.has_value());
    EXPECT_EQ(*spec.arguments[3].default_value, true);
}

TEST(CommandToolSpec, CommandMayBeString) {
    auto spec = nlohmann::json{{"name", "t"}, {"command", "list-entries"}}.get<CommandToolSpec>();
    EXPECT_EQ(spec.command, Args{"list-entries"});
}

TEST(CommandToolSpec, UnknownTypeRejected) {
    auto j = nlohmann::json::parse(R"({"property": "x", "type": "float"})");
    EXPECT_THROW(j.get<ArgumentSpec>(), std::invalid_argument);
}

TEST(CommandToolSpec, BooleanNeedsFlag) {
    auto j = nlohmann::json::parse(R"({"property": "x", "type": "boolean"})");
    EXPECT_THROW(j.get<ArgumentSpec>(), std::invalid_argument);
}

TEST(CommandToolSpec, GeneratedSchema) {
    auto def = match_spec().definition();
    EXPECT_EQ(def.name, "llm_clarify_match");
    const auto& schema = def.input_schema;
    EXPECT_EQ(schema["type"], "object");
    EXPECT_EQ(schema["properties"]["question"]["type"], "string");
    EXPECT_EQ(schema["properties"]["question"]["description"], "The question");
    EXPECT_EQ(schema["properties"]["timeout"]["type"], "integer");
    EXPECT_EQ(schema["properties"]["force"]["type"], "boolean");
    EXPECT_EQ(schema["properties"]["json"]["default"], true);
    EXPECT_EQ(schema["properties"]["tags"]["type"], "array");
    EXPECT_EQ(schema["properties"]["tags"]["items"]["type"], "string");
    EXPECT_EQ(schema["required"], nlohmann::json::array({"question"}));
}

TEST(CommandToolSpec, ExplicitSchemaPassedThrough) {
    auto spec = nlohmann::json::parse(R"({
        "name": "t", "command": ["x"],
        "inputSchema": {"type": "object", "properties": {"p": {"type": "string"}}},
        "arguments": [{"property": "p", "flag": "--p"}]
    })").get<CommandToolSpec>();
    EXPECT_FALSE(spec.definition().input_schema.contains("required"));
    EXPECT_EQ(spec.definition().input_schema["properties"]["p"]["type"], "string");
}

TEST(CommandToolSpec, ArgumentKindNames) {
    EXPECT_STREQ(to_string(ArgumentKind::String), "string");
    EXPECT_STREQ(to_string(ArgumentKind::StringList), "string_list");
    EXPECT_STREQ(to_string(ArgumentKind::IntegerList), "integer_list");
    EXPECT_STREQ(to_string(ArgumentKind::Json), "json");
}

// ---- build_command_args ----

TEST(BuildCommandArgs, RequiredAndDefaults) {
    auto argv = build_command_args(match_spec(), {{"question", "why?"}});
    EXPECT_EQ(argv, (Args{"match-clarification", "--question", "why?", "--json"}));
}

TEST(BuildCommandArgs, AllKinds) {
    auto argv = build_command_args(match_spec(), {
        {"question", "q"}, {"timeout", 30}, {"force", true}, {"json", false},
        {"tags", {"a", "b"}}
    });
    EXPECT_EQ(argv, (Args{"match-clarification", "--question", "q", "--timeout", "30",
                          "--force", "--tag", "a", "--tag", "b"}));
}

TEST(BuildCommandArgs, FollowsArgumentOrderNotObjectOrder) {
    auto argv = build_command_args(match_spec(), {{"timeout", 5}, {"question", "q"}});
    EXPECT_EQ(argv, (Args{"match-clarification", "--question", "q", "--timeout", "5", "--json"}));
}

TEST(BuildCommandArgs, IntegralFloatAccepted) {
    auto argv = build_command_args(match_spec(), {{"question", "q"}, {"timeout", 30.0}});
    EXPECT_EQ(argv[3], "--timeout");
    EXPECT_EQ(argv[4], "30");
}

TEST(BuildCommandArgs, NegativeInteger) {
    auto argv = build_command_args(match_spec(), {{"question", "q"}, {"timeout", -2}});
    EXPECT_EQ(argv[4], "-2");
}

TEST(BuildCommandArgs, NullTreatedAsAbsent) {
    auto argv = build_command_args(match_spec(), {{"question", "q"}, {"timeout", nullptr}});
    EXPECT_EQ(argv, (Args{"match-clarification", "--question", "q", "--json"}));
}

TEST(BuildCommandArgs, UnknownPropertiesIgnored) {
    auto argv = build_command_args(match_spec(), {{"question", "q"}, {"extra", 1}});
    EXPECT_EQ(argv.size(), 4u);
}

TEST(BuildCommandArgs, MissingRequired) {
    try {
        (void)build_command_args(match_spec(), nlohmann::json::object());
        FAIL() << "expected ToolError";
    } catch (const ToolError& e) {
        EXPECT_STREQ(e.what(), "missing required argument 'question'");
    }
}

TEST(BuildCommandArgs, TypeMismatches) {
    EXPECT_THROW((void)build_command_args(match_spec(), {{"question", 1}}), ToolError);
    EXPECT_THROW((void)build_command_args(match_spec(), {{"question", "q"}, {"timeout", "30"}}), ToolError);
    EXPECT_THROW((void)build_command_args(match_spec(), {{"question", "q"}, {"timeout", 1.5}}), ToolError);
    EXPECT_THROW((void)build_command_args(match_spec(), {{"question", "q"}, {"force", "yes"}}), ToolError);
    EXPECT_THROW((void)build_command_args(match_spec(), {{"question", "q"}, {"tags", "a"}}), ToolError);
    EXPECT_THROW((void)build_command_args(match_spec(), {{"question", "q"}, {"tags", {"a", 1}}}), ToolError);
}

TEST(BuildCommandArgs, ArgumentsMustBeObject) {
    EXPECT_THROW((void)build_command_args(match_spec(), nlohmann::json::array()), ToolError);
}

TEST(BuildCommandArgs, Positional) {
    auto spec = nlohmann::json::parse(R"({
        "name": "grep", "command": ["search"],
        "arguments": [
            {"property": "pattern", "required": true},
            {"property": "paths", "type": "string_list"},
            {"property": "limit", "flag": "-n", "type": "integer"}
        ]
    })").get<CommandToolSpec>();
    auto argv = build_command_args(spec, {{"pattern", "foo"}, {"paths", {"a", "b"}}, {"limit", 3}});
    EXPECT_EQ(argv, (Args{"search", "foo", "a", "b", "-n", "3"}));
}

TEST(BuildCommandArgs, NullArgumentsUseDefaultsOnly) {
    auto spec = nlohmann::json::parse(R"({
        "name": "t", "command": ["list"],
        "arguments": [{"property": "min", "flag": "--min", "type": "boolean", "default": true}]
    })").get<CommandToolSpec>();
    EXPECT_EQ(build_command_args(spec, nullptr), (Args{"list", "--min"}));
}

// ---- Number, integer list, JSON, off flags, choices ----

namespace {

CommandToolSpec edit_spec() {
    return nlohmann::json::parse(R"({
        "name": "edit", "command": ["safe-edit"],
        "arguments": [
            {"property": "path", "flag": "--path", "required": true},
            {"property": "mode", "flag": "--mode", "enum": ["insert", "delete"]},
            {"property": "score", "flag": "--score", "type": "number"},
            {"property": "lines", "flag": "--lines", "type": "integer_list"},
            {"property": "edits", "flag": "--edits", "type": "json"},
            {"property": "backup", "off_flag": "--backup=false", "type": "boolean", "default": true}
        ]
    })").get<CommandToolSpec>();
}

} // anonymous namespace

TEST(BuildCommandArgs, OffFlagOnlyForFalse) {
    EXPECT_EQ(build_command_args(edit_spec(), {{"path", "f"}}), (Args{"safe-edit", "--path", "f"}));
    EXPECT_EQ(build_command_args(edit_spec(), {{"path", "f"}, {"backup", true}}),
              (Args{"safe-edit", "--path", "f"}));
    EXPECT_EQ(build_command_args(edit_spec(), {{"path", "f"}, {"backup", false}}),
              (Args{"safe-edit", "--path", "f", "--backup=false"}));
}

TEST(BuildCommandArgs, NumberKeepsFraction) {
    auto argv = build_command_args(edit_spec(), {{"path", "f"}, {"score", 0.5}});
    EXPECT_EQ(argv, (Args{"safe-edit", "--path", "f", "--score", "0.5"}));
    argv = build_command_args(edit_spec(), {{"path", "f"}, {"score", 3}});
    EXPECT_EQ(argv.back(), "3");
    EXPECT_THROW((void)build_command_args(edit_spec(), {{"path", "f"}, {"score", "0.5"}}), ToolError);
}

TEST(BuildCommandArgs, IntegerListRepeatsFlag) {
    auto argv = build_command_args(edit_spec(), {{"path", "f"}, {"lines", {1, 4.0}}});
    EXPECT_EQ(argv, (Args{"safe-edit", "--path", "f", "--lines", "1", "--lines", "4"}));
    EXPECT_THROW((void)build_command_args(edit_spec(), {{"path", "f"}, {"lines", {1, 2.5}}}), ToolError);
    EXPECT_THROW((void)build_command_args(edit_spec(), {{"path", "f"}, {"lines", 1}}), ToolError);
}

TEST(BuildCommandArgs, JsonPassedAsOneWord) {
    auto edits = nlohmann::json::parse(R"([{"old":"a b","new":"c"}])");
    auto argv = build_command_args(edit_spec(), {{"path", "f"}, {"edits", edits}});
    ASSERT_EQ(argv.size(), 5u);
    EXPECT_EQ(argv[3], "--edits");
    EXPECT_EQ(nlohmann::json::parse(argv[4]), edits);
}

TEST(BuildCommandArgs, ChoicesEnforced) {
    auto argv = build_command_args(edit_spec(), {{"path", "f"}, {"mode", "delete"}});
    EXPECT_EQ(argv.back(), "delete");
    try {
        (void)build_command_args(edit_spec(), {{"path", "f"}, {"mode", "append"}});
        FAIL() << "expected ToolError";
    } catch (const ToolError& e) {
        EXPECT_STREQ(e.what(), "argument 'mode' must be one of: insert, delete");
    }
}

TEST(CommandToolSpec, SchemaForExtendedKinds) {
    auto schema = edit_spec().definition().input_schema;
    EXPECT_EQ(schema["properties"]["mode"]["enum"], nlohmann::json::array({"insert", "delete"}));
    EXPECT_EQ(schema["properties"]["score"]["type"], "number");
    EXPECT_EQ(schema["properties"]["lines"]["items"]["type"], "integer");
    EXPECT_TRUE(schema["properties"]["edits"].is_object());
    EXPECT_FALSE(schema["properties"]["edits"].contains("type"));
    EXPECT_EQ(schema["properties"]["backup"]["default"], true);
}

TEST(CommandToolSpec, ExtendedFieldsValidated) {
    EXPECT_THROW(nlohmann::json::parse(R"({"property": "x", "off_flag": "--x=false"})").get<ArgumentSpec>(),
                 std::invalid_argument);
    EXPECT_THROW(nlohmann::json::parse(R"({"property": "x", "type": "integer", "enum": ["1"]})").get<ArgumentSpec>(),
                 std::invalid_argument);
    EXPECT_NO_THROW(nlohmann::json::parse(R"({"property": "x", "type": "boolean", "off_flag": "--x=false"})").get<ArgumentSpec>());
}
