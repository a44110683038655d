#include <gtest/gtest.h>

// 放在首位：头文件须能独立编译
#include "connector/connector_utils.hpp"

#include "connector/claude_connector.hpp"
#include "connector/command_connector.hpp"
#include "connector/connector_registry.hpp"
#include "runner/runner_error.h"

namespace {

ConnectorConfig make_config(std::string command, std::vector<std::string> args = {},
                            bool available = true)
{
    ConnectorConfig cfg;
    cfg.command   = std::move(command);
    cfg.args      = std::move(args);
    cfg.available = available;
    return cfg;
}

} // namespace

TEST(ConnectorUtils, Trim) {
    EXPECT_EQ(connector_utils::trim("  hello\r\n"), "hello");
    EXPECT_EQ(connector_utils::trim("\t \r\n"), "");
    EXPECT_EQ(connector_utils::trim("a b"), "a b");
}

TEST(ConnectorUtils, ParseJsonObject) {
    EXPECT_FALSE(connector_utils::parse_json_object("plain text").has_value());
    EXPECT_FALSE(connector_utils::parse_json_object("").has_value());
    EXPECT_FALSE(connector_utils::parse_json_object("[1,2]").has_value());

    auto obj = connector_utils::parse_json_object(R"(  {"type":"assistant"} )");
    ASSERT_TRUE(obj.has_value());
    EXPECT_EQ((*obj)["type"].get<std::string>(), "assistant");

    EXPECT_THROW(connector_utils::parse_json_object("{not json"), ParseError);
}

TEST(ConnectorUtils, Classify) {
    EXPECT_EQ(connector_utils::classify(nlohmann::json{{"type", "result"}}), EventKind::Result);
    EXPECT_EQ(connector_utils::classify(nlohmann::json{{"type", "assistant"}}), EventKind::Output);
    EXPECT_EQ(connector_utils::classify(nlohmann::json{{"type", 1}}), EventKind::Output);
    EXPECT_EQ(connector_utils::classify(nlohmann::json::object()), EventKind::Output);
}

TEST(ConnectorUtils, ResolveExecutable) {
    auto sh = connector_utils::resolve_executable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_NE(sh->find('/'), std::string::npos);

    EXPECT_EQ(connector_utils::resolve_executable("/bin/sh"), std::optional<std::string>("/bin/sh"));
    EXPECT_FALSE(connector_utils::resolve_executable("definitely-not-a-cli-tool-xyz").has_value());
    EXPECT_FALSE(connector_utils::resolve_executable("/nonexistent/tool").has_value());
    // 目录不可作为可执行文件
    EXPECT_FALSE(connector_utils::resolve_executable("/bin").has_value());
    EXPECT_FALSE(connector_utils::resolve_executable("").has_value());
}

TEST(ClaudeConnector, BuildCommand) {
    ClaudeConnector c;
    ASSERT_TRUE(c.init("claude", make_config("", {"--output-format", "stream-json", "--verbose"})));
    EXPECT_EQ(c.name(), "claude");

    auto cmd = c.buildCommand("explain this repo");
    EXPECT_EQ(cmd.exe, "claude");
    std::vector<std::string> expected{"--output-format", "stream-json", "--verbose",
                                      "-p", "explain this repo"};
    EXPECT_EQ(cmd.args, expected);
}

TEST(ClaudeConnector, ParseLine) {
    ClaudeConnector c;
    ASSERT_TRUE(c.init("claude", make_config("claude")));

    auto out = c.parseLine(R"({"type":"assistant","message":"hi"})");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(out->kind, EventKind::Output);
    EXPECT_EQ(out->payload, R"({"type":"assistant","message":"hi"})");

    auto res = c.parseLine(R"({"type":"result","result":"done"}   )");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->kind, EventKind::Result);
    EXPECT_EQ(res->payload, R"({"type":"result","result":"done"})");

    EXPECT_FALSE(c.parseLine("").has_value());
    EXPECT_FALSE(c.parseLine("not json at all").has_value());
    EXPECT_NO_THROW(EXPECT_FALSE(c.parseLine("{broken").has_value()));
}

TEST(ClaudeConnector, UnavailableWhenDisabledOrMissing) {
    ClaudeConnector disabled;
    ASSERT_TRUE(disabled.init("claude", make_config("sh", {}, false)));
    EXPECT_FALSE(disabled.isAvailable());

    ClaudeConnector missing;
    ASSERT_TRUE(missing.init("claude", make_config("/nonexistent/claude")));
    EXPECT_FALSE(missing.isAvailable());

    ClaudeConnector present;
    ASSERT_TRUE(present.init("claude", make_config("sh")));
    EXPECT_TRUE(present.isAvailable());
}

TEST(CommandConnector, InitRequiresCommand) {
    CommandConnector c;
    EXPECT_FALSE(c.init("tool", make_config("")));
    EXPECT_TRUE(c.init("tool", make_config("echo")));
    EXPECT_EQ(c.name(), "tool");
}

TEST(CommandConnector, PlaceholderSubstitution) {
    CommandConnector c;
    ASSERT_TRUE(c.init("tool", make_config("tool", {"--ask", "{prompt}", "--tag={prompt}!"})));

    auto cmd = c.buildCommand("hello");
    EXPECT_EQ(cmd.exe, "tool");
    std::vector<std::string> expected{"--ask", "hello", "--tag=hello!"};
    EXPECT_EQ(cmd.args, expected);
}

TEST(CommandConnector, PromptAppendedWithoutPlaceholder) {
    CommandConnector c;
    ASSERT_TRUE(c.init("tool", make_config("tool", {"-q"})));

    auto cmd = c.buildCommand("what is {prompt}?");
    std::vector<std::string> expected{"-q", "what is {prompt}?"};
    EXPECT_EQ(cmd.args, expected);
}

TEST(CommandConnector, ParseLine) {
    CommandConnector c;
    ASSERT_TRUE(c.init("tool", make_config("tool")));

    auto text = c.parseLine("plain output\r");
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ(text->kind, EventKind::Output);
    EXPECT_EQ(text->payload, R"({"text":"plain output"})");

    auto res = c.parseLine(R"({"type":"result","value":3})");
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ(res->kind, EventKind::Result);
    EXPECT_EQ(res->payload, R"({"type":"result","value":3})");

    auto broken = c.parseLine("{oops");
    ASSERT_TRUE(broken.has_value());
    EXPECT_EQ(broken->kind, EventKind::Output);
    EXPECT_EQ(broken->payload, R"({"text":"{oops"})");

    EXPECT_FALSE(c.parseLine("   ").has_value());
}

TEST(CommandConnector, ParseLineReplacesInvalidUtf8) {
    CommandConnector c;
    ASSERT_TRUE(c.init("tool", make_config("tool")));

    std::optional<Event> ev;
    EXPECT_NO_THROW(ev = c.parseLine("caf\xE9 \xE2\x82"));
    ASSERT_TRUE(ev.has_value());
    EXPECT_EQ(ev->kind, EventKind::Output);
    EXPECT_EQ(ev->payload, "{\"text\":\"caf\xEF\xBF\xBD \xEF\xBF\xBD\"}");
}

TEST(ConnectorRegistry, BuiltinTypes) {
    ConnectorRegistry reg;
    std::vector<std::string> expected{CONNECTOR_TYPE_CLAUDE, CONNECTOR_TYPE_COMMAND};
    EXPECT_EQ(reg.types(), expected);
}

TEST(ConnectorRegistry, CreateUnknownTypeReturnsNull) {
    ConnectorRegistry reg;
    EXPECT_EQ(reg.create("NoSuchConnector", "x", make_config("sh")), nullptr);
    // CommandConnector 没有 command 时初始化失败
    EXPECT_EQ(reg.create(CONNECTOR_TYPE_COMMAND, "x", make_config("")), nullptr);
    EXPECT_NE(reg.create(CONNECTOR_TYPE_COMMAND, "x", make_config("sh")), nullptr);
}

TEST(ConnectorRegistry, GetAndAvailability) {
    ConnectorRegistry reg;
    reg.add(reg.create(CONNECTOR_TYPE_COMMAND, "shell", make_config("sh")));
    reg.add(reg.create(CONNECTOR_TYPE_COMMAND, "ghost", make_config("/nonexistent/ghost")));
    reg.add(reg.create(CONNECTOR_TYPE_COMMAND, "off", make_config("sh", {}, false)));

    EXPECT_EQ(reg.get("shell")->name(), "shell");
    EXPECT_THROW(reg.get("ghost"), ConnectorError);
    EXPECT_THROW(reg.get("off"), ConnectorError);
    EXPECT_THROW(reg.get("missing"), ConnectorError);

    std::vector<std::string> available{"shell"};
    EXPECT_EQ(reg.available(), available);
    std::vector<std::string> all{"ghost", "off", "shell"};
    EXPECT_EQ(reg.list(), all);
}

TEST(ConnectorRegistry, AddReplacesSameName) {
    ConnectorRegistry reg;
    reg.add(reg.create(CONNECTOR_TYPE_COMMAND, "tool", make_config("/nonexistent/tool")));
    EXPECT_THROW(reg.get("tool"), ConnectorError);
    reg.add(reg.create(CONNECTOR_TYPE_COMMAND, "tool", make_config("sh")));
    EXPECT_NO_THROW(reg.get("tool"));
    EXPECT_EQ(reg.list().size(), 1u);
}

TEST(ConnectorRegistry, SetupFromConfig) {
    auto cfg = Config::fromString(R"(
claude_config:
  command: /nonexistent/claude
  args: ["--output-format", "stream-json"]
echo_config:
  command: sh
  args: ["-c", "echo {prompt}"]
broken_config:
  available: true
)");
    std::vector<ConnectorEntry> entries{
        {"claude", CONNECTOR_TYPE_CLAUDE,  "claude_config"},
        {"echo",   CONNECTOR_TYPE_COMMAND, "echo_config"},
        {"broken", CONNECTOR_TYPE_COMMAND, "broken_config"},
        {"weird",  "UnknownConnector",     "echo_config"},
    };

    ConnectorRegistry reg;
    reg.setupFromConfig(cfg, entries);

    std::vector<std::string> all{"claude", "echo"};
    EXPECT_EQ(reg.list(), all);
    std::vector<std::string> available{"echo"};
    EXPECT_EQ(reg.available(), available);

    auto cmd = reg.get("echo")->buildCommand("hi");
    EXPECT_EQ(cmd.exe, "sh");
    std::vector<std::string> expected{"-c", "echo hi"};
    EXPECT_EQ(cmd.args, expected);
}

TEST(ConnectorRegistry, SetupFromConfigDefaultsClaudeCommand) {
    auto cfg = Config::empty();
    ConnectorRegistry reg;
    reg.setupFromConfig(cfg, {{"claude", CONNECTOR_TYPE_CLAUDE, "claude_config"}});

    std::vector<std::string> all{"claude"};
    EXPECT_EQ(reg.list(), all);
}
