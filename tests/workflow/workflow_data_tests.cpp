#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "workflow/workflow_data.hpp"

using namespace warden::workflow;
using json = nlohmann::json;

TEST(WorkflowDataTests, Parse_Defaults)
{
    auto result = parse_workflow_data({{"on", "schedule"}}, ".github/workflows/daily-report.md");
    ASSERT_TRUE(result.success) << result.error;
    const auto& data = result.data;
    EXPECT_EQ(data.workflow_id, "daily-report");
    EXPECT_EQ(data.name, "daily-report");
    EXPECT_EQ(data.engine.id, "copilot");
    EXPECT_FALSE(data.permissions.has_value());
    EXPECT_FALSE(data.safe_outputs.has_value());
    EXPECT_EQ(data.roles, (std::vector<std::string>{"admin", "maintainer", "write"}));
    EXPECT_EQ(data.timeout_minutes, 20);
}

TEST(WorkflowDataTests, Triggers_ListAndMap)
{
    auto list = parse_workflow_data({{"on", json::array({"push", "workflow_dispatch"})}}, "ci.md");
    ASSERT_TRUE(list.success);
    EXPECT_EQ(list.data.triggers, (std::vector<std::string>{"push", "workflow_dispatch"}));

    auto map = parse_workflow_data({{"on", {
        {"issues", {{"types", json::array({"opened"})}}},
        {"reaction", "+1"},
        {"stop-after", "+24h"},
        {"roles", json::array({"admin"})},
    }}}, "triage.md");
    ASSERT_TRUE(map.success);
    EXPECT_EQ(map.data.triggers, (std::vector<std::string>{"issues"}));
    EXPECT_EQ(map.data.reaction, "+1");
    EXPECT_EQ(map.data.stop_time, "+24h");
    EXPECT_EQ(map.data.roles, (std::vector<std::string>{"admin"}));
    EXPECT_TRUE(map.data.has_trigger("issue"));
    EXPECT_FALSE(map.data.has_trigger("pull_request"));
}

TEST(WorkflowDataTests, Triggers_CommandDefaultsToWorkflowId)
{
    auto result = parse_workflow_data({{"on", {{"command", nullptr}}}}, "triage-bot.md");
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.data.is_command_trigger());
    EXPECT_EQ(result.data.command, (std::vector<std::string>{"triage-bot"}));

    auto named = parse_workflow_data({{"on", {{"slash_command", {{"name", "fix"}}}}}}, "bot.md");
    ASSERT_TRUE(named.success);
    EXPECT_EQ(named.data.command, (std::vector<std::string>{"fix"}));
}

TEST(WorkflowDataTests, Triggers_InvalidType)
{
    auto result = parse_workflow_data({{"on", 42}}, "x.md");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "'on' must be a string, list or map");
}

TEST(WorkflowDataTests, Engine_MapForm)
{
    auto result = parse_workflow_data({
        {"on", "schedule"},
        {"engine", {
            {"id", "claude"},
            {"model", "claude-sonnet-4"},
            {"version", 2},
            {"max-turns", 10},
            {"env", {{"DEBUG", true}}},
            {"concurrency", {{"group", "agents"}}},
        }},
    }, "x.md");
    ASSERT_TRUE(result.success) << result.error;
    const auto& engine = result.data.engine;
    EXPECT_EQ(engine.id, "claude");
    EXPECT_EQ(engine.model, "claude-sonnet-4");
    EXPECT_EQ(engine.version, "2");
    EXPECT_EQ(engine.max_turns, 10);
    EXPECT_EQ(engine.env.at("DEBUG"), "true");
    EXPECT_EQ(engine.concurrency, "agents");
}

TEST(WorkflowDataTests, Engine_StepsMustBeArray)
{
    auto result = parse_workflow_data({{"on", "schedule"}, {"engine", {{"id", "custom"}, {"steps", "run"}}}}, "x.md");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "engine.steps must be an array");
}

TEST(WorkflowDataTests, Permissions_Parsed)
{
    auto result = parse_workflow_data({{"on", "schedule"}, {"permissions", {{"issues", "write"}}}}, "x.md");
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.data.permissions.has_value());
    EXPECT_EQ(result.data.permissions->render(), "issues: write");

    auto invalid = parse_workflow_data({{"on", "schedule"}, {"permissions", 7}}, "x.md");
    EXPECT_FALSE(invalid.success);
}

TEST(WorkflowDataTests, Tools_GithubToolsets)
{
    auto result = parse_workflow_data({
        {"on", "schedule"},
        {"tools", {{"github", {{"toolsets", json::array({"repos", "actions"})}, {"read-only", false}}}}},
    }, "x.md");
    ASSERT_TRUE(result.success);
    ASSERT_TRUE(result.data.github_tool.has_value());
    EXPECT_EQ(result.data.github_tool->toolsets, (std::vector<std::string>{"repos", "actions"}));
    EXPECT_FALSE(result.data.github_tool->read_only);

    auto disabled = parse_workflow_data({{"on", "schedule"}, {"tools", {{"github", false}}}}, "x.md");
    ASSERT_TRUE(disabled.success);
    EXPECT_FALSE(disabled.data.github_tool.has_value());
}

TEST(WorkflowDataTests, SafeOutputs_ErrorsPropagate)
{
    auto result = parse_workflow_data({
        {"on", "schedule"},
        {"safe-outputs", {{"create-issue", {{"target-repo", "*"}}}}},
    }, "x.md");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("target-repo"), std::string::npos);
}

TEST(WorkflowDataTests, Jobs_MustBeMap)
{
    auto result = parse_workflow_data({{"on", "schedule"}, {"jobs", json::array()}}, "x.md");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "'jobs' must be a map");
}

TEST(WorkflowDataTests, Frontmatter_MustBeMap)
{
    auto result = parse_workflow_data(json::array(), "x.md");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "frontmatter must be a map");
}
