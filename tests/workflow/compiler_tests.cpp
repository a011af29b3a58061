#include <gtest/gtest.h>
#include <algorithm>
#include <nlohmann/json.hpp>
#include "workflow/compiler.hpp"

using namespace warden::workflow;
using json = nlohmann::json;

namespace {

WorkflowData parse(const json& frontmatter)
{
    auto parsed = parse_workflow_data(frontmatter, "/tmp/warden/research.md", "Summarize open issues.");
    EXPECT_TRUE(parsed.success) << parsed.error;
    return parsed.data;
}

CompileResult compile(const json& frontmatter, ActionMode mode = ActionMode::RELEASE)
{
    CompilerConfig config;
    config.action_mode = mode;
    return Compiler(config).compile(parse(frontmatter));
}

bool has_step(const Job& job, const std::string& name)
{
    return std::any_of(job.steps.begin(), job.steps.end(), [&](const json& step) {
        return step.value("name", "") == name;
    });
}

} // namespace

// =============================================================================
// Main job permissions
// =============================================================================

TEST(CompilerTests, Permissions_ExplicitShorthandPreserved)
{
    auto result = compile({{"on", "schedule"}, {"permissions", "read-all"}});
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.workflow.jobs.get_job("agent")->permissions.render(), "read-all");
}

TEST(CompilerTests, Permissions_ExplicitEmptyPreservedInDevMode)
{
    auto result = compile({{"on", "schedule"}, {"permissions", json::object()}}, ActionMode::DEV);
    ASSERT_TRUE(result.success) << result.error;
    const Job* agent = result.workflow.jobs.get_job("agent");
    EXPECT_EQ(agent->permissions.render(), "{}");
    EXPECT_FALSE(has_step(*agent, "Checkout repository"));
}

TEST(CompilerTests, Permissions_ExplicitMapPreserved)
{
    auto result = compile({{"on", "schedule"}, {"permissions", {{"contents", "read"}, {"issues", "read"}}}});
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.workflow.jobs.get_job("agent")->permissions.render(), "contents: read\nissues: read");
}

TEST(CompilerTests, Permissions_DefaultDependsOnActionMode)
{
    auto dev = compile({{"on", "schedule"}}, ActionMode::DEV);
    ASSERT_TRUE(dev.success) << dev.error;
    EXPECT_EQ(dev.workflow.jobs.get_job("agent")->permissions.render(), "contents: read");

    auto release = compile({{"on", "schedule"}});
    ASSERT_TRUE(release.success) << release.error;
    EXPECT_TRUE(release.workflow.jobs.get_job("agent")->permissions.empty());
}

TEST(CompilerTests, Permissions_EmptySetsAreEmittedExplicitly)
{
    auto result = compile({
        {"on", {{"issues", json::object()}}},
        {"engine", "copilot"},
        {"safe-outputs", {{"close-issue", nullptr}}},
    });
    ASSERT_TRUE(result.success) << result.error;

    auto compiled = result.workflow.to_json();
    ASSERT_TRUE(compiled.contains("permissions"));
    EXPECT_EQ(compiled["permissions"], json::object());

    for (const auto& job : compiled["jobs"]) {
        ASSERT_TRUE(job.contains("permissions")) << job["name"];
    }
    EXPECT_EQ(result.workflow.jobs.get_job("agent")->to_json()["permissions"], json::object());
    EXPECT_EQ(result.workflow.jobs.get_job("pre_activation")->to_json()["permissions"], json::object());
    EXPECT_EQ(result.workflow.jobs.get_job("close_issue")->to_json()["permissions"],
              (json{{"contents", "read"}, {"issues", "write"}}));
}

TEST(CompilerTests, Permissions_CheckoutOnlyWithContentsRead)
{
    auto readable = compile({{"on", "schedule"}, {"permissions", {{"contents", "read"}}}});
    ASSERT_TRUE(readable.success) << readable.error;
    EXPECT_TRUE(has_step(*readable.workflow.jobs.get_job("agent"), "Checkout repository"));

    auto unreadable = compile({{"on", "schedule"}});
    ASSERT_TRUE(unreadable.success) << unreadable.error;
    EXPECT_FALSE(has_step(*unreadable.workflow.jobs.get_job("agent"), "Checkout repository"));
}

// =============================================================================
// Pre-activation
// =============================================================================

TEST(CompilerTests, PreActivation_SkippedForTrustedTriggers)
{
    auto result = compile({{"on", json::array({"schedule", "workflow_dispatch"})}});
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_FALSE(result.workflow.jobs.has_job("pre_activation"));
    EXPECT_TRUE(result.workflow.jobs.get_job("activation")->needs.empty());
}

TEST(CompilerTests, PreActivation_ReactionAddsWritePermission)
{
    auto result = compile({{"on", {{"issues", {{"types", json::array({"opened"})}}}, {"reaction", "eyes"}}}});
    ASSERT_TRUE(result.success) << result.error;

    const Job* pre = result.workflow.jobs.get_job("pre_activation");
    ASSERT_NE(pre, nullptr);
    EXPECT_EQ(pre->permissions.render(), "issues: write");
    EXPECT_TRUE(has_step(*pre, "Add eyes reaction to the triggering item"));
    EXPECT_TRUE(has_step(*pre, "Check team membership for workflow"));
    EXPECT_EQ(pre->runs_on, "ubuntu-slim");
}

TEST(CompilerTests, PreActivation_PullRequestReaction)
{
    auto result = compile({{"on", {{"pull_request", nullptr}, {"reaction", "rocket"}}}}, ActionMode::DEV);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.workflow.jobs.get_job("pre_activation")->permissions.render(),
              "contents: read\npull-requests: write");
}

TEST(CompilerTests, PreActivation_NoReactionStepForNone)
{
    auto result = compile({{"on", {{"issues", nullptr}, {"reaction", "none"}}}});
    ASSERT_TRUE(result.success) << result.error;
    const Job* pre = result.workflow.jobs.get_job("pre_activation");
    ASSERT_NE(pre, nullptr);
    EXPECT_TRUE(pre->permissions.empty());
    EXPECT_FALSE(has_step(*pre, "Add none reaction to the triggering item"));
}

TEST(CompilerTests, PreActivation_StopTimeGate)
{
    auto result = compile({{"on", {{"schedule", nullptr}, {"stop-after", "+48h"}}}});
    ASSERT_TRUE(result.success) << result.error;
    const Job* pre = result.workflow.jobs.get_job("pre_activation");
    ASSERT_NE(pre, nullptr);
    EXPECT_TRUE(has_step(*pre, "Check stop-time limit"));
    EXPECT_EQ(pre->outputs.at("activated"), "${{ steps.check_stop_time.outputs.stop_time_ok == 'true' }}");
}

TEST(CompilerTests, PreActivation_CustomStepsAndOutputs)
{
    auto result = compile({
        {"on", "schedule"},
        {"jobs", {{"pre-activation", {
            {"steps", json::array({{{"name", "Probe"}, {"run", "echo ok"}}})},
            {"outputs", {{"probe", "${{ steps.probe.outputs.value }}"}, {"activated", "false"}}},
        }}}},
    });
    ASSERT_TRUE(result.success) << result.error;
    const Job* pre = result.workflow.jobs.get_job("pre_activation");
    ASSERT_NE(pre, nullptr);
    EXPECT_TRUE(has_step(*pre, "Probe"));
    EXPECT_EQ(pre->outputs.at("probe"), "${{ steps.probe.outputs.value }}");
    EXPECT_EQ(pre->outputs.at("activated"), "true");
}

TEST(CompilerTests, PreActivation_MalformedStepsFail)
{
    auto result = compile({{"on", "schedule"}, {"jobs", {{"pre-activation", {{"steps", "echo"}}}}}});
    ASSERT_FALSE(result.success);
    EXPECT_NE(result.error.find("must be an array"), std::string::npos);
}

TEST(CompilerTests, CustomFields_Extraction)
{
    EXPECT_TRUE(extract_pre_activation_custom_fields(json::object()).success);

    auto not_object = extract_pre_activation_custom_fields({{"pre_activation", "x"}});
    EXPECT_FALSE(not_object.success);
    EXPECT_EQ(not_object.error, "jobs.pre-activation must be an object");

    auto bad_outputs = extract_pre_activation_custom_fields({{"pre-activation", {{"outputs", json::array()}}}});
    EXPECT_FALSE(bad_outputs.success);
    EXPECT_EQ(bad_outputs.error, "jobs.pre-activation.outputs must be an object");

    auto bad_value = extract_pre_activation_custom_fields({{"pre-activation", {{"outputs", {{"n", 3}}}}}});
    EXPECT_FALSE(bad_value.success);
    EXPECT_EQ(bad_value.error, "jobs.pre-activation.outputs.n must be a string");
}

TEST(CompilerTests, PermissionCheck_RolesAllDisablesCheck)
{
    auto data = parse({{"on", {{"issues", nullptr}, {"roles", "all"}}}});
    EXPECT_FALSE(needs_permission_check(data));
    EXPECT_FALSE(needs_pre_activation(data));

    auto command = parse({{"on", {{"command", {{"name", "triage"}}}}}});
    EXPECT_TRUE(needs_permission_check(command));
}

// =============================================================================
// Activation and graph
// =============================================================================

TEST(CompilerTests, Activation_WorkflowRunGuardsForks)
{
    auto result = compile({{"on", {{"workflow_run", {{"workflows", json::array({"CI"})}}}}}, {"if", "github.actor != 'bot'"}});
    ASSERT_TRUE(result.success) << result.error;
    const Job* activation = result.workflow.jobs.get_job("activation");
    ASSERT_NE(activation, nullptr);
    EXPECT_NE(activation->condition.find("github.repository_id"), std::string::npos);
    EXPECT_NE(activation->condition.find("github.actor != 'bot'"), std::string::npos);
    EXPECT_TRUE(has_step(*activation, "Validate workflow_run repository"));
}

TEST(CompilerTests, Graph_SafeOutputJobsDependOnAgent)
{
    auto result = compile({
        {"on", {{"issues", nullptr}}},
        {"safe-outputs", {{"create-issue", nullptr}, {"add-comment", nullptr}, {"close-issue", nullptr}}},
    });
    ASSERT_TRUE(result.success) << result.error;
    const auto& jobs = result.workflow.jobs;
    for (const char* name : {"create_issue", "add_comment", "close_issue"}) {
        ASSERT_TRUE(jobs.has_job(name)) << name;
        EXPECT_TRUE(jobs.depends_on(name, "agent")) << name;
        EXPECT_TRUE(jobs.depends_on(name, "activation")) << name;
    }
    const Job* agent = jobs.get_job("agent");
    EXPECT_EQ(agent->outputs.count("output_types"), 1u);
    EXPECT_TRUE(has_step(*agent, "Ingest agent output"));
}

TEST(CompilerTests, Graph_CustomJobs)
{
    auto result = compile({
        {"on", "schedule"},
        {"jobs", {{"report", {{"needs", "agent"}, {"steps", json::array({{{"run", "echo done"}}})}}}}},
    });
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_TRUE(result.workflow.jobs.depends_on("report", "agent"));

    auto broken = compile({{"on", "schedule"}, {"jobs", {{"report", {{"needs", "missing"}}}}}});
    ASSERT_FALSE(broken.success);
    EXPECT_EQ(broken.error, "job 'report' needs unknown job 'missing'");
}

TEST(CompilerTests, Compile_UnknownEngine)
{
    auto result = compile({{"on", "schedule"}, {"engine", "gemini"}});
    ASSERT_FALSE(result.success);
    EXPECT_NE(result.error.find("unknown engine 'gemini'"), std::string::npos);
}

TEST(CompilerTests, Compile_SelfDispatchRejected)
{
    auto result = compile({{"on", "schedule"}, {"safe-outputs", {{"dispatch-workflow", json::array({"research"})}}}});
    ASSERT_FALSE(result.success);
    EXPECT_NE(result.error.find("self-reference not allowed"), std::string::npos);
}

TEST(CompilerTests, Compile_IsDeterministic)
{
    json frontmatter = {
        {"on", {{"issues", nullptr}, {"reaction", "eyes"}}},
        {"permissions", {{"contents", "read"}}},
        {"tools", {{"github", {{"toolsets", json::array({"default"})}}}}},
        {"safe-outputs", {{"create-issue", nullptr}, {"missing-tool", nullptr}}},
    };
    auto first = compile(frontmatter);
    auto second = compile(frontmatter);
    ASSERT_TRUE(first.success) << first.error;
    ASSERT_TRUE(second.success) << second.error;
    EXPECT_EQ(first.workflow.to_json().dump(), second.workflow.to_json().dump());
}

TEST(CompilerTests, Concurrency_CommandTriggerUsesThreadGroup)
{
    auto data = parse({{"on", {{"command", {{"name", "triage"}}}}}});
    auto result = Compiler(CompilerConfig{}).compile(data);
    ASSERT_TRUE(result.success) << result.error;
    EXPECT_EQ(result.workflow.concurrency.group, build_group(data, true));
    EXPECT_FALSE(result.workflow.concurrency.cancel_in_progress);
    EXPECT_TRUE(result.workflow.jobs.get_job("agent")->concurrency_group.empty());
}

TEST(CompilerTests, McpServers_ExpandDefaultToolsets)
{
    auto data = parse({{"on", "schedule"}, {"tools", {{"github", {{"toolsets", json::array({"default"})}}}}}});
    Compiler compiler(CompilerConfig{});
    auto servers = compiler.mcp_servers(data, Permissions::shorthand("read-all"));
    EXPECT_TRUE(servers.github);
    EXPECT_FALSE(servers.safe_outputs);
    EXPECT_NE(std::find(servers.github_toolsets.begin(), servers.github_toolsets.end(), "repos"),
              servers.github_toolsets.end());
}
