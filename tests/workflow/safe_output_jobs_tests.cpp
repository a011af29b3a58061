#include <gtest/gtest.h>
#include <algorithm>
#include <nlohmann/json.hpp>
#include "workflow/safe_output_jobs.hpp"

using namespace warden::workflow;
using json = nlohmann::json;

namespace {

WorkflowData workflow_with(const json& safe_outputs)
{
    WorkflowData data;
    data.name = "Weekly Research";
    data.workflow_id = "research";
    data.triggers = {"schedule"};
    auto parsed = parse_safe_outputs(safe_outputs);
    EXPECT_TRUE(parsed.success) << parsed.error;
    data.safe_outputs = parsed.config;
    return data;
}

const Job* find_job(const std::vector<Job>& jobs, const std::string& name)
{
    auto it = std::find_if(jobs.begin(), jobs.end(), [&](const Job& job) { return job.name == name; });
    return it == jobs.end() ? nullptr : &*it;
}

bool has_step_named(const Job& job, const std::string& name)
{
    return std::any_of(job.steps.begin(), job.steps.end(), [&](const json& step) {
        return step.value("name", "") == name;
    });
}

} // namespace

TEST(SafeOutputJobsTests, JobsFollowCatalogOrder)
{
    auto data = workflow_with(json{
        {"missing-tool", nullptr},
        {"add-comment", nullptr},
        {"close-issue", nullptr},
        {"create-issue", nullptr},
        {"create-code-scanning-alert", nullptr},
    });
    CompilerConfig config;
    auto jobs = build_safe_output_jobs({data, config});

    std::vector<std::string> names;
    for (const auto& job : jobs) names.push_back(job.name);
    EXPECT_EQ(names, (std::vector<std::string>{"create_issue", "add_comment", "close_issue",
                                               "create_code_scanning_alert", "missing_tool"}));
    EXPECT_EQ(names, data.safe_outputs->enabled_types());
}

TEST(SafeOutputJobsTests, EveryJobNeedsAgentAndIsGatedOnItsType)
{
    auto data = workflow_with(json{
        {"create-discussion", nullptr},
        {"dispatch-workflow", json::array({"deploy"})},
        {"assign-to-agent", nullptr},
        {"missing-data", nullptr},
    });
    CompilerConfig config;
    for (const auto& job : build_safe_output_jobs({data, config})) {
        ASSERT_FALSE(job.needs.empty());
        EXPECT_EQ(job.needs.front(), "agent") << job.name;
        EXPECT_NE(job.condition.find("contains(needs.agent.outputs.output_types, '" + job.name + "')"),
                  std::string::npos) << job.name;
        EXPECT_NE(job.condition.find("!cancelled()"), std::string::npos);
    }
}

TEST(SafeOutputJobsTests, MinimalPermissionsPerKind)
{
    auto data = workflow_with(json{
        {"create-issue", nullptr},
        {"create-pull-request", nullptr},
        {"dispatch-workflow", json::array({"deploy"})},
        {"create-code-scanning-alert", nullptr},
    });
    data.permissions = Permissions::shorthand("write-all");
    CompilerConfig config;
    auto jobs = build_safe_output_jobs({data, config});

    EXPECT_EQ(find_job(jobs, "create_issue")->permissions.render(), "contents: read\nissues: write");
    EXPECT_EQ(find_job(jobs, "create_pull_request")->permissions.render(),
              "contents: write\npull-requests: write");
    EXPECT_EQ(find_job(jobs, "dispatch_workflow")->permissions.render(), "actions: write");
    EXPECT_EQ(find_job(jobs, "create_code_scanning_alert")->permissions.render(),
              "actions: read\ncontents: read\nsecurity-events: write");
}

TEST(SafeOutputJobsTests, DevModeAddsContentsReadForActionsCheckout)
{
    auto data = workflow_with(json{{"dispatch-workflow", json::array({"deploy"})}});
    CompilerConfig config;
    config.action_mode = ActionMode::DEV;
    auto jobs = build_safe_output_jobs({data, config});

    const Job* job = find_job(jobs, "dispatch_workflow");
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->permissions.render(), "actions: write\ncontents: read");
    EXPECT_TRUE(has_step_named(*job, "Checkout actions folder"));
}

TEST(SafeOutputJobsTests, MissingToolEnv)
{
    auto data = workflow_with(json{{"missing-tool", {{"max", 5}, {"labels", json::array({"infra"})}}}});
    CompilerConfig config;
    auto jobs = build_safe_output_jobs({data, config});

    const Job* job = find_job(jobs, "missing_tool");
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->env.at("GH_AW_MISSING_TOOL_MAX"), "5");
    EXPECT_EQ(job->env.at("GH_AW_MISSING_TOOL_CREATE_ISSUE"), "true");
    EXPECT_EQ(job->env.at("GH_AW_MISSING_TOOL_TITLE_PREFIX"), "[missing tool]");
    EXPECT_EQ(job->env.at("GH_AW_MISSING_TOOL_LABELS"), "infra");
    EXPECT_EQ(job->permissions.render(), "contents: read\nissues: write");
    EXPECT_EQ(job->outputs.count("tools_reported"), 1u);
    EXPECT_EQ(job->outputs.count("total_count"), 1u);
}

TEST(SafeOutputJobsTests, MissingDataWithoutIssueCreation)
{
    auto data = workflow_with(json{{"missing-data", {{"create-issue", false}}}});
    CompilerConfig config;
    auto jobs = build_safe_output_jobs({data, config});

    const Job* job = find_job(jobs, "missing_data");
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->env.at("GH_AW_MISSING_DATA_CREATE_ISSUE"), "false");
    EXPECT_EQ(job->permissions.render(), "contents: read");
    EXPECT_EQ(job->outputs.count("data_reported"), 1u);
}

TEST(SafeOutputJobsTests, CodeScanningUploadsSarif)
{
    auto data = workflow_with(json{{"create-code-scanning-alert", {{"driver", "Audit Bot"}}}});
    CompilerConfig config;
    auto jobs = build_safe_output_jobs({data, config});

    const Job* job = find_job(jobs, "create_code_scanning_alert");
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->env.at("GH_AW_SECURITY_REPORT_MAX"), "0");
    EXPECT_EQ(job->env.at("GH_AW_SECURITY_REPORT_DRIVER"), "Audit Bot");
    EXPECT_EQ(job->env.at("GH_AW_WORKFLOW_FILENAME"), "research");
    EXPECT_TRUE(has_step_named(*job, "Upload SARIF to GitHub Security"));
    for (const char* key : {"sarif_file", "findings_count", "artifact_uploaded", "codeql_uploaded"}) {
        EXPECT_EQ(job->outputs.count(key), 1u) << key;
    }
}

TEST(SafeOutputJobsTests, DispatchWorkflowEnv)
{
    auto data = workflow_with(json{{"dispatch-workflow", {{"workflows", json::array({"build", "deploy"})}, {"max", 2}}}});
    data.safe_outputs->dispatch_workflow->workflow_files = {{"build", ".yml"}, {"deploy", ".lock.yml"}};
    CompilerConfig config;
    auto jobs = build_safe_output_jobs({data, config});

    const Job* job = find_job(jobs, "dispatch_workflow");
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->env.at("GH_AW_DISPATCH_WORKFLOW_MAX"), "2");
    EXPECT_EQ(job->env.at("GH_AW_DISPATCH_WORKFLOWS"), R"(["build","deploy"])");
    EXPECT_EQ(job->env.at("GH_AW_DISPATCH_WORKFLOW_FILES"), R"({"build":".yml","deploy":".lock.yml"})");
}

TEST(SafeOutputJobsTests, AddCommentLinksCreatedEntities)
{
    auto data = workflow_with(json{{"create-issue", nullptr}, {"create-discussion", nullptr}, {"add-comment", nullptr}});
    CompilerConfig config;
    auto jobs = build_safe_output_jobs({data, config});

    const Job* job = find_job(jobs, "add_comment");
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->needs, (std::vector<std::string>{"agent", "create_issue", "create_discussion"}));
    EXPECT_EQ(job->env.at("GH_AW_CREATED_ISSUE_URL"), "${{ needs.create_issue.outputs.issue_url }}");
    EXPECT_EQ(job->env.at("GH_AW_CREATED_DISCUSSION_NUMBER"),
              "${{ needs.create_discussion.outputs.discussion_number }}");
}

TEST(SafeOutputJobsTests, AssignToAgentUsesAgentTokenByDefault)
{
    auto data = workflow_with(json{{"assign-to-agent", {{"allowed", json::array({"copilot"})}}}});
    CompilerConfig config;
    auto jobs = build_safe_output_jobs({data, config});

    const Job* job = find_job(jobs, "assign_to_agent");
    ASSERT_NE(job, nullptr);
    EXPECT_EQ(job->env.at("GH_AW_AGENT_MAX"), "1");
    EXPECT_EQ(job->env.at("GH_AW_AGENT_DEFAULT"), "copilot");
    EXPECT_EQ(job->env.at("GH_AW_AGENT_ALLOWED"), "copilot");
    const auto& script = job->steps.back();
    EXPECT_NE(script["with"]["github-token"].get<std::string>().find("GH_AW_AGENT_TOKEN"), std::string::npos);
}

TEST(SafeOutputJobsTests, TokenPrecedence)
{
    SafeOutputsConfig outputs;
    EXPECT_EQ(safe_output_token(nullptr, ""), "${{ secrets.GH_AW_GITHUB_TOKEN || secrets.GITHUB_TOKEN }}");
    outputs.github_token = "${{ secrets.GLOBAL }}";
    EXPECT_EQ(safe_output_token(&outputs, ""), "${{ secrets.GLOBAL }}");
    EXPECT_EQ(safe_output_token(&outputs, "${{ secrets.KIND }}"), "${{ secrets.KIND }}");
}

TEST(SafeOutputJobsTests, NoSafeOutputsNoJobs)
{
    WorkflowData data;
    CompilerConfig config;
    EXPECT_TRUE(build_safe_output_jobs({data, config}).empty());
}
