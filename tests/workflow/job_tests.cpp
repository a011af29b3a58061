#include <gtest/gtest.h>
#include "workflow/job.hpp"

using namespace warden::workflow;

namespace {

Job make_job(const std::string& name, std::vector<std::string> needs = {})
{
    Job job;
    job.name = name;
    job.needs = std::move(needs);
    return job;
}

} // namespace

TEST(JobGraphTests, AddJob_RejectsDuplicatesAndEmptyNames)
{
    JobGraph graph;
    EXPECT_TRUE(graph.add_job(make_job("agent")));
    EXPECT_FALSE(graph.add_job(make_job("agent")));
    EXPECT_FALSE(graph.add_job(make_job("")));
    EXPECT_EQ(graph.size(), 1u);
}

TEST(JobGraphTests, Jobs_KeepInsertionOrder)
{
    JobGraph graph;
    graph.add_job(make_job("activation"));
    graph.add_job(make_job("agent", {"activation"}));
    graph.add_job(make_job("close_issue", {"agent"}));

    ASSERT_EQ(graph.jobs().size(), 3u);
    EXPECT_EQ(graph.jobs()[0].name, "activation");
    EXPECT_EQ(graph.jobs()[2].name, "close_issue");
    ASSERT_NE(graph.get_job("agent"), nullptr);
    EXPECT_EQ(graph.get_job("missing"), nullptr);
}

TEST(JobGraphTests, Validate_AcceptsDag)
{
    JobGraph graph;
    graph.add_job(make_job("pre_activation"));
    graph.add_job(make_job("activation", {"pre_activation"}));
    graph.add_job(make_job("agent", {"activation"}));
    graph.add_job(make_job("create_issue", {"agent"}));
    graph.add_job(make_job("add_comment", {"agent", "create_issue"}));

    auto result = graph.validate();
    EXPECT_TRUE(result.success) << result.error;
}

TEST(JobGraphTests, Validate_UnknownNeedsFails)
{
    JobGraph graph;
    graph.add_job(make_job("agent", {"activation"}));

    auto result = graph.validate();
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.error.find("unknown job 'activation'"), std::string::npos);
}

TEST(JobGraphTests, Validate_CycleFails)
{
    JobGraph graph;
    graph.add_job(make_job("a", {"c"}));
    graph.add_job(make_job("b", {"a"}));
    graph.add_job(make_job("c", {"b"}));
    graph.add_job(make_job("d"));

    auto result = graph.validate();
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.error, "dependency cycle between jobs: a, b, c");
}

TEST(JobGraphTests, Validate_SelfLoopFails)
{
    JobGraph graph;
    graph.add_job(make_job("a", {"a"}));
    EXPECT_FALSE(graph.validate().success);
}

TEST(JobGraphTests, DependsOn_FollowsTransitiveEdges)
{
    JobGraph graph;
    graph.add_job(make_job("activation"));
    graph.add_job(make_job("agent", {"activation"}));
    graph.add_job(make_job("create_issue", {"agent"}));
    graph.add_job(make_job("add_comment", {"create_issue"}));
    graph.add_job(make_job("unrelated"));

    EXPECT_TRUE(graph.depends_on("add_comment", "agent"));
    EXPECT_TRUE(graph.depends_on("add_comment", "activation"));
    EXPECT_FALSE(graph.depends_on("agent", "add_comment"));
    EXPECT_FALSE(graph.depends_on("unrelated", "agent"));
    EXPECT_FALSE(graph.depends_on("missing", "agent"));
}

TEST(JobGraphTests, ToJson_OmitsEmptyFields)
{
    Job job = make_job("agent", {"activation"});
    job.permissions = contents_read_permissions();
    job.timeout_minutes = 20;

    auto j = job.to_json();
    EXPECT_EQ(j["name"], "agent");
    EXPECT_EQ(j["needs"], nlohmann::json::array({"activation"}));
    EXPECT_EQ(j["permissions"], (nlohmann::json{{"contents", "read"}}));
    EXPECT_EQ(j["timeout-minutes"], 20);
    EXPECT_FALSE(j.contains("if"));
    EXPECT_FALSE(j.contains("env"));
    EXPECT_FALSE(j.contains("outputs"));
    EXPECT_FALSE(j.contains("display-name"));
}

TEST(JobGraphTests, ToJson_PermissionsAsScopeMap)
{
    Job job = make_job("close_issue", {"agent"});
    job.permissions = contents_read_issues_write_permissions();

    auto perms = job.to_json()["permissions"];
    ASSERT_TRUE(perms.is_object());
    EXPECT_EQ(perms, (nlohmann::json{{"contents", "read"}, {"issues", "write"}}));

    job.permissions = Permissions::shorthand("read-all");
    EXPECT_EQ(job.to_json()["permissions"], "read-all");
}

TEST(JobGraphTests, ToJson_EmptyPermissionsStayExplicit)
{
    Job job = make_job("agent");
    auto j = job.to_json();
    ASSERT_TRUE(j.contains("permissions"));
    EXPECT_EQ(j["permissions"], nlohmann::json::object());
}
