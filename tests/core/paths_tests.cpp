#include <gtest/gtest.h>
#include <filesystem>
#include "core/paths.hpp"

namespace fs = std::filesystem;
using namespace warden::core::paths;

TEST(PathsTests, WorkflowId_StripsKnownSuffixes)
{
    EXPECT_EQ(workflow_id_from_path(".github/workflows/triage.md"), "triage");
    EXPECT_EQ(workflow_id_from_path("deploy.lock.yml"), "deploy");
    EXPECT_EQ(workflow_id_from_path("/a/b/ci.yml"), "ci");
    EXPECT_EQ(workflow_id_from_path("frontmatter.json"), "frontmatter");
    EXPECT_EQ(workflow_id_from_path("notes.txt"), "notes.txt");
    EXPECT_EQ(workflow_id_from_path(".md"), ".md");
}

TEST(PathsTests, RepositoryRoot_WalksUp)
{
    auto root = fs::temp_directory_path() / "warden_paths_repo";
    fs::remove_all(root);
    fs::create_directories(root / ".github" / "workflows");
    fs::create_directories(root / "docs" / "nested");

    auto found = find_repository_root(root / "docs" / "nested");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(fs::canonical(*found), fs::canonical(root));

    fs::remove_all(root);
}
