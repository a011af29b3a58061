#include <gtest/gtest.h>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include "core/config.hpp"

using namespace warden::core::config;

// =============================================================================
// .env parsing
// =============================================================================

TEST(ConfigTests, DotenvLine_KeyValue)
{
    auto entry = parse_dotenv_line("WARDEN_VERSION=v1.2.0");
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->first, "WARDEN_VERSION");
    EXPECT_EQ(entry->second, "v1.2.0");
}

TEST(ConfigTests, DotenvLine_QuotesAndExport)
{
    auto quoted = parse_dotenv_line("  export NAME = \"hello world\"  ");
    ASSERT_TRUE(quoted.has_value());
    EXPECT_EQ(quoted->first, "NAME");
    EXPECT_EQ(quoted->second, "hello world");

    auto single = parse_dotenv_line("MODE='dev'");
    ASSERT_TRUE(single.has_value());
    EXPECT_EQ(single->second, "dev");
}

TEST(ConfigTests, DotenvLine_Ignored)
{
    EXPECT_FALSE(parse_dotenv_line("").has_value());
    EXPECT_FALSE(parse_dotenv_line("   ").has_value());
    EXPECT_FALSE(parse_dotenv_line("# comment").has_value());
    EXPECT_FALSE(parse_dotenv_line("NO_EQUALS").has_value());
    EXPECT_FALSE(parse_dotenv_line("=value").has_value());
}

TEST(ConfigTests, DotenvFile_DoesNotOverride)
{
    auto path = std::filesystem::temp_directory_path() / "warden_config_tests.env";
    {
        std::ofstream out(path);
        out << "# test\n"
            << "WARDEN_TEST_PRESET=from_file\n"
            << "WARDEN_TEST_FRESH=from_file\n";
    }
    setenv("WARDEN_TEST_PRESET", "from_env", 1);
    unsetenv("WARDEN_TEST_FRESH");

    auto applied = apply_dotenv_file(path);
    ASSERT_TRUE(applied.has_value());
    EXPECT_EQ(*applied, 1u);
    EXPECT_EQ(get_env("WARDEN_TEST_PRESET"), "from_env");
    EXPECT_EQ(get_env("WARDEN_TEST_FRESH"), "from_file");

    std::filesystem::remove(path);
    unsetenv("WARDEN_TEST_PRESET");
    unsetenv("WARDEN_TEST_FRESH");
}

TEST(ConfigTests, DotenvFile_Missing)
{
    EXPECT_FALSE(apply_dotenv_file("/nonexistent/warden/.env").has_value());
}

// =============================================================================
// Environment lookups
// =============================================================================

TEST(ConfigTests, Env_Fallbacks)
{
    unsetenv("WARDEN_TEST_UNSET");
    EXPECT_EQ(get_env("WARDEN_TEST_UNSET"), "");
    EXPECT_EQ(get_env_or("WARDEN_TEST_UNSET", "release"), "release");
    EXPECT_TRUE(get_env_bool("WARDEN_TEST_UNSET", true));
}

TEST(ConfigTests, Env_Bool)
{
    for (const char* value : {"1", "true", "YES", "On"}) {
        setenv("WARDEN_TEST_BOOL", value, 1);
        EXPECT_TRUE(get_env_bool("WARDEN_TEST_BOOL", false)) << value;
    }
    for (const char* value : {"0", "false", "off", "nope"}) {
        setenv("WARDEN_TEST_BOOL", value, 1);
        EXPECT_FALSE(get_env_bool("WARDEN_TEST_BOOL", true)) << value;
    }
    unsetenv("WARDEN_TEST_BOOL");
}
