#include <gtest/gtest.h>
#include "codegraph/config.hpp"
#include "codegraph/version.hpp"
#include <cstdlib>

using namespace codegraph;

TEST(ParseByteSizeTest, AcceptsDigitsOnly) {
    EXPECT_EQ(parse_byte_size("0"), 0u);
    EXPECT_EQ(parse_byte_size("1048576"), 1048576u);
    EXPECT_FALSE(parse_byte_size("").has_value());
    EXPECT_FALSE(parse_byte_size("-1").has_value());
    EXPECT_FALSE(parse_byte_size("10MB").has_value());
    EXPECT_FALSE(parse_byte_size("99999999999999999999999999").has_value());
}

class ConfigEnvTest : public ::testing::Test {
protected:
    void TearDown() override {
        unsetenv(ENV_MAX_FILE_SIZE);
        unsetenv(ENV_CACHE_DIR);
    }
};

TEST_F(ConfigEnvTest, Defaults) {
    unsetenv(ENV_MAX_FILE_SIZE);
    unsetenv(ENV_CACHE_DIR);

    Config config = Config::from_environment();
    EXPECT_EQ(config.cache_dir, "./db");
    EXPECT_EQ(config.indexer.max_file_size, 5u * 1024 * 1024);
}

TEST_F(ConfigEnvTest, EnvironmentOverrides) {
    setenv(ENV_MAX_FILE_SIZE, "2048", 1);
    setenv(ENV_CACHE_DIR, "/var/cache/codegraph", 1);

    Config config = Config::from_environment();
    EXPECT_EQ(config.indexer.max_file_size, 2048u);
    EXPECT_EQ(config.cache_dir, "/var/cache/codegraph");
}

TEST_F(ConfigEnvTest, InvalidSizeKeepsDefault) {
    setenv(ENV_MAX_FILE_SIZE, "lots", 1);

    Config config = Config::from_environment();
    EXPECT_EQ(config.indexer.max_file_size, 5u * 1024 * 1024);
}

TEST(VersionTest, SchemaCompatibilityByMajor) {
    int major = 0, minor = 0, patch = 0;
    ASSERT_TRUE(parse_version(CACHE_SCHEMA_VERSION, major, minor, patch));
    EXPECT_EQ(major, CACHE_SCHEMA_MAJOR);
    EXPECT_TRUE(is_schema_compatible(major));
    EXPECT_FALSE(is_schema_compatible(major + 1));
}

TEST(VersionTest, ParseVersionRejectsMalformedStrings) {
    int major = 0, minor = 0, patch = 0;
    EXPECT_TRUE(parse_version("2.10.3", major, minor, patch));
    EXPECT_EQ(minor, 10);
    EXPECT_EQ(patch, 3);
    EXPECT_FALSE(parse_version("1.2", major, minor, patch));
    EXPECT_FALSE(parse_version("a.b.c", major, minor, patch));
}
