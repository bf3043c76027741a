// PAMTALK - Configuration File Parser Tests
// Copyright (c) 2024 PAMTALK Developers
// MIT License

#include <gtest/gtest.h>

#include "pamtalk/util/config.h"

#include <cstdio>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace pamtalk {
namespace util {
namespace test {

// ============================================================================
// Test Fixtures
// ============================================================================

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.Clear();
    }

    void TearDown() override {
        for (const auto& file : tempFiles_) {
            std::remove(file.c_str());
        }
        tempFiles_.clear();
    }

    std::string CreateTempFile(const std::string& content) {
        char filename[] = "/tmp/pamtalk_config_test_XXXXXX";
        int fd = mkstemp(filename);
        if (fd < 0) {
            throw std::runtime_error("Failed to create temp file");
        }
        close(fd);

        std::ofstream file(filename);
        file << content;
        file.close();

        tempFiles_.push_back(filename);
        return filename;
    }

    ConfigManager config_;
    std::vector<std::string> tempFiles_;
};

// ============================================================================
// Parsing
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, CommentsAndBlankLines) {
    auto result = config_.ParseString("# comment\n\n; other comment\nadmin = alice\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 1u);
    EXPECT_EQ(config_.GetString("admin"), "alice");
}

TEST_F(ConfigTest, Sections) {
    auto result = config_.ParseString(
        "admin = alice\n"
        "[governance]\n"
        "required_approvals = 5\n"
        "[ settlement ]\n"
        "fee_rate_bps = 250\n");
    ASSERT_TRUE(result.success);

    EXPECT_EQ(config_.GetUInt("required_approvals", 0, "governance"), 5u);
    EXPECT_EQ(config_.GetUInt("fee_rate_bps", 0, "settlement"), 250u);
    EXPECT_FALSE(config_.HasKey("required_approvals"));

    auto sections = config_.GetSections();
    ASSERT_EQ(sections.size(), 2u);
    EXPECT_EQ(sections[0], "governance");
    EXPECT_EQ(sections[1], "settlement");
    EXPECT_EQ(config_.GetKeys().size(), 1u);
}

TEST_F(ConfigTest, QuotedValues) {
    ASSERT_TRUE(config_.ParseString(
        "a = \"two words\"\n"
        "b = 'raw \\n'\n"
        "c = \"tab\\there\"\n").success);

    EXPECT_EQ(config_.GetString("a"), "two words");
    EXPECT_EQ(config_.GetString("b"), "raw \\n");
    EXPECT_EQ(config_.GetString("c"), "tab\there");
}

TEST_F(ConfigTest, LaterValueWins) {
    ASSERT_TRUE(config_.ParseString("admin = alice\nadmin = bob\n").success);
    EXPECT_EQ(config_.GetString("admin"), "bob");
}

TEST_F(ConfigTest, ErrorsReportLine) {
    auto result = config_.ParseString("admin = alice\nnot a pair\n", "engine.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.errorFile, "engine.conf");
    EXPECT_EQ(result.ToString(), "engine.conf:2: Expected key=value");
}

TEST_F(ConfigTest, MalformedLines) {
    EXPECT_FALSE(config_.ParseString("[governance\n").success);
    EXPECT_FALSE(config_.ParseString(" = value\n").success);
    EXPECT_FALSE(config_.ParseString("bad key! = 1\n").success);
}

TEST_F(ConfigTest, LineTooLong) {
    std::string line = "k = " + std::string(MAX_LINE_LENGTH, 'x') + "\n";
    EXPECT_FALSE(config_.ParseString(line).success);
}

// ============================================================================
// Typed Access
// ============================================================================

TEST_F(ConfigTest, IntegerAccess) {
    ASSERT_TRUE(config_.ParseString("n = 42\nneg = -7\nmixed = 12abc\n").success);

    EXPECT_EQ(config_.GetInt("n"), 42);
    EXPECT_EQ(config_.GetInt("neg"), -7);
    EXPECT_FALSE(config_.TryGetInt("mixed").has_value());
    EXPECT_EQ(config_.GetInt("missing", 9), 9);

    EXPECT_FALSE(config_.TryGetUInt("neg").has_value());
    EXPECT_EQ(config_.GetUInt("n"), 42u);
}

TEST_F(ConfigTest, BoolAccess) {
    ASSERT_TRUE(config_.ParseString("a = yes\nb = OFF\nc = maybe\n").success);

    EXPECT_TRUE(config_.GetBool("a"));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_FALSE(config_.TryGetBool("c").has_value());
    EXPECT_TRUE(config_.GetBool("c", true));
}

TEST_F(ConfigTest, ParseBoolHelper) {
    EXPECT_EQ(ConfigManager::ParseBool("TRUE"), std::optional<bool>(true));
    EXPECT_EQ(ConfigManager::ParseBool("0"), std::optional<bool>(false));
    EXPECT_FALSE(ConfigManager::ParseBool("").has_value());
}

TEST_F(ConfigTest, EnvironmentExpansion) {
    setenv("PAMTALK_TEST_ADMIN", "carol", 1);
    ASSERT_TRUE(config_.ParseString("admin = ${PAMTALK_TEST_ADMIN}\n"
                                    "home = $HOME\n").success);
    unsetenv("PAMTALK_TEST_ADMIN");

    EXPECT_EQ(config_.GetString("admin"), "carol");
    EXPECT_EQ(config_.GetString("home"), "$HOME");
}

// ============================================================================
// Defaults and Validation
// ============================================================================

TEST_F(ConfigTest, SetDefaultDoesNotOverride) {
    ASSERT_TRUE(config_.ParseString("reward_rate = 10\n").success);
    config_.SetDefault("reward_rate", "1000");
    config_.SetDefault("fee_rate_bps", "500");

    EXPECT_EQ(config_.GetUInt("reward_rate"), 10u);
    EXPECT_EQ(config_.GetUInt("fee_rate_bps"), 500u);

    config_.Set("reward_rate", "20");
    EXPECT_EQ(config_.GetUInt("reward_rate"), 20u);
}

TEST_F(ConfigTest, RequiredKeys) {
    config_.RequireKey(ConfigKeys::ADMIN);
    config_.RequireKey(ConfigKeys::REQUIRED_APPROVALS, ConfigKeys::GOVERNANCE_SECTION);

    auto errors = config_.Validate();
    EXPECT_EQ(errors.size(), 2u);

    ASSERT_TRUE(config_.ParseString("admin = a\n[governance]\nrequired_approvals = 3\n").success);
    EXPECT_TRUE(config_.Validate().empty());
}

// ============================================================================
// Files
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("admin = alice\n[log]\nlevel = debug\n");

    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString("admin"), "alice");
    EXPECT_EQ(config_.GetString(ConfigKeys::LOG_LEVEL, "", ConfigKeys::LOG_SECTION), "debug");
}

TEST_F(ConfigTest, ParseMissingFile) {
    auto result = config_.ParseFile("/nonexistent/pamtalk.conf");
    EXPECT_FALSE(result.success);
    EXPECT_NE(result.errorMessage.find("Cannot open file"), std::string::npos);
}

TEST_F(ConfigTest, FileErrorCarriesPath) {
    std::string path = CreateTempFile("admin = alice\n\ngarbage\n");

    auto result = config_.ParseFile(path);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorFile, path);
    EXPECT_EQ(result.errorLine, 3);
}

} // namespace test
} // namespace util
} // namespace pamtalk
