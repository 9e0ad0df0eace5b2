// VINDEX - Configuration File Parser Tests
// Copyright (c) 2024 VINDEX Developers
// MIT License

#include <gtest/gtest.h>

#include "vindex/util/config.h"

#include <cstdio>
#include <fstream>
#include <stdexcept>
#include <string>
#include <unistd.h>
#include <vector>

namespace vindex {
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
        char filename[] = "/tmp/vindex_config_test_XXXXXX";
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
// Basic Parsing Tests
// ============================================================================

TEST_F(ConfigTest, ParseEmptyString) {
    auto result = config_.ParseString("");
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 0u);
}

TEST_F(ConfigTest, ParseComments) {
    std::string content = R"(
# This is a comment
; This is also a comment
loglevel=debug
)";
    auto result = config_.ParseString(content);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(config_.Size(), 1u);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
}

TEST_F(ConfigTest, ParseQuotedValues) {
    auto result = config_.ParseString("logfile=\"/tmp/vindex sim.log\"\nname='demo'\n");
    ASSERT_TRUE(result.success);
    EXPECT_EQ(config_.GetString("logfile", ""), "/tmp/vindex sim.log");
    EXPECT_EQ(config_.GetString("name", ""), "demo");
}

TEST_F(ConfigTest, ParseSections) {
    std::string content = R"(
printtoconsole=1

[chain]
minstake = 250
swapfee = 0.002
)";
    ASSERT_TRUE(config_.ParseString(content).success);

    EXPECT_TRUE(config_.HasKey("printtoconsole"));
    EXPECT_FALSE(config_.HasKey("minstake"));
    EXPECT_EQ(config_.GetInt("minstake", 0, "chain"), 250);
    EXPECT_DOUBLE_EQ(config_.GetDouble("swapfee", 0.0, "chain"), 0.002);
}

TEST_F(ConfigTest, BareFlagsAndNegation) {
    ASSERT_TRUE(config_.ParseString("printtoconsole\nnodebug\n").success);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("debug", true));
}

TEST_F(ConfigTest, BooleanWords) {
    ASSERT_TRUE(config_.ParseString("a=yes\nb=off\nc=TRUE\nd=0\ne=maybe\n").success);
    EXPECT_TRUE(config_.GetBool("a", false));
    EXPECT_FALSE(config_.GetBool("b", true));
    EXPECT_TRUE(config_.GetBool("c", false));
    EXPECT_FALSE(config_.GetBool("d", true));
    EXPECT_FALSE(config_.TryGetBool("e").has_value());
    EXPECT_TRUE(config_.GetBool("e", true));
}

TEST_F(ConfigTest, NumericParsing) {
    ASSERT_TRUE(config_.ParseString("n=42\nneg=-7\nbad=12abc\nf=1e3\n").success);
    EXPECT_EQ(config_.GetInt("n", 0), 42);
    EXPECT_EQ(config_.GetInt("neg", 0), -7);
    EXPECT_FALSE(config_.TryGetInt("bad").has_value());
    EXPECT_EQ(config_.GetInt("bad", 5), 5);
    EXPECT_DOUBLE_EQ(config_.GetDouble("f", 0.0), 1000.0);
    EXPECT_FALSE(config_.TryGetInt("missing").has_value());
}

// ============================================================================
// Error Tests
// ============================================================================

TEST_F(ConfigTest, MissingClosingBracket) {
    auto result = config_.ParseString("a=1\n[chain\nb=2\n", "test.conf");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 2);
    EXPECT_EQ(result.errorMessage, "Missing closing bracket in section header");
    EXPECT_EQ(result.ToString(), "test.conf:2: Missing closing bracket in section header");
}

TEST_F(ConfigTest, InvalidKey) {
    auto result = config_.ParseString("bad key=1\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.errorLine, 1);
}

TEST_F(ConfigTest, MissingFile) {
    auto result = config_.ParseFile("/nonexistent/vindex.conf");
    EXPECT_FALSE(result.success);
}

// ============================================================================
// File and Command Line Tests
// ============================================================================

TEST_F(ConfigTest, ParseFile) {
    std::string path = CreateTempFile("loglevel=warn\n[chain]\nmaxvalidators=9\n");
    auto result = config_.ParseFile(path);
    ASSERT_TRUE(result.success) << result.ToString();
    EXPECT_EQ(config_.GetString("loglevel", ""), "warn");
    EXPECT_EQ(config_.GetInt("maxvalidators", 0, "chain"), 9);
}

TEST_F(ConfigTest, FileDoesNotOverrideExistingKeys) {
    config_.Set("loglevel", "error");
    std::string path = CreateTempFile("loglevel=debug\n");
    ASSERT_TRUE(config_.ParseFile(path).success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "error");

    ASSERT_TRUE(config_.ParseFile(path, true).success);
    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
}

TEST_F(ConfigTest, ParseCommandLine) {
    const char* argv[] = {"vindex-sim", "-loglevel=debug", "--export=/tmp/out.json",
                          "-chain.minstake=500", "-printtoconsole", "-nodebug"};
    auto result = config_.ParseCommandLine(6, argv);
    ASSERT_TRUE(result.success) << result.ToString();

    EXPECT_EQ(config_.GetString("loglevel", ""), "debug");
    EXPECT_EQ(config_.GetString("export", ""), "/tmp/out.json");
    EXPECT_EQ(config_.GetInt("minstake", 0, "chain"), 500);
    EXPECT_TRUE(config_.GetBool("printtoconsole", false));
    EXPECT_FALSE(config_.GetBool("debug", true));
}

TEST_F(ConfigTest, CommandLineRejectsPositionalArguments) {
    const char* argv[] = {"vindex-sim", "positional"};
    auto result = config_.ParseCommandLine(2, argv);
    EXPECT_FALSE(result.success);
}

} // namespace test
} // namespace util
} // namespace vindex
