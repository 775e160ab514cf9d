//! # Configuration Tests
//!
//! `reform.toml` parsing and loading from a project root.

#include "config/config.hpp"

#include "log_capture.hpp"

#include <filesystem>
#include <fstream>
#include <gtest/gtest.h>

using namespace reform;
using namespace reform::config;
using namespace reform::test;
namespace fs = std::filesystem;

// ============================================================================
// Parsing
// ============================================================================

TEST(ParseConfigTest, EmptyTextGivesDefaults) {
    auto result = parse_config("");
    ASSERT_TRUE(is_ok(result));

    auto settings = unwrap(result).rule("OneVariableDeclarationPerLine");
    EXPECT_TRUE(settings.enabled);
    EXPECT_EQ(settings.severity, diag::Severity::Warning);
}

TEST(ParseConfigTest, FallbackSeverityAppliesToUnlistedRules) {
    auto result = parse_config("[rules]\n");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).rule("Anything", diag::Severity::Note).severity,
              diag::Severity::Note);
}

TEST(ParseConfigTest, BooleanValues) {
    auto result = parse_config(R"(
[rules]
OneVariableDeclarationPerLine = false
OtherRule = true
)");
    ASSERT_TRUE(is_ok(result));
    const auto& config = unwrap(result);
    EXPECT_FALSE(config.rule("OneVariableDeclarationPerLine").enabled);
    EXPECT_TRUE(config.rule("OtherRule").enabled);
}

TEST(ParseConfigTest, OffDisables) {
    auto result = parse_config("[rules]\nOneVariableDeclarationPerLine = \"off\"\n");
    ASSERT_TRUE(is_ok(result));
    EXPECT_FALSE(unwrap(result).rule("OneVariableDeclarationPerLine").enabled);
}

TEST(ParseConfigTest, SeverityOverride) {
    auto result = parse_config(R"(
# project settings
[rules]
OneVariableDeclarationPerLine = "error"   # stricter than the default
)");
    ASSERT_TRUE(is_ok(result));
    auto settings = unwrap(result).rule("OneVariableDeclarationPerLine");
    EXPECT_TRUE(settings.enabled);
    EXPECT_EQ(settings.severity, diag::Severity::Error);
}

TEST(ParseConfigTest, OtherSectionsAreSkippedWithWarning) {
    LogCapture capture(log::LogLevel::Warn);
    auto result = parse_config(R"(
[format]
indent = 4

[rules]
OneVariableDeclarationPerLine = "note"
)");
    ASSERT_TRUE(is_ok(result));
    EXPECT_EQ(unwrap(result).rules.size(), 1u);
    EXPECT_EQ(unwrap(result).rule("OneVariableDeclarationPerLine").severity, diag::Severity::Note);
    EXPECT_TRUE(capture.sink().contains("config", "[format]"));
}

TEST(ParseConfigTest, WindowsLineEndings) {
    auto result = parse_config("[rules]\r\nOneVariableDeclarationPerLine = false\r\n");
    ASSERT_TRUE(is_ok(result));
    EXPECT_FALSE(unwrap(result).rule("OneVariableDeclarationPerLine").enabled);
}

TEST(ParseConfigTest, MissingEqualsIsAnError) {
    auto result = parse_config("[rules]\nOneVariableDeclarationPerLine\n");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("line 2"), std::string::npos);
}

TEST(ParseConfigTest, UnterminatedSectionIsAnError) {
    auto result = parse_config("[rules\n");
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("unterminated"), std::string::npos);
}

TEST(ParseConfigTest, InvalidValueIsAnError) {
    for (const char* value : {"maybe", "\"loud\"", "1", "\"error"}) {
        auto result = parse_config(std::string("[rules]\nRule = ") + value + "\n");
        ASSERT_TRUE(is_err(result)) << value;
        EXPECT_NE(unwrap_err(result).find("Rule"), std::string::npos) << value;
    }
}

// ============================================================================
// Loading
// ============================================================================

class LoadConfigTest : public ::testing::Test {
protected:
    fs::path root;

    void SetUp() override {
        root = fs::temp_directory_path() / "reform_config_test";
        fs::remove_all(root);
        fs::create_directories(root);
    }

    void TearDown() override {
        fs::remove_all(root);
    }

    void write_config(const std::string& text) {
        std::ofstream file(root / CONFIG_FILE_NAME);
        file << text;
    }
};

TEST_F(LoadConfigTest, MissingFileGivesDefaults) {
    auto result = load_config(root);
    ASSERT_TRUE(is_ok(result));
    EXPECT_TRUE(unwrap(result).rules.empty());
}

TEST_F(LoadConfigTest, ReadsRulesSection) {
    write_config("[rules]\nOneVariableDeclarationPerLine = false\n");

    auto result = load_config(root);
    ASSERT_TRUE(is_ok(result));
    EXPECT_FALSE(unwrap(result).rule("OneVariableDeclarationPerLine").enabled);
}

TEST_F(LoadConfigTest, ErrorsNameTheFile) {
    write_config("[rules]\nbroken\n");

    auto result = load_config(root);
    ASSERT_TRUE(is_err(result));
    EXPECT_NE(unwrap_err(result).find("reform.toml"), std::string::npos);
}
