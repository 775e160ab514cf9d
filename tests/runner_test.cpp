//! # Runner Tests
//!
//! Lint and format modes, configuration gating and severity overrides.

#include "engine/runner.hpp"

#include "log_capture.hpp"
#include "syntax/source_position.hpp"
#include "syntax_builders.hpp"

#include <gtest/gtest.h>

using namespace reform;
using namespace reform::test;
using engine::RunMode;

class RunnerTest : public ::testing::Test {
protected:
    config::Configuration configuration;
    NodePtr decl = var_decl(TokenKind::KwVar, {{"a"}, {"b", "Int"}});
    NodePtr root = source_file({decl}, Trivia::newlines(1));

    void set_rule(const std::string& text) {
        auto result = config::parse_config("[rules]\nOneVariableDeclarationPerLine = " + text);
        ASSERT_TRUE(is_ok(result)) << unwrap_err(result);
        configuration = unwrap(result);
    }
};

TEST_F(RunnerTest, LintKeepsTheInputTree) {
    auto result = engine::run(root, configuration, RunMode::Lint);

    EXPECT_EQ(result.tree, root);
    EXPECT_FALSE(result.changed);
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].anchor, decl);
}

TEST_F(RunnerTest, LintAnchorsAreLocatableWithNestedSplits) {
    // var f = {
    // let x, y
    // }, g = 1
    auto f = make_pattern_binding(
        make_identifier_pattern(make_identifier("f", {}, Trivia::spaces(1))), nullptr,
        initializer(closure({var_decl(TokenKind::KwLet, {{"x"}, {"y"}}, Trivia::newlines(1))})),
        make_punctuation(TokenKind::Comma, {}, Trivia::spaces(1)));
    auto nested = source_file({make_variable_decl(
        nullptr, make_keyword(TokenKind::KwVar, {}, Trivia::spaces(1)),
        make_pattern_binding_list({f, binding({"g", "", "1"}, false)}))});

    auto result = engine::run(nested, configuration, RunMode::Lint);

    ASSERT_EQ(result.diagnostics.size(), 2u);
    for (const auto& diagnostic : result.diagnostics) {
        EXPECT_TRUE(syntax::position_of(result.tree, diagnostic.anchor).has_value())
            << diagnostic.anchor->trimmed_source();
    }
}

TEST_F(RunnerTest, FormatReturnsRewrittenTree) {
    auto result = engine::run(root, configuration, RunMode::Format);

    EXPECT_TRUE(result.changed);
    EXPECT_EQ(result.tree->to_source(), "var a: Int\nvar b: Int\n");
    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].severity, diag::Severity::Warning);
}

TEST_F(RunnerTest, CleanTreeIsUnchanged) {
    auto clean = source_file({var_decl(TokenKind::KwLet, {{"a", "", "1"}})});
    auto result = engine::run(clean, configuration, RunMode::Format);

    EXPECT_EQ(result.tree, clean);
    EXPECT_FALSE(result.changed);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(RunnerTest, DisabledRuleDoesNothing) {
    set_rule("false");
    auto result = engine::run(root, configuration, RunMode::Format);

    EXPECT_EQ(result.tree, root);
    EXPECT_FALSE(result.changed);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(RunnerTest, SeverityOverrideIsReported) {
    set_rule("\"error\"");
    auto result = engine::run(root, configuration, RunMode::Lint);

    ASSERT_EQ(result.diagnostics.size(), 1u);
    EXPECT_EQ(result.diagnostics[0].severity, diag::Severity::Error);
}

TEST_F(RunnerTest, NullTreeGivesEmptyResult) {
    auto result = engine::run(nullptr, configuration, RunMode::Format);
    EXPECT_EQ(result.tree, nullptr);
    EXPECT_FALSE(result.changed);
    EXPECT_TRUE(result.diagnostics.empty());
}

TEST_F(RunnerTest, RunIsLoggedAtInfoLevel) {
    LogCapture capture(log::LogLevel::Info);
    (void)engine::run(root, configuration, RunMode::Format);

    EXPECT_TRUE(capture.sink().contains("engine", "format: 1 diagnostic(s), tree rewritten"));
}
