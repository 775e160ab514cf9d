//! # Syntax Rewriter Tests
//!
//! Traversal order, hook dispatch and structural sharing of the generic
//! rewriter, using small rewriters defined here.

#include "rewrite/syntax_rewriter.hpp"

#include "log_capture.hpp"
#include "syntax_builders.hpp"

#include <gtest/gtest.h>

using namespace reform;
using namespace reform::test;
using reform::rewrite::SyntaxRewriter;

namespace {

/// Removes return statements from every statement list.
class DropReturns : public SyntaxRewriter {
public:
    std::vector<size_t> seen_sizes;
    std::vector<NodePtr> seen_originals;

protected:
    auto process_statements(const CodeBlockItemList& statements,
                            const CodeBlockItemList& original)
        -> std::optional<CodeBlockItemList> override {
        seen_sizes.push_back(statements.size());
        seen_originals.push_back(original.node());
        std::vector<NodePtr> kept;
        for (const auto& item : statements.items()) {
            if (!item.item()->is(SyntaxKind::ReturnStmt)) {
                kept.push_back(item.node());
            }
        }
        if (kept.size() == statements.size())
            return std::nullopt;
        return CodeBlockItemList(make_code_block_item_list(kept));
    }
};

/// Records which site hooks fire, without changing anything.
class SiteRecorder : public SyntaxRewriter {
public:
    std::vector<SyntaxKind> sites;

protected:
    auto visit_source_file(const SourceFile& node, const SourceFile& original)
        -> NodePtr override {
        sites.push_back(SyntaxKind::SourceFile);
        return SyntaxRewriter::visit_source_file(node, original);
    }
    auto visit_code_block(const CodeBlock& node, const CodeBlock& original) -> NodePtr override {
        sites.push_back(SyntaxKind::CodeBlock);
        return SyntaxRewriter::visit_code_block(node, original);
    }
    auto visit_closure_expr(const ClosureExpr& node, const ClosureExpr& original)
        -> NodePtr override {
        sites.push_back(SyntaxKind::ClosureExpr);
        return SyntaxRewriter::visit_closure_expr(node, original);
    }
};

auto nested_tree() -> NodePtr {
    Trivia indent{TriviaPiece::newlines(1), TriviaPiece::spaces(4)};
    auto body = code_block({call("run", closure({return_stmt("1", indent)}), indent),
                            return_stmt("0", indent)});
    return source_file({func_decl("f", body), call("main", nullptr, Trivia::newlines(1))});
}

} // namespace

TEST(SyntaxRewriterTest, BaseRewriterReturnsSameRoot) {
    SyntaxRewriter rewriter;
    auto root = nested_tree();
    EXPECT_EQ(rewriter.rewrite(root), root);
}

TEST(SyntaxRewriterTest, NullRootIsReturned) {
    SyntaxRewriter rewriter;
    EXPECT_EQ(rewriter.rewrite(nullptr), nullptr);
}

TEST(SyntaxRewriterTest, SitesAreVisitedInnermostFirst) {
    SiteRecorder recorder;
    auto root = nested_tree();

    EXPECT_EQ(recorder.rewrite(root), root);
    EXPECT_EQ(recorder.sites, (std::vector<SyntaxKind>{SyntaxKind::ClosureExpr,
                                                       SyntaxKind::CodeBlock,
                                                       SyntaxKind::SourceFile}));
}

TEST(SyntaxRewriterTest, ReplacementsPropagateToRoot) {
    DropReturns rewriter;
    auto root = nested_tree();

    auto result = rewriter.rewrite(root);
    ASSERT_NE(result, root);
    EXPECT_EQ(result->to_source(), "func f() {\n    run({\n})\n}\nmain()");
    EXPECT_EQ(rewriter.seen_sizes, (std::vector<size_t>{1, 2, 2}));
}

TEST(SyntaxRewriterTest, HooksSeeSitesOfTheInputTree) {
    DropReturns rewriter;
    auto root = nested_tree();
    auto function = SourceFile(root).statements().at(0).item();
    auto body = CodeBlock(function->node_at(4));
    auto run_call = body.statements().at(0).item();
    auto inner = ClosureExpr(run_call->node_at(2)->node_at(0));

    (void)rewriter.rewrite(root);

    // The body's statements were rebuilt before its hook ran, yet the hook
    // still gets the list from the input tree.
    ASSERT_EQ(rewriter.seen_originals.size(), 3u);
    EXPECT_EQ(rewriter.seen_originals[0], inner.statements().node());
    EXPECT_EQ(rewriter.seen_originals[1], body.statements().node());
    EXPECT_EQ(rewriter.seen_originals[2], SourceFile(root).statements().node());
}

TEST(SyntaxRewriterTest, UnchangedSiblingsAreShared) {
    DropReturns rewriter;
    auto root = nested_tree();
    auto original = SourceFile(root).statements();

    auto result = SourceFile(rewriter.rewrite(root)).statements();
    EXPECT_NE(result.at(0).node(), original.at(0).node());
    EXPECT_EQ(result.at(1).node(), original.at(1).node());

    auto old_function = original.at(0).item();
    auto new_function = result.at(0).item();
    // Name and parameters are shared, the body is rebuilt.
    EXPECT_EQ(new_function->token_at(2), old_function->token_at(2));
    EXPECT_EQ(new_function->node_at(3), old_function->node_at(3));
    EXPECT_NE(new_function->node_at(4), old_function->node_at(4));
}

TEST(SyntaxRewriterTest, RebuildsAreTraced) {
    LogCapture capture;
    DropReturns rewriter;
    (void)rewriter.rewrite(nested_tree());

    EXPECT_TRUE(capture.sink().contains("rewrite", "rebuilt FunctionDecl"));
}
