//! # Syntax Rewriter
//!
//! Generic depth-first rewriter over the persistent syntax tree. Rules
//! derive from it and override hooks at the node kinds they care about;
//! traversal and reconstruction are shared by every rule.
//!
//! ## Traversal
//!
//! Post-order: the children of a node are rewritten first, then the node is
//! rebuilt from the (possibly replaced) children. A node none of whose
//! children changed is returned as the same pointer, so rewriting a tree in
//! which no rule fires allocates nothing and returns the original root.
//!
//! ## Rewrite Sites
//!
//! Nodes that own a statement sequence are rewrite sites:
//!
//! | Kind          | Hook                   |
//! |---------------|------------------------|
//! | `SourceFile`  | `visit_source_file()`  |
//! | `CodeBlock`   | `visit_code_block()`   |
//! | `ClosureExpr` | `visit_closure_expr()` |
//!
//! The default hooks hand the site's statements to `process_statements()`
//! and substitute whatever it returns. A rule that treats every statement
//! sequence alike only overrides `process_statements()`.
//!
//! Every hook also receives the site as it was in the input tree. Rewriting
//! children never adds or removes statements of the enclosing sequence, so
//! item `i` of the rebuilt list corresponds to item `i` of the original.
//! Rules anchor their diagnostics at original nodes, which stay valid in
//! the caller's tree.

#ifndef REFORM_REWRITE_SYNTAX_REWRITER_HPP
#define REFORM_REWRITE_SYNTAX_REWRITER_HPP

#include "syntax/syntax_nodes.hpp"

#include <optional>

namespace reform::rewrite {

class SyntaxRewriter {
public:
    virtual ~SyntaxRewriter() = default;

    /// Rewrites the tree under `root`. Returns `root` itself when nothing
    /// changed.
    [[nodiscard]] auto rewrite(const syntax::NodePtr& root) -> syntax::NodePtr;

protected:
    /// Called with a source file whose descendants were already rewritten.
    virtual auto visit_source_file(const syntax::SourceFile& node,
                                   const syntax::SourceFile& original) -> syntax::NodePtr;

    /// Called with a code block whose descendants were already rewritten.
    virtual auto visit_code_block(const syntax::CodeBlock& node, const syntax::CodeBlock& original)
        -> syntax::NodePtr;

    /// Called with a closure whose descendants were already rewritten.
    virtual auto visit_closure_expr(const syntax::ClosureExpr& node,
                                    const syntax::ClosureExpr& original) -> syntax::NodePtr;

    /// Returns a replacement for `statements`, or `std::nullopt` to keep them.
    /// `original` is the same sequence before its descendants were rewritten.
    virtual auto process_statements(const syntax::CodeBlockItemList& statements,
                                    const syntax::CodeBlockItemList& original)
        -> std::optional<syntax::CodeBlockItemList>;

private:
    auto visit(const syntax::NodePtr& node) -> syntax::NodePtr;
    auto visit_children(const syntax::NodePtr& node) -> syntax::NodePtr;
};

} // namespace reform::rewrite

#endif // REFORM_REWRITE_SYNTAX_REWRITER_HPP
