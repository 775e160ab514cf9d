#include "rewrite/syntax_rewriter.hpp"

#include "log/log.hpp"

namespace reform::rewrite {

using syntax::NodePtr;
using syntax::SyntaxChild;
using syntax::SyntaxKind;

auto SyntaxRewriter::rewrite(const NodePtr& root) -> NodePtr {
    if (!root)
        return root;
    return visit(root);
}

auto SyntaxRewriter::visit(const NodePtr& node) -> NodePtr {
    NodePtr rebuilt = visit_children(node);

    switch (rebuilt->kind()) {
    case SyntaxKind::SourceFile:
        return visit_source_file(syntax::SourceFile(rebuilt), syntax::SourceFile(node));
    case SyntaxKind::CodeBlock:
        return visit_code_block(syntax::CodeBlock(rebuilt), syntax::CodeBlock(node));
    case SyntaxKind::ClosureExpr:
        return visit_closure_expr(syntax::ClosureExpr(rebuilt), syntax::ClosureExpr(node));
    default:
        return rebuilt;
    }
}

auto SyntaxRewriter::visit_children(const NodePtr& node) -> NodePtr {
    const auto& children = node->children();

    // Copy the child vector only once the first child actually changes.
    std::optional<std::vector<SyntaxChild>> replaced;
    for (size_t i = 0; i < children.size(); ++i) {
        const auto* child = std::get_if<NodePtr>(&children[i]);
        if (!child)
            continue;

        NodePtr result = visit(*child);
        if (result == *child)
            continue;

        if (!replaced) {
            replaced.emplace(children);
        }
        (*replaced)[i] = syntax::to_child(result);
    }

    if (!replaced)
        return node;

    REFORM_LOG_TRACE("rewrite", "rebuilt " << syntax::syntax_kind_name(node->kind()));
    return node->with_children(std::move(*replaced));
}

auto SyntaxRewriter::visit_source_file(const syntax::SourceFile& node,
                                       const syntax::SourceFile& original) -> NodePtr {
    if (auto statements = process_statements(node.statements(), original.statements())) {
        return node.with_statements(*statements).node();
    }
    return node.node();
}

auto SyntaxRewriter::visit_code_block(const syntax::CodeBlock& node,
                                      const syntax::CodeBlock& original) -> NodePtr {
    if (auto statements = process_statements(node.statements(), original.statements())) {
        return node.with_statements(*statements).node();
    }
    return node.node();
}

auto SyntaxRewriter::visit_closure_expr(const syntax::ClosureExpr& node,
                                        const syntax::ClosureExpr& original) -> NodePtr {
    if (auto statements = process_statements(node.statements(), original.statements())) {
        return node.with_statements(*statements).node();
    }
    return node.node();
}

auto SyntaxRewriter::process_statements(const syntax::CodeBlockItemList& /*statements*/,
                                        const syntax::CodeBlockItemList& /*original*/)
    -> std::optional<syntax::CodeBlockItemList> {
    return std::nullopt;
}

} // namespace reform::rewrite
