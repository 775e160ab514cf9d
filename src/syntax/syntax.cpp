//! # Syntax Tree Implementation
//!
//! Node accessors, persistent updates and source reconstruction.

#include "syntax/syntax.hpp"

#include <sstream>
#include <stdexcept>

namespace reform::syntax {

auto syntax_kind_name(SyntaxKind kind) -> const char* {
    switch (kind) {
    case SyntaxKind::SourceFile:
        return "SourceFile";
    case SyntaxKind::CodeBlockItemList:
        return "CodeBlockItemList";
    case SyntaxKind::CodeBlockItem:
        return "CodeBlockItem";
    case SyntaxKind::CodeBlock:
        return "CodeBlock";
    case SyntaxKind::ClosureExpr:
        return "ClosureExpr";
    case SyntaxKind::ClosureSignature:
        return "ClosureSignature";
    case SyntaxKind::FunctionDecl:
        return "FunctionDecl";
    case SyntaxKind::ParameterClause:
        return "ParameterClause";
    case SyntaxKind::IfStmt:
        return "IfStmt";
    case SyntaxKind::ReturnStmt:
        return "ReturnStmt";
    case SyntaxKind::VariableDecl:
        return "VariableDecl";
    case SyntaxKind::ModifierList:
        return "ModifierList";
    case SyntaxKind::PatternBindingList:
        return "PatternBindingList";
    case SyntaxKind::PatternBinding:
        return "PatternBinding";
    case SyntaxKind::IdentifierPattern:
        return "IdentifierPattern";
    case SyntaxKind::TuplePattern:
        return "TuplePattern";
    case SyntaxKind::TypeAnnotation:
        return "TypeAnnotation";
    case SyntaxKind::SimpleType:
        return "SimpleType";
    case SyntaxKind::InitializerClause:
        return "InitializerClause";
    case SyntaxKind::IdentifierExpr:
        return "IdentifierExpr";
    case SyntaxKind::IntegerLiteralExpr:
        return "IntegerLiteralExpr";
    case SyntaxKind::StringLiteralExpr:
        return "StringLiteralExpr";
    case SyntaxKind::FunctionCallExpr:
        return "FunctionCallExpr";
    case SyntaxKind::ArgumentList:
        return "ArgumentList";
    case SyntaxKind::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

auto is_collection_kind(SyntaxKind kind) -> bool {
    switch (kind) {
    case SyntaxKind::CodeBlockItemList:
    case SyntaxKind::ClosureSignature:
    case SyntaxKind::ParameterClause:
    case SyntaxKind::ModifierList:
    case SyntaxKind::PatternBindingList:
    case SyntaxKind::TuplePattern:
    case SyntaxKind::ArgumentList:
    case SyntaxKind::Unknown:
        return true;
    default:
        return false;
    }
}

// ============================================================================
// Node Accessors
// ============================================================================

auto Node::child(size_t index) const -> const SyntaxChild& {
    if (index >= children_.size()) {
        throw std::out_of_range(std::string("child index ") + std::to_string(index) +
                                " out of range for " + syntax_kind_name(kind_));
    }
    return children_[index];
}

auto Node::token_at(size_t index) const -> TokenPtr {
    if (index >= children_.size())
        return nullptr;
    if (const auto* token = std::get_if<TokenPtr>(&children_[index])) {
        return *token;
    }
    return nullptr;
}

auto Node::node_at(size_t index) const -> NodePtr {
    if (index >= children_.size())
        return nullptr;
    if (const auto* node = std::get_if<NodePtr>(&children_[index])) {
        return *node;
    }
    return nullptr;
}

auto Node::first_token() const -> TokenPtr {
    for (const auto& child : children_) {
        if (const auto* token = std::get_if<TokenPtr>(&child)) {
            if (*token)
                return *token;
        } else if (const auto* node = std::get_if<NodePtr>(&child)) {
            if (*node) {
                if (auto found = (*node)->first_token())
                    return found;
            }
        }
    }
    return nullptr;
}

auto Node::last_token() const -> TokenPtr {
    for (auto it = children_.rbegin(); it != children_.rend(); ++it) {
        if (const auto* token = std::get_if<TokenPtr>(&*it)) {
            if (*token)
                return *token;
        } else if (const auto* node = std::get_if<NodePtr>(&*it)) {
            if (*node) {
                if (auto found = (*node)->last_token())
                    return found;
            }
        }
    }
    return nullptr;
}

// ============================================================================
// Persistent Updates
// ============================================================================

auto Node::with_child(size_t index, SyntaxChild child) const -> NodePtr {
    if (index >= children_.size()) {
        throw std::out_of_range(std::string("cannot replace child ") + std::to_string(index) +
                                " of " + syntax_kind_name(kind_));
    }
    auto children = children_;
    children[index] = std::move(child);
    return make_node(kind_, std::move(children));
}

auto Node::with_children(std::vector<SyntaxChild> children) const -> NodePtr {
    return make_node(kind_, std::move(children));
}

auto make_node(SyntaxKind kind, std::vector<SyntaxChild> children) -> NodePtr {
    return make_rc<Node>(kind, std::move(children));
}

auto to_child(const TokenPtr& token) -> SyntaxChild {
    if (!token)
        return std::monostate{};
    return token;
}

auto to_child(const NodePtr& node) -> SyntaxChild {
    if (!node)
        return std::monostate{};
    return node;
}

// ============================================================================
// Source Reconstruction
// ============================================================================

void Node::for_each_token(const std::function<void(const TokenPtr&)>& fn) const {
    for (const auto& child : children_) {
        if (const auto* token = std::get_if<TokenPtr>(&child)) {
            if (*token)
                fn(*token);
        } else if (const auto* node = std::get_if<NodePtr>(&child)) {
            if (*node)
                (*node)->for_each_token(fn);
        }
    }
}

void Node::write(std::ostream& out) const {
    for_each_token([&out](const TokenPtr& token) { token->write(out); });
}

auto Node::to_source() const -> std::string {
    std::ostringstream oss;
    write(oss);
    return oss.str();
}

auto Node::trimmed_source() const -> std::string {
    auto first = first_token();
    auto last = last_token();
    std::ostringstream oss;
    for_each_token([&](const TokenPtr& token) {
        if (token != first)
            token->leading_trivia().write(oss);
        oss << token->text();
        if (token != last)
            token->trailing_trivia().write(oss);
    });
    return oss.str();
}

auto Node::equals(const Node& other) const -> bool {
    if (kind_ != other.kind_ || children_.size() != other.children_.size())
        return false;

    for (size_t i = 0; i < children_.size(); ++i) {
        const auto& lhs = children_[i];
        const auto& rhs = other.children_[i];
        if (lhs.index() != rhs.index())
            return false;
        if (const auto* token = std::get_if<TokenPtr>(&lhs)) {
            const auto& other_token = std::get<TokenPtr>(rhs);
            if (*token != other_token && !(*token)->equals(*other_token))
                return false;
        } else if (const auto* node = std::get_if<NodePtr>(&lhs)) {
            const auto& other_node = std::get<NodePtr>(rhs);
            if (*node != other_node && !(*node)->equals(*other_node))
                return false;
        }
    }
    return true;
}

static void dump_node(std::ostringstream& out, const Node& node, int depth) {
    out << std::string(static_cast<size_t>(depth) * 2, ' ') << syntax_kind_name(node.kind())
        << "\n";
    for (const auto& child : node.children()) {
        if (const auto* token = std::get_if<TokenPtr>(&child)) {
            out << std::string(static_cast<size_t>(depth + 1) * 2, ' ')
                << token_kind_name((*token)->kind()) << " \"" << (*token)->text() << "\" "
                << (*token)->leading_trivia() << " " << (*token)->trailing_trivia() << "\n";
        } else if (const auto* sub = std::get_if<NodePtr>(&child)) {
            dump_node(out, **sub, depth + 1);
        } else {
            out << std::string(static_cast<size_t>(depth + 1) * 2, ' ') << "<absent>\n";
        }
    }
}

auto dump(const NodePtr& node) -> std::string {
    std::ostringstream oss;
    if (node) {
        dump_node(oss, *node, 0);
    }
    return oss.str();
}

} // namespace reform::syntax
