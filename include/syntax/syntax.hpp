//! # Syntax Tree
//!
//! The syntax tree is immutable and persistent. A `Node` is a kind plus an
//! ordered list of children; a child is a token, a node, or an empty slot.
//! Nodes are only ever held through `NodePtr` (`Rc<const Node>`), so a
//! rewrite builds new nodes along the changed path and shares every other
//! subtree with the original tree.
//!
//! ## Layouts
//!
//! Most kinds have a fixed layout: a known number of slots, some optional.
//! An absent optional slot holds `std::monostate`. Collection kinds
//! (`CodeBlockItemList`, `PatternBindingList`, ...) have a variable number
//! of children and no empty slots. The slot indices of each fixed layout
//! are listed in `syntax_nodes.hpp`.
//!
//! ## Ownership Model
//!
//! ```text
//! SourceFile ─┬─ CodeBlockItemList ─┬─ CodeBlockItem ── VariableDecl ...
//!             │                     └─ CodeBlockItem ── FunctionCallExpr ...
//!             └─ Eof token
//! ```
//!
//! Replacing the `VariableDecl` above allocates a new `CodeBlockItem`,
//! `CodeBlockItemList` and `SourceFile`; the second `CodeBlockItem` and the
//! `Eof` token are shared.

#ifndef REFORM_SYNTAX_SYNTAX_HPP
#define REFORM_SYNTAX_SYNTAX_HPP

#include "common.hpp"
#include "syntax/token.hpp"

#include <cstdint>
#include <functional>
#include <ostream>
#include <string>
#include <variant>
#include <vector>

namespace reform::syntax {

/// All node kinds known to the syntax model.
enum class SyntaxKind : uint8_t {
    SourceFile,        ///< `[statements, eof]`
    CodeBlockItemList, ///< Collection of CodeBlockItem
    CodeBlockItem,     ///< `[item, semicolon?]`
    CodeBlock,         ///< `[{, statements, }]`
    ClosureExpr,       ///< `[{, signature?, statements, }]`
    ClosureSignature,  ///< Collection of tokens/nodes ending in `in`
    FunctionDecl,      ///< `[modifiers?, func, name, parameters, body]`
    ParameterClause,   ///< Collection: `(`, parameters, `)`
    IfStmt,            ///< `[if, condition, body, else?, else_body?]`
    ReturnStmt,        ///< `[return, expression?]`
    VariableDecl,      ///< `[modifiers?, var/let, bindings]`
    ModifierList,      ///< Collection of modifier tokens
    PatternBindingList,
    PatternBinding,     ///< `[pattern, type_annotation?, initializer?, comma?]`
    IdentifierPattern,  ///< `[identifier]`
    TuplePattern,       ///< Collection: `(`, patterns and commas, `)`
    TypeAnnotation,     ///< `[:, type]`
    SimpleType,         ///< `[identifier]`
    InitializerClause,  ///< `[=, value]`
    IdentifierExpr,     ///< `[identifier]`
    IntegerLiteralExpr, ///< `[literal]`
    StringLiteralExpr,  ///< `[literal]`
    FunctionCallExpr,   ///< `[callee, (, arguments, )]`
    ArgumentList,       ///< Collection of expressions and commas
    Unknown,            ///< Collection of whatever the parser could not classify
};

/// Returns a debug name for a node kind (e.g. "VariableDecl").
auto syntax_kind_name(SyntaxKind kind) -> const char*;

/// True for kinds with a variable number of children.
auto is_collection_kind(SyntaxKind kind) -> bool;

class Node;

using NodePtr = Rc<const Node>;

/// A child slot: empty, a token, or a node.
using SyntaxChild = std::variant<std::monostate, TokenPtr, NodePtr>;

/// An immutable syntax node.
class Node {
public:
    Node(SyntaxKind kind, std::vector<SyntaxChild> children)
        : kind_(kind), children_(std::move(children)) {}

    [[nodiscard]] auto kind() const -> SyntaxKind {
        return kind_;
    }
    [[nodiscard]] auto is(SyntaxKind kind) const -> bool {
        return kind_ == kind;
    }
    [[nodiscard]] auto is_collection() const -> bool {
        return is_collection_kind(kind_);
    }

    [[nodiscard]] auto children() const -> const std::vector<SyntaxChild>& {
        return children_;
    }
    [[nodiscard]] auto size() const -> size_t {
        return children_.size();
    }

    /// Returns the child at `index`. Throws `std::out_of_range`.
    [[nodiscard]] auto child(size_t index) const -> const SyntaxChild&;

    /// Returns the token at `index`, or null if the slot is empty or holds a node.
    [[nodiscard]] auto token_at(size_t index) const -> TokenPtr;

    /// Returns the node at `index`, or null if the slot is empty or holds a token.
    [[nodiscard]] auto node_at(size_t index) const -> NodePtr;

    /// First token in source order, or null for a node without tokens.
    [[nodiscard]] auto first_token() const -> TokenPtr;

    /// Last token in source order, or null for a node without tokens.
    [[nodiscard]] auto last_token() const -> TokenPtr;

    /// Returns a new node with the child at `index` replaced. Every other
    /// child is shared. Throws `std::out_of_range`.
    [[nodiscard]] auto with_child(size_t index, SyntaxChild child) const -> NodePtr;

    /// Returns a new node of the same kind with the given children.
    [[nodiscard]] auto with_children(std::vector<SyntaxChild> children) const -> NodePtr;

    /// Calls `fn` on every token in source order.
    void for_each_token(const std::function<void(const TokenPtr&)>& fn) const;

    /// Writes the exact source text, trivia included.
    void write(std::ostream& out) const;

    [[nodiscard]] auto to_source() const -> std::string;

    /// Text without the leading trivia of the first token and the trailing
    /// trivia of the last token.
    [[nodiscard]] auto trimmed_source() const -> std::string;

    /// Structural equality: kinds, slot shapes, token text and trivia.
    [[nodiscard]] auto equals(const Node& other) const -> bool;

private:
    SyntaxKind kind_;
    std::vector<SyntaxChild> children_;
};

/// Allocates a node.
[[nodiscard]] auto make_node(SyntaxKind kind, std::vector<SyntaxChild> children) -> NodePtr;

/// True when the slot holds nothing.
inline auto is_empty(const SyntaxChild& child) -> bool {
    return std::holds_alternative<std::monostate>(child);
}

/// Wraps a possibly-null token as a child (null becomes an empty slot).
auto to_child(const TokenPtr& token) -> SyntaxChild;

/// Wraps a possibly-null node as a child (null becomes an empty slot).
auto to_child(const NodePtr& node) -> SyntaxChild;

/// Debug dump of the tree structure, one node or token per line.
auto dump(const NodePtr& node) -> std::string;

} // namespace reform::syntax

#endif // REFORM_SYNTAX_SYNTAX_HPP
