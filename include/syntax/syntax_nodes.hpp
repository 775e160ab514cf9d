//! # Typed Syntax Views
//!
//! Thin, copyable wrappers around a `NodePtr` of a known kind. A view names
//! the slots of its kind's layout and offers persistent `with_*` updates
//! that return a new view over a new node.
//!
//! ## Views
//!
//! | View                 | Layout                                         |
//! |----------------------|------------------------------------------------|
//! | `SourceFile`         | statements, eof                                |
//! | `CodeBlock`          | `{`, statements, `}`                           |
//! | `ClosureExpr`        | `{`, signature?, statements, `}`               |
//! | `CodeBlockItemList`  | CodeBlockItem*                                 |
//! | `CodeBlockItem`      | item, `;`?                                     |
//! | `VariableDecl`       | modifiers?, `var`/`let`, bindings              |
//! | `PatternBindingList` | PatternBinding*                                |
//! | `PatternBinding`     | pattern, type_annotation?, initializer?, `,`?  |
//! | `TypeAnnotation`     | `:`, type                                      |
//!
//! Constructing a view from a node of another kind throws
//! `std::invalid_argument`; use `cast()` to test and convert.

#ifndef REFORM_SYNTAX_SYNTAX_NODES_HPP
#define REFORM_SYNTAX_SYNTAX_NODES_HPP

#include "syntax/syntax.hpp"

#include <optional>
#include <vector>

namespace reform::syntax {

/// Common base of all typed views.
class SyntaxView {
public:
    [[nodiscard]] auto node() const -> const NodePtr& {
        return node_;
    }

protected:
    /// Throws `std::invalid_argument` if `node` is null or of another kind.
    SyntaxView(NodePtr node, SyntaxKind expected);

    NodePtr node_;
};

/// Returns `View(node)` if `node` has the view's kind.
template <typename View> auto cast_node(const NodePtr& node) -> std::optional<View> {
    if (!node || node->kind() != View::KIND)
        return std::nullopt;
    return View(node);
}

class CodeBlockItem;
class PatternBinding;

// ============================================================================
// Statement Sequences
// ============================================================================

/// An ordered statement sequence. Shared by source files, code blocks and
/// closure bodies.
class CodeBlockItemList : public SyntaxView {
public:
    static constexpr SyntaxKind KIND = SyntaxKind::CodeBlockItemList;

    explicit CodeBlockItemList(NodePtr node) : SyntaxView(std::move(node), KIND) {}

    static auto cast(const NodePtr& node) -> std::optional<CodeBlockItemList> {
        return cast_node<CodeBlockItemList>(node);
    }

    [[nodiscard]] auto size() const -> size_t {
        return node_->size();
    }
    [[nodiscard]] auto empty() const -> bool {
        return node_->size() == 0;
    }
    [[nodiscard]] auto at(size_t index) const -> CodeBlockItem;
    [[nodiscard]] auto items() const -> std::vector<CodeBlockItem>;
};

/// One statement in a sequence, with its optional `;`.
class CodeBlockItem : public SyntaxView {
public:
    static constexpr SyntaxKind KIND = SyntaxKind::CodeBlockItem;
    static constexpr size_t ITEM = 0;
    static constexpr size_t SEMICOLON = 1;

    explicit CodeBlockItem(NodePtr node) : SyntaxView(std::move(node), KIND) {}

    static auto cast(const NodePtr& node) -> std::optional<CodeBlockItem> {
        return cast_node<CodeBlockItem>(node);
    }

    [[nodiscard]] auto item() const -> NodePtr {
        return node_->node_at(ITEM);
    }
    [[nodiscard]] auto semicolon() const -> TokenPtr {
        return node_->token_at(SEMICOLON);
    }
    [[nodiscard]] auto with_item(const NodePtr& item) const -> CodeBlockItem;
};

// ============================================================================
// Rewrite Sites
// ============================================================================

/// The root of a parsed file.
class SourceFile : public SyntaxView {
public:
    static constexpr SyntaxKind KIND = SyntaxKind::SourceFile;
    static constexpr size_t STATEMENTS = 0;
    static constexpr size_t EOF_TOKEN = 1;

    explicit SourceFile(NodePtr node) : SyntaxView(std::move(node), KIND) {}

    static auto cast(const NodePtr& node) -> std::optional<SourceFile> {
        return cast_node<SourceFile>(node);
    }

    [[nodiscard]] auto statements() const -> CodeBlockItemList {
        return CodeBlockItemList(node_->node_at(STATEMENTS));
    }
    [[nodiscard]] auto eof_token() const -> TokenPtr {
        return node_->token_at(EOF_TOKEN);
    }
    [[nodiscard]] auto with_statements(const CodeBlockItemList& statements) const -> SourceFile {
        return SourceFile(node_->with_child(STATEMENTS, statements.node()));
    }
};

/// A braced statement block (function bodies, `if` branches).
class CodeBlock : public SyntaxView {
public:
    static constexpr SyntaxKind KIND = SyntaxKind::CodeBlock;
    static constexpr size_t LEFT_BRACE = 0;
    static constexpr size_t STATEMENTS = 1;
    static constexpr size_t RIGHT_BRACE = 2;

    explicit CodeBlock(NodePtr node) : SyntaxView(std::move(node), KIND) {}

    static auto cast(const NodePtr& node) -> std::optional<CodeBlock> {
        return cast_node<CodeBlock>(node);
    }

    [[nodiscard]] auto left_brace() const -> TokenPtr {
        return node_->token_at(LEFT_BRACE);
    }
    [[nodiscard]] auto statements() const -> CodeBlockItemList {
        return CodeBlockItemList(node_->node_at(STATEMENTS));
    }
    [[nodiscard]] auto right_brace() const -> TokenPtr {
        return node_->token_at(RIGHT_BRACE);
    }
    [[nodiscard]] auto with_statements(const CodeBlockItemList& statements) const -> CodeBlock {
        return CodeBlock(node_->with_child(STATEMENTS, statements.node()));
    }
};

/// An anonymous function: `{ x in ... }`.
class ClosureExpr : public SyntaxView {
public:
    static constexpr SyntaxKind KIND = SyntaxKind::ClosureExpr;
    static constexpr size_t LEFT_BRACE = 0;
    static constexpr size_t SIGNATURE = 1;
    static constexpr size_t STATEMENTS = 2;
    static constexpr size_t RIGHT_BRACE = 3;

    explicit ClosureExpr(NodePtr node) : SyntaxView(std::move(node), KIND) {}

    static auto cast(const NodePtr& node) -> std::optional<ClosureExpr> {
        return cast_node<ClosureExpr>(node);
    }

    [[nodiscard]] auto left_brace() const -> TokenPtr {
        return node_->token_at(LEFT_BRACE);
    }
    [[nodiscard]] auto signature() const -> NodePtr {
        return node_->node_at(SIGNATURE);
    }
    [[nodiscard]] auto statements() const -> CodeBlockItemList {
        return CodeBlockItemList(node_->node_at(STATEMENTS));
    }
    [[nodiscard]] auto right_brace() const -> TokenPtr {
        return node_->token_at(RIGHT_BRACE);
    }
    [[nodiscard]] auto with_statements(const CodeBlockItemList& statements) const -> ClosureExpr {
        return ClosureExpr(node_->with_child(STATEMENTS, statements.node()));
    }
};

// ============================================================================
// Variable Declarations
// ============================================================================

/// `name: Type`
class TypeAnnotation : public SyntaxView {
public:
    static constexpr SyntaxKind KIND = SyntaxKind::TypeAnnotation;
    static constexpr size_t COLON = 0;
    static constexpr size_t TYPE = 1;

    explicit TypeAnnotation(NodePtr node) : SyntaxView(std::move(node), KIND) {}

    static auto cast(const NodePtr& node) -> std::optional<TypeAnnotation> {
        return cast_node<TypeAnnotation>(node);
    }

    [[nodiscard]] auto colon() const -> TokenPtr {
        return node_->token_at(COLON);
    }
    [[nodiscard]] auto type() const -> NodePtr {
        return node_->node_at(TYPE);
    }
};

/// The comma-separated bindings of a declaration.
class PatternBindingList : public SyntaxView {
public:
    static constexpr SyntaxKind KIND = SyntaxKind::PatternBindingList;

    explicit PatternBindingList(NodePtr node) : SyntaxView(std::move(node), KIND) {}

    static auto cast(const NodePtr& node) -> std::optional<PatternBindingList> {
        return cast_node<PatternBindingList>(node);
    }

    [[nodiscard]] auto size() const -> size_t {
        return node_->size();
    }
    [[nodiscard]] auto at(size_t index) const -> PatternBinding;
    [[nodiscard]] auto bindings() const -> std::vector<PatternBinding>;
};

/// One binding: `a`, `b: Int`, `c = 1`, `(x, y) = pair`.
class PatternBinding : public SyntaxView {
public:
    static constexpr SyntaxKind KIND = SyntaxKind::PatternBinding;
    static constexpr size_t PATTERN = 0;
    static constexpr size_t TYPE_ANNOTATION = 1;
    static constexpr size_t INITIALIZER = 2;
    static constexpr size_t TRAILING_COMMA = 3;

    explicit PatternBinding(NodePtr node) : SyntaxView(std::move(node), KIND) {}

    static auto cast(const NodePtr& node) -> std::optional<PatternBinding> {
        return cast_node<PatternBinding>(node);
    }

    [[nodiscard]] auto pattern() const -> NodePtr {
        return node_->node_at(PATTERN);
    }
    [[nodiscard]] auto type_annotation() const -> std::optional<TypeAnnotation> {
        return TypeAnnotation::cast(node_->node_at(TYPE_ANNOTATION));
    }
    [[nodiscard]] auto initializer() const -> NodePtr {
        return node_->node_at(INITIALIZER);
    }
    [[nodiscard]] auto trailing_comma() const -> TokenPtr {
        return node_->token_at(TRAILING_COMMA);
    }

    [[nodiscard]] auto
    with_type_annotation(const std::optional<TypeAnnotation>& annotation) const -> PatternBinding;

    /// A null token removes the comma.
    [[nodiscard]] auto with_trailing_comma(const TokenPtr& comma) const -> PatternBinding;
};

/// A `var`/`let` declaration with one or more bindings.
class VariableDecl : public SyntaxView {
public:
    static constexpr SyntaxKind KIND = SyntaxKind::VariableDecl;
    static constexpr size_t MODIFIERS = 0;
    static constexpr size_t KEYWORD = 1;
    static constexpr size_t BINDINGS = 2;

    explicit VariableDecl(NodePtr node) : SyntaxView(std::move(node), KIND) {}

    static auto cast(const NodePtr& node) -> std::optional<VariableDecl> {
        return cast_node<VariableDecl>(node);
    }

    [[nodiscard]] auto modifiers() const -> NodePtr {
        return node_->node_at(MODIFIERS);
    }
    [[nodiscard]] auto keyword() const -> TokenPtr {
        return node_->token_at(KEYWORD);
    }
    [[nodiscard]] auto bindings() const -> PatternBindingList {
        return PatternBindingList(node_->node_at(BINDINGS));
    }
    [[nodiscard]] auto with_bindings(const PatternBindingList& bindings) const -> VariableDecl {
        return VariableDecl(node_->with_child(BINDINGS, bindings.node()));
    }
};

} // namespace reform::syntax

#endif // REFORM_SYNTAX_SYNTAX_NODES_HPP
