//! # Syntax Factory
//!
//! Construction functions for tokens and nodes. This is the interface a
//! parser uses to hand reform a tree, and the one rules use to build new
//! structure. Every `make_*` function lays out its children in the slot
//! order documented in `syntax_nodes.hpp`; null arguments become empty
//! optional slots.
//!
//! ## Example
//!
//! ```cpp
//! // var a, b: Int
//! auto decl = make_variable_decl(
//!     nullptr, make_keyword(TokenKind::KwVar, {}, Trivia::spaces(1)),
//!     make_pattern_binding_list({
//!         make_pattern_binding(make_identifier_pattern(make_identifier("a")), nullptr,
//!                              nullptr, make_punctuation(TokenKind::Comma, {}, Trivia::spaces(1))),
//!         make_pattern_binding(make_identifier_pattern(make_identifier("b")),
//!                              make_type_annotation(make_punctuation(TokenKind::Colon, {},
//!                                                                    Trivia::spaces(1)),
//!                                                   make_simple_type(make_identifier("Int"))),
//!                              nullptr, nullptr),
//!     }));
//! ```

#ifndef REFORM_SYNTAX_SYNTAX_FACTORY_HPP
#define REFORM_SYNTAX_SYNTAX_FACTORY_HPP

#include "syntax/syntax.hpp"

#include <string>
#include <vector>

namespace reform::syntax {

// ============================================================================
// Tokens
// ============================================================================

[[nodiscard]] auto make_token(TokenKind kind, std::string text, Trivia leading = {},
                              Trivia trailing = {}) -> TokenPtr;

/// Keyword or modifier token spelled by `token_kind_text(kind)`.
/// Throws `std::invalid_argument` for kinds without a fixed spelling.
[[nodiscard]] auto make_keyword(TokenKind kind, Trivia leading = {}, Trivia trailing = {})
    -> TokenPtr;

/// Punctuation token spelled by `token_kind_text(kind)`.
/// Throws `std::invalid_argument` for kinds without a fixed spelling.
[[nodiscard]] auto make_punctuation(TokenKind kind, Trivia leading = {}, Trivia trailing = {})
    -> TokenPtr;

[[nodiscard]] auto make_identifier(std::string name, Trivia leading = {}, Trivia trailing = {})
    -> TokenPtr;

[[nodiscard]] auto make_eof(Trivia leading = {}) -> TokenPtr;

// ============================================================================
// Statement Sequences and Rewrite Sites
// ============================================================================

[[nodiscard]] auto make_code_block_item(const NodePtr& item, const TokenPtr& semicolon = nullptr)
    -> NodePtr;

[[nodiscard]] auto make_code_block_item_list(const std::vector<NodePtr>& items) -> NodePtr;

[[nodiscard]] auto make_source_file(const NodePtr& statements, const TokenPtr& eof) -> NodePtr;

[[nodiscard]] auto make_code_block(const TokenPtr& left_brace, const NodePtr& statements,
                                   const TokenPtr& right_brace) -> NodePtr;

[[nodiscard]] auto make_closure_expr(const TokenPtr& left_brace, const NodePtr& signature,
                                     const NodePtr& statements, const TokenPtr& right_brace)
    -> NodePtr;

/// `x, y in`: parameter names (and their commas) followed by the `in` token.
[[nodiscard]] auto make_closure_signature(const std::vector<TokenPtr>& tokens) -> NodePtr;

// ============================================================================
// Declarations and Statements
// ============================================================================

[[nodiscard]] auto make_modifier_list(const std::vector<TokenPtr>& modifiers) -> NodePtr;

/// A declaration with `bindings` (a PatternBindingList). The list is taken
/// as the parser built it; a list without bindings is not rejected here.
[[nodiscard]] auto make_variable_decl(const NodePtr& modifiers, const TokenPtr& keyword,
                                      const NodePtr& bindings) -> NodePtr;

[[nodiscard]] auto make_pattern_binding_list(const std::vector<NodePtr>& bindings) -> NodePtr;

[[nodiscard]] auto make_pattern_binding(const NodePtr& pattern, const NodePtr& type_annotation,
                                        const NodePtr& initializer,
                                        const TokenPtr& trailing_comma) -> NodePtr;

[[nodiscard]] auto make_identifier_pattern(const TokenPtr& identifier) -> NodePtr;

/// `(a, b)`: children are the parenthesis tokens, element patterns and commas
/// in source order.
[[nodiscard]] auto make_tuple_pattern(const std::vector<SyntaxChild>& children) -> NodePtr;

[[nodiscard]] auto make_type_annotation(const TokenPtr& colon, const NodePtr& type) -> NodePtr;

[[nodiscard]] auto make_simple_type(const TokenPtr& name) -> NodePtr;

[[nodiscard]] auto make_initializer_clause(const TokenPtr& equal, const NodePtr& value)
    -> NodePtr;

[[nodiscard]] auto make_function_decl(const NodePtr& modifiers, const TokenPtr& func_keyword,
                                      const TokenPtr& name, const NodePtr& parameters,
                                      const NodePtr& body) -> NodePtr;

/// `(a: Int, b: Int)` as a flat sequence of tokens and nodes.
[[nodiscard]] auto make_parameter_clause(const std::vector<SyntaxChild>& children) -> NodePtr;

[[nodiscard]] auto make_if_stmt(const TokenPtr& if_keyword, const NodePtr& condition,
                                const NodePtr& body, const TokenPtr& else_keyword = nullptr,
                                const NodePtr& else_body = nullptr) -> NodePtr;

[[nodiscard]] auto make_return_stmt(const TokenPtr& return_keyword,
                                    const NodePtr& expression = nullptr) -> NodePtr;

// ============================================================================
// Expressions
// ============================================================================

[[nodiscard]] auto make_identifier_expr(const TokenPtr& identifier) -> NodePtr;

[[nodiscard]] auto make_integer_literal_expr(const TokenPtr& literal) -> NodePtr;

[[nodiscard]] auto make_string_literal_expr(const TokenPtr& literal) -> NodePtr;

[[nodiscard]] auto make_function_call_expr(const NodePtr& callee, const TokenPtr& left_paren,
                                           const NodePtr& arguments, const TokenPtr& right_paren)
    -> NodePtr;

/// Arguments and their commas in source order.
[[nodiscard]] auto make_argument_list(const std::vector<SyntaxChild>& children) -> NodePtr;

/// Anything the parser could not classify, kept verbatim.
[[nodiscard]] auto make_unknown(const std::vector<SyntaxChild>& children) -> NodePtr;

} // namespace reform::syntax

#endif // REFORM_SYNTAX_SYNTAX_FACTORY_HPP
