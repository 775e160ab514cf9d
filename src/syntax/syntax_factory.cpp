#include "syntax/syntax_factory.hpp"

#include <stdexcept>

namespace reform::syntax {

// ============================================================================
// Tokens
// ============================================================================

auto make_token(TokenKind kind, std::string text, Trivia leading, Trivia trailing) -> TokenPtr {
    return make_rc<Token>(kind, std::move(text), std::move(leading), std::move(trailing));
}

static auto make_fixed_token(TokenKind kind, Trivia leading, Trivia trailing) -> TokenPtr {
    auto text = token_kind_text(kind);
    if (text.empty()) {
        throw std::invalid_argument(std::string("token kind ") + token_kind_name(kind) +
                                    " has no fixed spelling");
    }
    return make_token(kind, std::string(text), std::move(leading), std::move(trailing));
}

auto make_keyword(TokenKind kind, Trivia leading, Trivia trailing) -> TokenPtr {
    return make_fixed_token(kind, std::move(leading), std::move(trailing));
}

auto make_punctuation(TokenKind kind, Trivia leading, Trivia trailing) -> TokenPtr {
    return make_fixed_token(kind, std::move(leading), std::move(trailing));
}

auto make_identifier(std::string name, Trivia leading, Trivia trailing) -> TokenPtr {
    return make_token(TokenKind::Identifier, std::move(name), std::move(leading),
                      std::move(trailing));
}

auto make_eof(Trivia leading) -> TokenPtr {
    return make_token(TokenKind::Eof, "", std::move(leading));
}

// ============================================================================
// Collections
// ============================================================================

static auto make_collection(SyntaxKind kind, const std::vector<NodePtr>& elements) -> NodePtr {
    std::vector<SyntaxChild> children;
    children.reserve(elements.size());
    for (const auto& element : elements) {
        children.push_back(to_child(element));
    }
    return make_node(kind, std::move(children));
}

static auto make_token_collection(SyntaxKind kind, const std::vector<TokenPtr>& tokens)
    -> NodePtr {
    std::vector<SyntaxChild> children;
    children.reserve(tokens.size());
    for (const auto& token : tokens) {
        children.push_back(to_child(token));
    }
    return make_node(kind, std::move(children));
}

// ============================================================================
// Statement Sequences and Rewrite Sites
// ============================================================================

auto make_code_block_item(const NodePtr& item, const TokenPtr& semicolon) -> NodePtr {
    return make_node(SyntaxKind::CodeBlockItem, {to_child(item), to_child(semicolon)});
}

auto make_code_block_item_list(const std::vector<NodePtr>& items) -> NodePtr {
    return make_collection(SyntaxKind::CodeBlockItemList, items);
}

auto make_source_file(const NodePtr& statements, const TokenPtr& eof) -> NodePtr {
    return make_node(SyntaxKind::SourceFile, {to_child(statements), to_child(eof)});
}

auto make_code_block(const TokenPtr& left_brace, const NodePtr& statements,
                     const TokenPtr& right_brace) -> NodePtr {
    return make_node(SyntaxKind::CodeBlock,
                     {to_child(left_brace), to_child(statements), to_child(right_brace)});
}

auto make_closure_expr(const TokenPtr& left_brace, const NodePtr& signature,
                       const NodePtr& statements, const TokenPtr& right_brace) -> NodePtr {
    return make_node(SyntaxKind::ClosureExpr, {to_child(left_brace), to_child(signature),
                                               to_child(statements), to_child(right_brace)});
}

auto make_closure_signature(const std::vector<TokenPtr>& tokens) -> NodePtr {
    return make_token_collection(SyntaxKind::ClosureSignature, tokens);
}

// ============================================================================
// Declarations and Statements
// ============================================================================

auto make_modifier_list(const std::vector<TokenPtr>& modifiers) -> NodePtr {
    return make_token_collection(SyntaxKind::ModifierList, modifiers);
}

auto make_variable_decl(const NodePtr& modifiers, const TokenPtr& keyword,
                        const NodePtr& bindings) -> NodePtr {
    return make_node(SyntaxKind::VariableDecl,
                     {to_child(modifiers), to_child(keyword), to_child(bindings)});
}

auto make_pattern_binding_list(const std::vector<NodePtr>& bindings) -> NodePtr {
    return make_collection(SyntaxKind::PatternBindingList, bindings);
}

auto make_pattern_binding(const NodePtr& pattern, const NodePtr& type_annotation,
                          const NodePtr& initializer, const TokenPtr& trailing_comma) -> NodePtr {
    return make_node(SyntaxKind::PatternBinding, {to_child(pattern), to_child(type_annotation),
                                                  to_child(initializer),
                                                  to_child(trailing_comma)});
}

auto make_identifier_pattern(const TokenPtr& identifier) -> NodePtr {
    return make_node(SyntaxKind::IdentifierPattern, {to_child(identifier)});
}

auto make_tuple_pattern(const std::vector<SyntaxChild>& children) -> NodePtr {
    return make_node(SyntaxKind::TuplePattern, children);
}

auto make_type_annotation(const TokenPtr& colon, const NodePtr& type) -> NodePtr {
    return make_node(SyntaxKind::TypeAnnotation, {to_child(colon), to_child(type)});
}

auto make_simple_type(const TokenPtr& name) -> NodePtr {
    return make_node(SyntaxKind::SimpleType, {to_child(name)});
}

auto make_initializer_clause(const TokenPtr& equal, const NodePtr& value) -> NodePtr {
    return make_node(SyntaxKind::InitializerClause, {to_child(equal), to_child(value)});
}

auto make_function_decl(const NodePtr& modifiers, const TokenPtr& func_keyword,
                        const TokenPtr& name, const NodePtr& parameters, const NodePtr& body)
    -> NodePtr {
    return make_node(SyntaxKind::FunctionDecl,
                     {to_child(modifiers), to_child(func_keyword), to_child(name),
                      to_child(parameters), to_child(body)});
}

auto make_parameter_clause(const std::vector<SyntaxChild>& children) -> NodePtr {
    return make_node(SyntaxKind::ParameterClause, children);
}

auto make_if_stmt(const TokenPtr& if_keyword, const NodePtr& condition, const NodePtr& body,
                  const TokenPtr& else_keyword, const NodePtr& else_body) -> NodePtr {
    return make_node(SyntaxKind::IfStmt, {to_child(if_keyword), to_child(condition),
                                          to_child(body), to_child(else_keyword),
                                          to_child(else_body)});
}

auto make_return_stmt(const TokenPtr& return_keyword, const NodePtr& expression) -> NodePtr {
    return make_node(SyntaxKind::ReturnStmt, {to_child(return_keyword), to_child(expression)});
}

// ============================================================================
// Expressions
// ============================================================================

auto make_identifier_expr(const TokenPtr& identifier) -> NodePtr {
    return make_node(SyntaxKind::IdentifierExpr, {to_child(identifier)});
}

auto make_integer_literal_expr(const TokenPtr& literal) -> NodePtr {
    return make_node(SyntaxKind::IntegerLiteralExpr, {to_child(literal)});
}

auto make_string_literal_expr(const TokenPtr& literal) -> NodePtr {
    return make_node(SyntaxKind::StringLiteralExpr, {to_child(literal)});
}

auto make_function_call_expr(const NodePtr& callee, const TokenPtr& left_paren,
                             const NodePtr& arguments, const TokenPtr& right_paren) -> NodePtr {
    return make_node(SyntaxKind::FunctionCallExpr, {to_child(callee), to_child(left_paren),
                                                    to_child(arguments),
                                                    to_child(right_paren)});
}

auto make_argument_list(const std::vector<SyntaxChild>& children) -> NodePtr {
    return make_node(SyntaxKind::ArgumentList, children);
}

auto make_unknown(const std::vector<SyntaxChild>& children) -> NodePtr {
    return make_node(SyntaxKind::Unknown, children);
}

} // namespace reform::syntax
