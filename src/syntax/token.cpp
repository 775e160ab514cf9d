#include "syntax/token.hpp"

namespace reform::syntax {

auto token_kind_text(TokenKind kind) -> std::string_view {
    switch (kind) {
    case TokenKind::KwVar:
        return "var";
    case TokenKind::KwLet:
        return "let";
    case TokenKind::KwFunc:
        return "func";
    case TokenKind::KwIf:
        return "if";
    case TokenKind::KwElse:
        return "else";
    case TokenKind::KwReturn:
        return "return";
    case TokenKind::KwIn:
        return "in";
    case TokenKind::KwPrivate:
        return "private";
    case TokenKind::KwPublic:
        return "public";
    case TokenKind::KwStatic:
        return "static";
    case TokenKind::Comma:
        return ",";
    case TokenKind::Colon:
        return ":";
    case TokenKind::Equal:
        return "=";
    case TokenKind::LParen:
        return "(";
    case TokenKind::RParen:
        return ")";
    case TokenKind::LBrace:
        return "{";
    case TokenKind::RBrace:
        return "}";
    case TokenKind::Semicolon:
        return ";";
    case TokenKind::Arrow:
        return "->";
    case TokenKind::Eof:
    case TokenKind::Identifier:
    case TokenKind::IntegerLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::Unknown:
        return {};
    }
    return {};
}

auto token_kind_name(TokenKind kind) -> const char* {
    switch (kind) {
    case TokenKind::Eof:
        return "Eof";
    case TokenKind::KwVar:
        return "KwVar";
    case TokenKind::KwLet:
        return "KwLet";
    case TokenKind::KwFunc:
        return "KwFunc";
    case TokenKind::KwIf:
        return "KwIf";
    case TokenKind::KwElse:
        return "KwElse";
    case TokenKind::KwReturn:
        return "KwReturn";
    case TokenKind::KwIn:
        return "KwIn";
    case TokenKind::KwPrivate:
        return "KwPrivate";
    case TokenKind::KwPublic:
        return "KwPublic";
    case TokenKind::KwStatic:
        return "KwStatic";
    case TokenKind::Identifier:
        return "Identifier";
    case TokenKind::IntegerLiteral:
        return "IntegerLiteral";
    case TokenKind::StringLiteral:
        return "StringLiteral";
    case TokenKind::Comma:
        return "Comma";
    case TokenKind::Colon:
        return "Colon";
    case TokenKind::Equal:
        return "Equal";
    case TokenKind::LParen:
        return "LParen";
    case TokenKind::RParen:
        return "RParen";
    case TokenKind::LBrace:
        return "LBrace";
    case TokenKind::RBrace:
        return "RBrace";
    case TokenKind::Semicolon:
        return "Semicolon";
    case TokenKind::Arrow:
        return "Arrow";
    case TokenKind::Unknown:
        return "Unknown";
    }
    return "Unknown";
}

auto Token::with_leading_trivia(Trivia trivia) const -> Rc<const Token> {
    return make_rc<Token>(kind_, text_, std::move(trivia), trailing_);
}

auto Token::with_trailing_trivia(Trivia trivia) const -> Rc<const Token> {
    return make_rc<Token>(kind_, text_, leading_, std::move(trivia));
}

void Token::write(std::ostream& out) const {
    leading_.write(out);
    out << text_;
    trailing_.write(out);
}

auto Token::equals(const Token& other) const -> bool {
    return kind_ == other.kind_ && text_ == other.text_ && leading_ == other.leading_ &&
           trailing_ == other.trailing_;
}

} // namespace reform::syntax
