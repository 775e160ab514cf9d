//! # Tokens
//!
//! A token is an indivisible lexical unit together with the trivia around
//! it. Tokens are immutable: the `with_*` methods return new tokens.
//!
//! ## Token Categories
//!
//! | Category    | Kinds                                              |
//! |-------------|----------------------------------------------------|
//! | Keywords    | `var`, `let`, `func`, `if`, `else`, `return`, `in` |
//! | Modifiers   | `private`, `public`, `static`                      |
//! | Names       | `Identifier`                                       |
//! | Literals    | `IntegerLiteral`, `StringLiteral`                  |
//! | Punctuation | `,` `:` `=` `(` `)` `{` `}` `;` `->`               |
//! | Special     | `Unknown`, `Eof`                                   |

#ifndef REFORM_SYNTAX_TOKEN_HPP
#define REFORM_SYNTAX_TOKEN_HPP

#include "common.hpp"
#include "syntax/trivia.hpp"

#include <cstdint>
#include <ostream>
#include <string>
#include <string_view>

namespace reform::syntax {

/// All token kinds known to the syntax model.
enum class TokenKind : uint8_t {
    Eof, ///< End of file; carries the file's final trivia

    // Keywords
    KwVar,    ///< `var`
    KwLet,    ///< `let`
    KwFunc,   ///< `func`
    KwIf,     ///< `if`
    KwElse,   ///< `else`
    KwReturn, ///< `return`
    KwIn,     ///< `in` (closure signature terminator)

    // Declaration modifiers
    KwPrivate, ///< `private`
    KwPublic,  ///< `public`
    KwStatic,  ///< `static`

    Identifier,     ///< `count`, `_tmp`
    IntegerLiteral, ///< `42`
    StringLiteral,  ///< `"text"` (text includes the quotes)

    // Punctuation
    Comma,     ///< `,`
    Colon,     ///< `:`
    Equal,     ///< `=`
    LParen,    ///< `(`
    RParen,    ///< `)`
    LBrace,    ///< `{`
    RBrace,    ///< `}`
    Semicolon, ///< `;`
    Arrow,     ///< `->`

    Unknown, ///< Anything the parser could not classify
};

/// Returns the fixed spelling of a keyword or punctuation kind, or an
/// empty view for kinds whose text varies.
auto token_kind_text(TokenKind kind) -> std::string_view;

/// Returns a debug name for a token kind (e.g. "KwVar").
auto token_kind_name(TokenKind kind) -> const char*;

/// An immutable token.
class Token {
public:
    Token(TokenKind kind, std::string text, Trivia leading = {}, Trivia trailing = {})
        : kind_(kind), text_(std::move(text)), leading_(std::move(leading)),
          trailing_(std::move(trailing)) {}

    [[nodiscard]] auto kind() const -> TokenKind {
        return kind_;
    }
    [[nodiscard]] auto text() const -> const std::string& {
        return text_;
    }
    [[nodiscard]] auto leading_trivia() const -> const Trivia& {
        return leading_;
    }
    [[nodiscard]] auto trailing_trivia() const -> const Trivia& {
        return trailing_;
    }

    [[nodiscard]] auto is(TokenKind kind) const -> bool {
        return kind_ == kind;
    }

    [[nodiscard]] auto with_leading_trivia(Trivia trivia) const -> Rc<const Token>;
    [[nodiscard]] auto with_trailing_trivia(Trivia trivia) const -> Rc<const Token>;

    /// Writes leading trivia, text and trailing trivia.
    void write(std::ostream& out) const;

    /// Compares kind, text and both trivia sequences.
    [[nodiscard]] auto equals(const Token& other) const -> bool;

private:
    TokenKind kind_;
    std::string text_;
    Trivia leading_;
    Trivia trailing_;
};

using TokenPtr = Rc<const Token>;

} // namespace reform::syntax

#endif // REFORM_SYNTAX_TOKEN_HPP
