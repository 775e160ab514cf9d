//! # Trivia
//!
//! Trivia is the source text around a token that carries no meaning for the
//! program: whitespace, line breaks and comments. Every token owns a leading
//! trivia sequence (everything between the previous token and this one, up
//! to and including the indentation) and a trailing trivia sequence (the
//! rest of the line after the token, never containing a line break).
//!
//! ## Example
//!
//! ```text
//!     // counter
//!     var a, b: Int  // pair
//! ```
//!
//! The leading trivia of `var` is
//! `[newlines(1), spaces(4), line_comment("// counter"), newlines(1), spaces(4)]`
//! and the trailing trivia of `Int` is `[spaces(2), line_comment("// pair")]`.
//!
//! Writing the trivia and token text of a tree in order reproduces the
//! source file byte for byte.

#ifndef REFORM_SYNTAX_TRIVIA_HPP
#define REFORM_SYNTAX_TRIVIA_HPP

#include <cstdint>
#include <initializer_list>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace reform::syntax {

/// The kind of a single trivia piece.
enum class TriviaKind : uint8_t {
    Spaces,                  ///< ` ` repeated `count` times
    Tabs,                    ///< `\t` repeated `count` times
    Newlines,                ///< `\n` repeated `count` times
    CarriageReturns,         ///< `\r` repeated `count` times
    CarriageReturnLineFeeds, ///< `\r\n` repeated `count` times
    LineComment,             ///< `// ...` up to, not including, the line break
    BlockComment,            ///< `/* ... */`
    DocLineComment,          ///< `/// ...`
};

/// Returns a debug name for a trivia kind.
auto trivia_kind_name(TriviaKind kind) -> const char*;

/// One piece of trivia: a repeated whitespace character or a comment.
struct TriviaPiece {
    TriviaKind kind;
    uint32_t count = 0; ///< Repeat count for whitespace kinds.
    std::string text;   ///< Full text for comment kinds.

    static auto spaces(uint32_t n) -> TriviaPiece {
        return {TriviaKind::Spaces, n, {}};
    }
    static auto tabs(uint32_t n) -> TriviaPiece {
        return {TriviaKind::Tabs, n, {}};
    }
    static auto newlines(uint32_t n) -> TriviaPiece {
        return {TriviaKind::Newlines, n, {}};
    }
    static auto carriage_returns(uint32_t n) -> TriviaPiece {
        return {TriviaKind::CarriageReturns, n, {}};
    }
    static auto carriage_return_line_feeds(uint32_t n) -> TriviaPiece {
        return {TriviaKind::CarriageReturnLineFeeds, n, {}};
    }
    static auto line_comment(std::string text) -> TriviaPiece {
        return {TriviaKind::LineComment, 0, std::move(text)};
    }
    static auto block_comment(std::string text) -> TriviaPiece {
        return {TriviaKind::BlockComment, 0, std::move(text)};
    }
    static auto doc_line_comment(std::string text) -> TriviaPiece {
        return {TriviaKind::DocLineComment, 0, std::move(text)};
    }

    /// True for the three line-break kinds.
    [[nodiscard]] auto is_newline() const -> bool;

    /// True for the three comment kinds.
    [[nodiscard]] auto is_comment() const -> bool;

    /// Writes the exact source text of this piece.
    void write(std::ostream& out) const;

    [[nodiscard]] auto operator==(const TriviaPiece& other) const -> bool = default;
};

/// An ordered sequence of trivia pieces.
///
/// Trivia values are immutable in practice: every operation returns a new
/// sequence.
class Trivia {
public:
    using const_iterator = std::vector<TriviaPiece>::const_iterator;

    Trivia() = default;
    Trivia(std::initializer_list<TriviaPiece> pieces) : pieces_(pieces) {}
    explicit Trivia(std::vector<TriviaPiece> pieces) : pieces_(std::move(pieces)) {}

    static auto newlines(uint32_t n) -> Trivia {
        return Trivia{TriviaPiece::newlines(n)};
    }
    static auto spaces(uint32_t n) -> Trivia {
        return Trivia{TriviaPiece::spaces(n)};
    }

    [[nodiscard]] auto pieces() const -> const std::vector<TriviaPiece>& {
        return pieces_;
    }
    [[nodiscard]] auto empty() const -> bool {
        return pieces_.empty();
    }
    [[nodiscard]] auto size() const -> size_t {
        return pieces_.size();
    }
    [[nodiscard]] auto begin() const -> const_iterator {
        return pieces_.begin();
    }
    [[nodiscard]] auto end() const -> const_iterator {
        return pieces_.end();
    }
    [[nodiscard]] auto operator[](size_t i) const -> const TriviaPiece& {
        return pieces_[i];
    }

    /// Returns a copy with `piece` appended.
    [[nodiscard]] auto appending(TriviaPiece piece) const -> Trivia;

    /// Returns a copy with every line-break piece removed. Spaces, tabs and
    /// comments stay in their original relative order.
    [[nodiscard]] auto without_newlines() const -> Trivia;

    /// Total number of line breaks across all line-break pieces.
    [[nodiscard]] auto newline_count() const -> uint32_t;

    [[nodiscard]] auto contains_newlines() const -> bool;

    /// Writes the exact source text of the sequence.
    void write(std::ostream& out) const;

    [[nodiscard]] auto to_string() const -> std::string;

    [[nodiscard]] auto operator==(const Trivia& other) const -> bool = default;

private:
    std::vector<TriviaPiece> pieces_;
};

/// Concatenates two trivia sequences.
[[nodiscard]] auto operator+(const Trivia& lhs, const Trivia& rhs) -> Trivia;

/// Debug rendering, e.g. `[newlines(1), spaces(4), line_comment("// x")]`.
auto operator<<(std::ostream& out, const Trivia& trivia) -> std::ostream&;

} // namespace reform::syntax

#endif // REFORM_SYNTAX_TRIVIA_HPP
