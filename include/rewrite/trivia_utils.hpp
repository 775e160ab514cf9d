//! # Trivia Utilities
//!
//! Helpers for rules that move tokens between lines. Moving a token keeps
//! the comments and indentation that were attached to it; only line breaks
//! are synthesized.

#ifndef REFORM_REWRITE_TRIVIA_UTILS_HPP
#define REFORM_REWRITE_TRIVIA_UTILS_HPP

#include "syntax/syntax.hpp"

#include <optional>

namespace reform::rewrite {

/// A single line break of the kind first used in `trivia` (`\n`, `\r\n`
/// or `\r`), or `\n` if `trivia` has none.
[[nodiscard]] auto line_break_like(const syntax::Trivia& trivia) -> syntax::TriviaPiece;

/// Leading trivia for a token that now starts a new line: exactly one line
/// break followed by `original` with its line breaks removed. A line
/// comment keeps a single line break after it so the token stays code.
/// Synthesized breaks use `line_break_like(original)`, so CRLF files stay
/// CRLF.
///
/// ```text
/// [newlines(2), spaces(2), line_comment("// b")]
///     -> [newlines(1), spaces(2), line_comment("// b"), newlines(1)]
/// ```
[[nodiscard]] auto leading_trivia_for_new_line(const syntax::Trivia& original) -> syntax::Trivia;

/// Leading trivia for a token that used to start a line and now follows
/// another token on the same line: line breaks removed as above, and the
/// indentation in front of the first remaining piece dropped.
[[nodiscard]] auto leading_trivia_for_joined_line(const syntax::Trivia& original)
    -> syntax::Trivia;

/// Returns `node` with `token` (found by identity) carrying new trivia.
/// Either side left as `std::nullopt` keeps the token's current trivia.
/// Only the nodes on the path to `token` are reallocated; if `token` is not
/// under `node`, `node` is returned unchanged.
[[nodiscard]] auto replace_trivia(const syntax::NodePtr& node, const syntax::TokenPtr& token,
                                  const std::optional<syntax::Trivia>& leading,
                                  const std::optional<syntax::Trivia>& trailing = std::nullopt)
    -> syntax::NodePtr;

/// Returns `node` with the leading trivia of its first token replaced.
[[nodiscard]] auto replace_leading_trivia(const syntax::NodePtr& node,
                                          const syntax::Trivia& leading) -> syntax::NodePtr;

} // namespace reform::rewrite

#endif // REFORM_REWRITE_TRIVIA_UTILS_HPP
