//! # Source Positions
//!
//! Nodes do not store their location: a rewritten tree shares nodes with
//! the original, so a stored offset would be wrong in one of them. Positions
//! are computed on demand by walking the tree from a root.

#ifndef REFORM_SYNTAX_SOURCE_POSITION_HPP
#define REFORM_SYNTAX_SOURCE_POSITION_HPP

#include "syntax/syntax.hpp"

#include <cstdint>
#include <optional>

namespace reform::syntax {

/// A location in the source text of a tree.
struct SourcePosition {
    uint32_t line = 1;   ///< 1-based line
    uint32_t column = 1; ///< 1-based column, in bytes
    uint32_t offset = 0; ///< 0-based byte offset

    [[nodiscard]] auto operator==(const SourcePosition& other) const -> bool = default;
};

/// Position of the first character of `target`'s first token text (leading
/// trivia skipped). `target` is found by identity. Returns `std::nullopt`
/// if `target` is not inside `root` or has no tokens.
[[nodiscard]] auto position_of(const NodePtr& root, const NodePtr& target)
    -> std::optional<SourcePosition>;

} // namespace reform::syntax

#endif // REFORM_SYNTAX_SOURCE_POSITION_HPP
