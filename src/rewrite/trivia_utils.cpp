#include "rewrite/trivia_utils.hpp"

#include <vector>

namespace reform::rewrite {

using syntax::NodePtr;
using syntax::TokenPtr;
using syntax::Trivia;
using syntax::TriviaKind;
using syntax::TriviaPiece;

namespace {

/// `trivia` without line breaks, except one after each line comment.
auto collapse_line_breaks(const Trivia& trivia) -> Trivia {
    const TriviaPiece line_break = line_break_like(trivia);
    std::vector<TriviaPiece> kept;
    kept.reserve(trivia.size() + 1);
    bool after_line_comment = false;
    for (const auto& piece : trivia) {
        if (piece.is_newline()) {
            if (after_line_comment)
                kept.push_back(line_break);
            after_line_comment = false;
            continue;
        }
        after_line_comment =
            piece.kind == TriviaKind::LineComment || piece.kind == TriviaKind::DocLineComment;
        kept.push_back(piece);
    }
    if (after_line_comment)
        kept.push_back(line_break);
    return Trivia(std::move(kept));
}

auto retrivia(const TokenPtr& token, const std::optional<Trivia>& leading,
              const std::optional<Trivia>& trailing) -> TokenPtr {
    return make_rc<syntax::Token>(token->kind(), token->text(),
                                  leading ? *leading : token->leading_trivia(),
                                  trailing ? *trailing : token->trailing_trivia());
}

auto replace_in(const NodePtr& node, const TokenPtr& target, const std::optional<Trivia>& leading,
                const std::optional<Trivia>& trailing) -> NodePtr {
    const auto& children = node->children();
    for (size_t i = 0; i < children.size(); ++i) {
        if (const auto* token = std::get_if<TokenPtr>(&children[i])) {
            if (*token == target) {
                return node->with_child(i, retrivia(*token, leading, trailing));
            }
        } else if (const auto* sub = std::get_if<NodePtr>(&children[i])) {
            NodePtr replaced = replace_in(*sub, target, leading, trailing);
            if (replaced != *sub) {
                return node->with_child(i, replaced);
            }
        }
    }
    return node;
}

} // namespace

auto line_break_like(const Trivia& trivia) -> TriviaPiece {
    for (const auto& piece : trivia) {
        if (piece.is_newline() && piece.count > 0)
            return TriviaPiece{piece.kind, 1, {}};
    }
    return TriviaPiece::newlines(1);
}

auto leading_trivia_for_new_line(const Trivia& original) -> Trivia {
    return Trivia{line_break_like(original)} + collapse_line_breaks(original);
}

auto leading_trivia_for_joined_line(const Trivia& original) -> Trivia {
    Trivia collapsed = collapse_line_breaks(original);
    auto first = collapsed.begin();
    while (first != collapsed.end() &&
           (first->kind == TriviaKind::Spaces || first->kind == TriviaKind::Tabs)) {
        ++first;
    }
    return Trivia(std::vector<TriviaPiece>(first, collapsed.end()));
}

auto replace_trivia(const NodePtr& node, const TokenPtr& token,
                    const std::optional<Trivia>& leading, const std::optional<Trivia>& trailing)
    -> NodePtr {
    if (!node || !token)
        return node;
    return replace_in(node, token, leading, trailing);
}

auto replace_leading_trivia(const NodePtr& node, const Trivia& leading) -> NodePtr {
    if (!node)
        return node;
    return replace_trivia(node, node->first_token(), leading);
}

} // namespace reform::rewrite
