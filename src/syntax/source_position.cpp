#include "syntax/source_position.hpp"

namespace reform::syntax {

namespace {

/// Walks tokens in source order, advancing a position over their text.
class PositionTracker {
public:
    void advance(const std::string& text) {
        for (char c : text) {
            ++pos_.offset;
            if (c == '\n') {
                ++pos_.line;
                pos_.column = 1;
            } else {
                ++pos_.column;
            }
        }
    }

    void advance(const Trivia& trivia) {
        if (trivia.empty())
            return;
        advance(trivia.to_string());
    }

    [[nodiscard]] auto position() const -> const SourcePosition& {
        return pos_;
    }

private:
    SourcePosition pos_;
};

/// Returns the first token of `target` if `target` is found under `node`;
/// `tracker` then stands at the start of that token. Otherwise advances
/// `tracker` past `node` and returns null.
auto locate(const NodePtr& node, const NodePtr& target, PositionTracker& tracker) -> TokenPtr {
    if (node == target) {
        return node->first_token();
    }
    for (const auto& child : node->children()) {
        if (const auto* token = std::get_if<TokenPtr>(&child)) {
            tracker.advance((*token)->leading_trivia());
            tracker.advance((*token)->text());
            tracker.advance((*token)->trailing_trivia());
        } else if (const auto* sub = std::get_if<NodePtr>(&child)) {
            if (auto found = locate(*sub, target, tracker))
                return found;
        }
    }
    return nullptr;
}

} // namespace

auto position_of(const NodePtr& root, const NodePtr& target) -> std::optional<SourcePosition> {
    if (!root || !target)
        return std::nullopt;

    PositionTracker tracker;
    auto first = locate(root, target, tracker);
    if (!first)
        return std::nullopt;

    tracker.advance(first->leading_trivia());
    return tracker.position();
}

} // namespace reform::syntax
