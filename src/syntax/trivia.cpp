#include "syntax/trivia.hpp"

#include <sstream>

namespace reform::syntax {

auto trivia_kind_name(TriviaKind kind) -> const char* {
    switch (kind) {
    case TriviaKind::Spaces:
        return "spaces";
    case TriviaKind::Tabs:
        return "tabs";
    case TriviaKind::Newlines:
        return "newlines";
    case TriviaKind::CarriageReturns:
        return "carriage_returns";
    case TriviaKind::CarriageReturnLineFeeds:
        return "carriage_return_line_feeds";
    case TriviaKind::LineComment:
        return "line_comment";
    case TriviaKind::BlockComment:
        return "block_comment";
    case TriviaKind::DocLineComment:
        return "doc_line_comment";
    }
    return "unknown";
}

// ============================================================================
// TriviaPiece
// ============================================================================

auto TriviaPiece::is_newline() const -> bool {
    return kind == TriviaKind::Newlines || kind == TriviaKind::CarriageReturns ||
           kind == TriviaKind::CarriageReturnLineFeeds;
}

auto TriviaPiece::is_comment() const -> bool {
    return kind == TriviaKind::LineComment || kind == TriviaKind::BlockComment ||
           kind == TriviaKind::DocLineComment;
}

void TriviaPiece::write(std::ostream& out) const {
    switch (kind) {
    case TriviaKind::Spaces:
        out << std::string(count, ' ');
        break;
    case TriviaKind::Tabs:
        out << std::string(count, '\t');
        break;
    case TriviaKind::Newlines:
        out << std::string(count, '\n');
        break;
    case TriviaKind::CarriageReturns:
        out << std::string(count, '\r');
        break;
    case TriviaKind::CarriageReturnLineFeeds:
        for (uint32_t i = 0; i < count; ++i) {
            out << "\r\n";
        }
        break;
    case TriviaKind::LineComment:
    case TriviaKind::BlockComment:
    case TriviaKind::DocLineComment:
        out << text;
        break;
    }
}

// ============================================================================
// Trivia
// ============================================================================

auto Trivia::appending(TriviaPiece piece) const -> Trivia {
    auto pieces = pieces_;
    pieces.push_back(std::move(piece));
    return Trivia(std::move(pieces));
}

auto Trivia::without_newlines() const -> Trivia {
    std::vector<TriviaPiece> kept;
    kept.reserve(pieces_.size());
    for (const auto& piece : pieces_) {
        if (!piece.is_newline()) {
            kept.push_back(piece);
        }
    }
    return Trivia(std::move(kept));
}

auto Trivia::newline_count() const -> uint32_t {
    uint32_t total = 0;
    for (const auto& piece : pieces_) {
        if (piece.is_newline()) {
            total += piece.count;
        }
    }
    return total;
}

auto Trivia::contains_newlines() const -> bool {
    for (const auto& piece : pieces_) {
        if (piece.is_newline() && piece.count > 0) {
            return true;
        }
    }
    return false;
}

void Trivia::write(std::ostream& out) const {
    for (const auto& piece : pieces_) {
        piece.write(out);
    }
}

auto Trivia::to_string() const -> std::string {
    std::ostringstream oss;
    write(oss);
    return oss.str();
}

auto operator+(const Trivia& lhs, const Trivia& rhs) -> Trivia {
    std::vector<TriviaPiece> pieces;
    pieces.reserve(lhs.size() + rhs.size());
    pieces.insert(pieces.end(), lhs.begin(), lhs.end());
    pieces.insert(pieces.end(), rhs.begin(), rhs.end());
    return Trivia(std::move(pieces));
}

auto operator<<(std::ostream& out, const Trivia& trivia) -> std::ostream& {
    out << "[";
    for (size_t i = 0; i < trivia.size(); ++i) {
        const auto& piece = trivia[i];
        if (i > 0)
            out << ", ";
        out << trivia_kind_name(piece.kind) << "(";
        if (piece.is_comment()) {
            out << "\"" << piece.text << "\"";
        } else {
            out << piece.count;
        }
        out << ")";
    }
    return out << "]";
}

} // namespace reform::syntax
