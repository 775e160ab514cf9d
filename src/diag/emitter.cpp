#include "diag/emitter.hpp"

#include "log/log.hpp"

#include <algorithm>
#include <iomanip>
#include <sstream>

namespace reform::diag {

namespace {

constexpr const char* RESET = "\033[0m";
constexpr const char* BOLD = "\033[1m";
constexpr const char* RED = "\033[31m";
constexpr const char* YELLOW = "\033[33m";
constexpr const char* CYAN = "\033[36m";
constexpr const char* BRIGHT_BLUE = "\033[94m";

auto split_lines(const std::string& text) -> std::vector<std::string> {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

} // namespace

DiagnosticEmitter::DiagnosticEmitter(std::ostream& out) : out_(out) {}

void DiagnosticEmitter::set_source(std::string path, syntax::NodePtr root) {
    path_ = std::move(path);
    root_ = std::move(root);
    source_lines_ = root_ ? split_lines(root_->to_source()) : std::vector<std::string>{};
}

const char* DiagnosticEmitter::severity_color(Severity severity) const {
    switch (severity) {
    case Severity::Error:
        return RED;
    case Severity::Warning:
        return YELLOW;
    case Severity::Note:
        return CYAN;
    }
    return "";
}

void DiagnosticEmitter::emit(const Diagnostic& diag) {
    if (diag.severity == Severity::Error) {
        error_count_++;
    } else if (diag.severity == Severity::Warning) {
        warning_count_++;
    }

    std::optional<syntax::SourcePosition> pos;
    if (root_) {
        pos = syntax::position_of(root_, diag.anchor);
        if (!pos) {
            REFORM_LOG_DEBUG("diag", "anchor of '" << diag.message << "' not found in " << path_);
        }
    }

    if (format_ == EmitFormat::JSON) {
        emit_json(diag, pos);
    } else {
        emit_text(diag, pos);
    }
}

void DiagnosticEmitter::emit_all(const std::vector<Diagnostic>& diagnostics) {
    for (const auto& diag : diagnostics) {
        emit(diag);
    }
}

void DiagnosticEmitter::emit_text(const Diagnostic& diag,
                                  const std::optional<syntax::SourcePosition>& pos) {
    out_ << color(BOLD) << color(severity_color(diag.severity)) << severity_name(diag.severity);
    if (!diag.rule.empty()) {
        out_ << "[" << diag.rule << "]";
    }
    out_ << color(RESET) << color(BOLD) << ": " << diag.message << color(RESET) << "\n";

    if (!pos) {
        return;
    }

    out_ << "  " << color(BRIGHT_BLUE) << "-->" << color(RESET) << " " << path_ << ":"
         << pos->line << ":" << pos->column << "\n";
    emit_snippet(diag, *pos);
}

void DiagnosticEmitter::emit_snippet(const Diagnostic& diag, const syntax::SourcePosition& pos) {
    if (pos.line == 0 || pos.line > source_lines_.size()) {
        return;
    }
    const auto& line = source_lines_[pos.line - 1];
    int width = static_cast<int>(std::to_string(pos.line).size());

    // Underline the anchor up to the end of its first line.
    size_t start = pos.column - 1;
    std::string anchor_text = diag.anchor ? diag.anchor->trimmed_source() : std::string{};
    size_t newline = anchor_text.find('\n');
    size_t length = std::max<size_t>(1, std::min(newline == std::string::npos
                                                      ? anchor_text.size()
                                                      : newline,
                                                  line.size() > start ? line.size() - start : 1));

    out_ << color(BRIGHT_BLUE) << std::setw(width + 1) << "" << " |" << color(RESET) << "\n";
    out_ << color(BRIGHT_BLUE) << " " << std::setw(width) << pos.line << " | " << color(RESET)
         << line << "\n";
    out_ << color(BRIGHT_BLUE) << std::setw(width + 1) << "" << " | " << color(RESET)
         << std::string(start, ' ') << color(severity_color(diag.severity))
         << std::string(length, '^') << color(RESET) << "\n";
}

void DiagnosticEmitter::emit_json(const Diagnostic& diag,
                                  const std::optional<syntax::SourcePosition>& pos) {
    out_ << "{\"severity\":\"" << severity_name(diag.severity) << "\",";
    out_ << "\"rule\":\"";
    log::escape_json(out_, diag.rule);
    out_ << "\",\"message\":\"";
    log::escape_json(out_, diag.message);
    out_ << "\"";
    if (pos) {
        out_ << ",\"file\":\"";
        log::escape_json(out_, path_);
        out_ << "\",\"line\":" << pos->line << ",\"column\":" << pos->column;
    }
    out_ << "}\n";
}

} // namespace reform::diag
