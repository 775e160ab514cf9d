#include "diag/diagnostic.hpp"

#include <algorithm>

namespace reform::diag {

auto severity_name(Severity severity) -> const char* {
    switch (severity) {
    case Severity::Error:
        return "error";
    case Severity::Warning:
        return "warning";
    case Severity::Note:
        return "note";
    }
    return "unknown";
}

auto parse_severity(std::string_view text) -> std::optional<Severity> {
    if (text == "error")
        return Severity::Error;
    if (text == "warning" || text == "warn")
        return Severity::Warning;
    if (text == "note")
        return Severity::Note;
    return std::nullopt;
}

auto message_info(MessageId id) -> MessageInfo {
    switch (id) {
    case MessageId::OneVariableDeclaration:
        return {Severity::Warning, "split variable binding into multiple declarations"};
    }
    return {Severity::Warning, "unknown diagnostic"};
}

void DiagnosticSink::record(Severity severity, std::string message, syntax::NodePtr anchor,
                            std::string rule) {
    diagnostics_.push_back({severity, std::move(message), std::move(rule), std::move(anchor)});
}

auto DiagnosticSink::count(Severity severity) const -> size_t {
    return static_cast<size_t>(
        std::count_if(diagnostics_.begin(), diagnostics_.end(),
                      [severity](const Diagnostic& d) { return d.severity == severity; }));
}

auto DiagnosticSink::take() -> std::vector<Diagnostic> {
    std::vector<Diagnostic> taken;
    taken.swap(diagnostics_);
    return taken;
}

} // namespace reform::diag
