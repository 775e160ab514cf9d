//! # Diagnostics
//!
//! A diagnostic is an advisory report produced by a rule: a severity, a
//! message, the rule that produced it, and the node it is anchored to.
//!
//! ## Components
//!
//! | Type             | Description                                 |
//! |------------------|---------------------------------------------|
//! | `Severity`       | Error, Warning, Note                        |
//! | `MessageId`      | Catalog of the messages rules can emit      |
//! | `Diagnostic`     | One immutable report                        |
//! | `DiagnosticSink` | Append-only collector owned by the caller   |
//!
//! The sink never filters or deduplicates. Severity gating is the job of
//! the configuration layer, which picks the severity a rule reports at.

#ifndef REFORM_DIAG_DIAGNOSTIC_HPP
#define REFORM_DIAG_DIAGNOSTIC_HPP

#include "syntax/syntax.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace reform::diag {

// ============================================================================
// Severity
// ============================================================================

enum class Severity : uint8_t {
    Error,
    Warning,
    Note,
};

/// "error", "warning" or "note".
auto severity_name(Severity severity) -> const char*;

/// Parses "error" / "warning" / "warn" / "note".
auto parse_severity(std::string_view text) -> std::optional<Severity>;

// ============================================================================
// Message Catalog
// ============================================================================

/// Messages rules can emit.
enum class MessageId : uint8_t {
    OneVariableDeclaration, ///< A declaration binds more than one variable
};

struct MessageInfo {
    Severity default_severity;
    std::string_view text;
};

/// Looks up the default severity and text of a catalog message.
auto message_info(MessageId id) -> MessageInfo;

// ============================================================================
// Diagnostic
// ============================================================================

struct Diagnostic {
    Severity severity;
    std::string message;
    std::string rule;      ///< Name of the rule that produced it; may be empty
    syntax::NodePtr anchor; ///< Node in the tree the rule was given
};

/// Collects diagnostics in arrival order.
///
/// Not synchronized: every run owns its own sink.
class DiagnosticSink {
public:
    void record(Severity severity, std::string message, syntax::NodePtr anchor,
                std::string rule = {});

    [[nodiscard]] auto diagnostics() const -> const std::vector<Diagnostic>& {
        return diagnostics_;
    }
    [[nodiscard]] auto size() const -> size_t {
        return diagnostics_.size();
    }
    [[nodiscard]] auto empty() const -> bool {
        return diagnostics_.empty();
    }

    /// Number of diagnostics recorded at `severity`.
    [[nodiscard]] auto count(Severity severity) const -> size_t;

    /// Moves the collected diagnostics out, leaving the sink empty.
    [[nodiscard]] auto take() -> std::vector<Diagnostic>;

private:
    std::vector<Diagnostic> diagnostics_;
};

} // namespace reform::diag

#endif // REFORM_DIAG_DIAGNOSTIC_HPP
