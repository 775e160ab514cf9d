//! # Rule Infrastructure
//!
//! A format rule is a `SyntaxRewriter` with a name and a context. The same
//! rule instance serves both lint and format mode: it always returns the
//! rewritten tree and records diagnostics, and the caller decides which of
//! the two to keep.

#ifndef REFORM_RULES_RULE_HPP
#define REFORM_RULES_RULE_HPP

#include "diag/diagnostic.hpp"
#include "rewrite/syntax_rewriter.hpp"

#include <string_view>

namespace reform::rules {

/// What a rule needs from the caller during one run.
struct Context {
    explicit Context(diag::DiagnosticSink& sink, diag::Severity severity = diag::Severity::Warning)
        : sink(sink), severity(severity) {}

    diag::DiagnosticSink& sink; ///< Owned by the caller, one per run
    diag::Severity severity;    ///< Severity the rule reports at
};

/// Base class for rules that rewrite the tree.
class SyntaxFormatRule : public rewrite::SyntaxRewriter {
public:
    explicit SyntaxFormatRule(Context& context) : context_(context) {}

    /// Rule name as used in configuration and diagnostics.
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

protected:
    /// Records the catalog message `id` at the context severity.
    void diagnose(diag::MessageId id, const syntax::NodePtr& anchor);

    [[nodiscard]] auto context() const -> Context& {
        return context_;
    }

private:
    Context& context_;
};

} // namespace reform::rules

#endif // REFORM_RULES_RULE_HPP
