//! # Diagnostic Emitter
//!
//! Renders collected diagnostics for people or tools.
//!
//! ## Text Format
//!
//! ```text
//! warning[OneVariableDeclarationPerLine]: split variable binding into multiple declarations
//!   --> src/main.rf:3:5
//!    |
//!  3 |     var a, b: Int
//!    |     ^^^^^^^^^^^^^
//! ```
//!
//! ## JSON Format
//!
//! One object per line:
//! `{"severity":"warning","rule":"...","message":"...","file":"...","line":3,"column":5}`
//!
//! Colors are off by default. A host writing to stderr can enable them
//! with `set_color_enabled(log::stderr_supports_colors())`.

#ifndef REFORM_DIAG_EMITTER_HPP
#define REFORM_DIAG_EMITTER_HPP

#include "diag/diagnostic.hpp"
#include "syntax/source_position.hpp"

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace reform::diag {

enum class EmitFormat {
    Text, ///< Human-readable, with a source snippet
    JSON  ///< One JSON object per line
};

class DiagnosticEmitter {
public:
    explicit DiagnosticEmitter(std::ostream& out = std::cerr);

    void set_color_enabled(bool enabled) {
        use_colors_ = enabled;
    }
    void set_format(EmitFormat format) {
        format_ = format;
    }

    /// Sets the file path and the tree that diagnostic anchors belong to.
    /// Without a source, diagnostics are printed without location.
    void set_source(std::string path, syntax::NodePtr root);

    void emit(const Diagnostic& diag);
    void emit_all(const std::vector<Diagnostic>& diagnostics);

    size_t error_count() const {
        return error_count_;
    }
    size_t warning_count() const {
        return warning_count_;
    }
    void reset_counts() {
        error_count_ = 0;
        warning_count_ = 0;
    }

private:
    std::ostream& out_;
    bool use_colors_ = false;
    EmitFormat format_ = EmitFormat::Text;
    std::string path_;
    syntax::NodePtr root_;
    std::vector<std::string> source_lines_;
    size_t error_count_ = 0;
    size_t warning_count_ = 0;

    const char* color(const char* code) const {
        return use_colors_ ? code : "";
    }
    const char* severity_color(Severity severity) const;

    void emit_text(const Diagnostic& diag, const std::optional<syntax::SourcePosition>& pos);
    void emit_snippet(const Diagnostic& diag, const syntax::SourcePosition& pos);
    void emit_json(const Diagnostic& diag, const std::optional<syntax::SourcePosition>& pos);
};

} // namespace reform::diag

#endif // REFORM_DIAG_EMITTER_HPP
