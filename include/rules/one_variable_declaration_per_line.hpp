//! # OneVariableDeclarationPerLine
//!
//! Each variable declaration, with the exception of tuple destructuring,
//! should declare one variable.
//!
//! Lint: a declaration that binds multiple variables raises a warning.
//!
//! Format: such a declaration is split into one declaration per binding,
//! each on its own line.
//!
//! ```text
//! var a = 0, b = 2, (c, d) = (0, "h")     var a = 0
//! let e = 0, f: Int                   ->  var b = 2
//!                                         var (c, d) = (0, "h")
//!                                         let e: Int = 0
//!                                         let f: Int
//! ```
//!
//! A type annotation written once applies to every binding that has none
//! of its own, so it is copied onto each split declaration.

#ifndef REFORM_RULES_ONE_VARIABLE_DECLARATION_PER_LINE_HPP
#define REFORM_RULES_ONE_VARIABLE_DECLARATION_PER_LINE_HPP

#include "rules/rule.hpp"

#include <vector>

namespace reform::rules {

class OneVariableDeclarationPerLine : public SyntaxFormatRule {
public:
    static constexpr std::string_view NAME = "OneVariableDeclarationPerLine";

    explicit OneVariableDeclarationPerLine(Context& context) : SyntaxFormatRule(context) {}

    [[nodiscard]] auto name() const -> std::string_view override {
        return NAME;
    }

protected:
    auto process_statements(const syntax::CodeBlockItemList& statements,
                            const syntax::CodeBlockItemList& original)
        -> std::optional<syntax::CodeBlockItemList> override;

private:
    /// Appends one CodeBlockItem per binding of `decl` to `out`.
    void split(const syntax::CodeBlockItem& item, const syntax::VariableDecl& decl,
               std::vector<syntax::NodePtr>& out);
};

} // namespace reform::rules

#endif // REFORM_RULES_ONE_VARIABLE_DECLARATION_PER_LINE_HPP
