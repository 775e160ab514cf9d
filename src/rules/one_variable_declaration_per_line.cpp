#include "rules/one_variable_declaration_per_line.hpp"

#include "log/log.hpp"
#include "rewrite/trivia_utils.hpp"
#include "syntax/syntax_factory.hpp"

#include <stdexcept>

namespace reform::rules {

using syntax::CodeBlockItem;
using syntax::CodeBlockItemList;
using syntax::NodePtr;
using syntax::PatternBinding;
using syntax::PatternBindingList;
using syntax::TokenPtr;
using syntax::Trivia;
using syntax::TypeAnnotation;
using syntax::VariableDecl;

namespace {

/// Number of bindings in `decl`. A declaration without bindings cannot come
/// out of a parser; it is rejected rather than passed through.
auto binding_count(const VariableDecl& decl) -> size_t {
    size_t count = decl.bindings().size();
    if (count == 0) {
        REFORM_LOG_ERROR("rules", "variable declaration without bindings: '"
                                      << decl.node()->trimmed_source() << "'");
        throw std::logic_error("variable declaration has no bindings");
    }
    return count;
}

/// The declaration in `item` if it has more than one binding.
auto multi_binding_decl(const CodeBlockItem& item) -> std::optional<VariableDecl> {
    auto decl = VariableDecl::cast(item.item());
    if (!decl || binding_count(*decl) < 2)
        return std::nullopt;
    return decl;
}

/// Drops the trailing comma of `binding`. Comments that followed the comma
/// move to the binding's last token.
auto without_trailing_comma(const PatternBinding& binding) -> PatternBinding {
    TokenPtr comma = binding.trailing_comma();
    if (!comma)
        return binding;

    PatternBinding stripped = binding.with_trailing_comma(nullptr);
    const Trivia& moved = comma->trailing_trivia();
    bool has_comment = false;
    for (const auto& piece : moved) {
        has_comment = has_comment || piece.is_comment();
    }
    if (!has_comment)
        return stripped;

    TokenPtr last = stripped.node()->last_token();
    if (!last)
        return stripped;
    return PatternBinding(rewrite::replace_trivia(stripped.node(), last, std::nullopt,
                                                  last->trailing_trivia() + moved));
}

/// Gives `binding` a copy of `annotation` after its pattern. The pattern's
/// trailing trivia moves behind the annotation so `a = 1` becomes
/// `a: Int = 1`.
auto with_inherited_annotation(const PatternBinding& binding, const TypeAnnotation& annotation)
    -> PatternBinding {
    NodePtr pattern = binding.pattern();
    TokenPtr pattern_end = pattern ? pattern->last_token() : nullptr;
    NodePtr copy = annotation.node();
    if (!pattern_end)
        return binding.with_type_annotation(TypeAnnotation(copy));

    copy = rewrite::replace_trivia(copy, copy->last_token(), std::nullopt,
                                   pattern_end->trailing_trivia());
    pattern = rewrite::replace_trivia(pattern, pattern_end, std::nullopt, Trivia{});
    PatternBinding moved(binding.node()->with_child(PatternBinding::PATTERN, pattern));
    return moved.with_type_annotation(TypeAnnotation(copy));
}

/// A binding that started its own line now follows the keyword.
auto joined_to_keyword(const PatternBinding& binding) -> PatternBinding {
    TokenPtr first = binding.node()->first_token();
    if (!first || !first->leading_trivia().contains_newlines())
        return binding;
    return PatternBinding(rewrite::replace_leading_trivia(
        binding.node(), rewrite::leading_trivia_for_joined_line(first->leading_trivia())));
}

/// The declaration at `index` of `original`, i.e. `decl` as it was before
/// closures inside it were rewritten.
auto anchor_for(const VariableDecl& decl, const CodeBlockItemList& original, size_t index)
    -> NodePtr {
    if (index < original.size()) {
        if (auto before = VariableDecl::cast(original.at(index).item()))
            return before->node();
    }
    return decl.node();
}

} // namespace

auto OneVariableDeclarationPerLine::process_statements(const CodeBlockItemList& statements,
                                                       const CodeBlockItemList& original)
    -> std::optional<CodeBlockItemList> {
    bool needs_work = false;
    for (const auto& item : statements.items()) {
        if (multi_binding_decl(item)) {
            needs_work = true;
            break;
        }
    }
    if (!needs_work)
        return std::nullopt;

    std::vector<NodePtr> new_items;
    new_items.reserve(statements.size());
    for (size_t i = 0; i < statements.size(); ++i) {
        CodeBlockItem item = statements.at(i);
        auto decl = multi_binding_decl(item);
        if (!decl) {
            new_items.push_back(item.node());
            continue;
        }

        diagnose(diag::MessageId::OneVariableDeclaration, anchor_for(*decl, original, i));
        split(item, *decl, new_items);
    }

    return CodeBlockItemList(syntax::make_code_block_item_list(new_items));
}

void OneVariableDeclarationPerLine::split(const CodeBlockItem& item, const VariableDecl& decl,
                                          std::vector<NodePtr>& out) {
    auto bindings = decl.bindings().bindings();
    REFORM_LOG_DEBUG("rules", "splitting '" << decl.node()->trimmed_source() << "' into "
                                            << bindings.size() << " declarations");

    // Only the last binding is expected to carry the shared annotation, but
    // take the last one found wherever it sits.
    std::optional<TypeAnnotation> inherited;
    for (const auto& binding : bindings) {
        if (auto annotation = binding.type_annotation()) {
            inherited = annotation;
        }
    }

    // The first declaration takes the place of the original statement and
    // keeps its trivia untouched.
    bool is_first = true;
    for (const auto& binding : bindings) {
        PatternBinding new_binding = without_trailing_comma(binding);
        if (inherited && !binding.type_annotation()) {
            new_binding = with_inherited_annotation(new_binding, *inherited);
        }
        if (!is_first) {
            new_binding = joined_to_keyword(new_binding);
        }

        VariableDecl new_decl = decl.with_bindings(
            PatternBindingList(syntax::make_pattern_binding_list({new_binding.node()})));
        NodePtr final_decl = new_decl.node();

        if (!is_first) {
            TokenPtr first_token = final_decl->first_token();
            Trivia original = first_token ? first_token->leading_trivia() : Trivia{};
            final_decl = rewrite::replace_trivia(final_decl, first_token,
                                                 rewrite::leading_trivia_for_new_line(original));
        }

        out.push_back(item.with_item(final_decl).node());
        is_first = false;
    }
}

} // namespace reform::rules
