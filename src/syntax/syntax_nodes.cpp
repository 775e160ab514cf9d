#include "syntax/syntax_nodes.hpp"

#include <stdexcept>
#include <string>

namespace reform::syntax {

SyntaxView::SyntaxView(NodePtr node, SyntaxKind expected) : node_(std::move(node)) {
    if (!node_) {
        throw std::invalid_argument(std::string("expected ") + syntax_kind_name(expected) +
                                    ", got null node");
    }
    if (node_->kind() != expected) {
        throw std::invalid_argument(std::string("expected ") + syntax_kind_name(expected) +
                                    ", got " + syntax_kind_name(node_->kind()));
    }
}

// ============================================================================
// Statement Sequences
// ============================================================================

auto CodeBlockItemList::at(size_t index) const -> CodeBlockItem {
    return CodeBlockItem(node_->node_at(index));
}

auto CodeBlockItemList::items() const -> std::vector<CodeBlockItem> {
    std::vector<CodeBlockItem> result;
    result.reserve(node_->size());
    for (size_t i = 0; i < node_->size(); ++i) {
        result.push_back(at(i));
    }
    return result;
}

auto CodeBlockItem::with_item(const NodePtr& item) const -> CodeBlockItem {
    return CodeBlockItem(node_->with_child(ITEM, to_child(item)));
}

// ============================================================================
// Variable Declarations
// ============================================================================

auto PatternBindingList::at(size_t index) const -> PatternBinding {
    return PatternBinding(node_->node_at(index));
}

auto PatternBindingList::bindings() const -> std::vector<PatternBinding> {
    std::vector<PatternBinding> result;
    result.reserve(node_->size());
    for (size_t i = 0; i < node_->size(); ++i) {
        result.push_back(at(i));
    }
    return result;
}

auto PatternBinding::with_type_annotation(const std::optional<TypeAnnotation>& annotation) const
    -> PatternBinding {
    SyntaxChild child = annotation ? SyntaxChild(annotation->node()) : SyntaxChild{};
    return PatternBinding(node_->with_child(TYPE_ANNOTATION, std::move(child)));
}

auto PatternBinding::with_trailing_comma(const TokenPtr& comma) const -> PatternBinding {
    return PatternBinding(node_->with_child(TRAILING_COMMA, to_child(comma)));
}

} // namespace reform::syntax
