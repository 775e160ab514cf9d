#include "rules/rule.hpp"

#include "log/log.hpp"

namespace reform::rules {

void SyntaxFormatRule::diagnose(diag::MessageId id, const syntax::NodePtr& anchor) {
    auto info = diag::message_info(id);
    REFORM_LOG_TRACE("rules", name() << ": " << info.text);
    context_.sink.record(context_.severity, std::string(info.text), anchor, std::string(name()));
}

} // namespace reform::rules
