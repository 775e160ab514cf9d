#include "engine/runner.hpp"

#include "log/log.hpp"
#include "rules/one_variable_declaration_per_line.hpp"

namespace reform::engine {

auto run(const syntax::NodePtr& root, const config::Configuration& config, RunMode mode)
    -> RunResult {
    RunResult result;
    result.tree = root;
    if (!root)
        return result;

    diag::DiagnosticSink sink;
    syntax::NodePtr current = root;

    auto catalog = diag::message_info(diag::MessageId::OneVariableDeclaration);
    auto settings = config.rule(rules::OneVariableDeclarationPerLine::NAME, catalog.default_severity);
    if (settings.enabled) {
        rules::Context context(sink, *settings.severity);
        rules::OneVariableDeclarationPerLine rule(context);
        current = rule.rewrite(current);
    } else {
        REFORM_LOG_DEBUG("engine", "rule " << rules::OneVariableDeclarationPerLine::NAME
                                           << " disabled");
    }

    if (mode == RunMode::Format) {
        result.tree = current;
        result.changed = current != root;
    }
    result.diagnostics = sink.take();

    REFORM_LOG_INFO("engine", (mode == RunMode::Format ? "format" : "lint") << ": "
                                  << result.diagnostics.size() << " diagnostic(s)"
                                  << (result.changed ? ", tree rewritten" : ""));
    return result;
}

} // namespace reform::engine
