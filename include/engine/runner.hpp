//! # Rule Runner
//!
//! Runs the enabled rules over one tree.
//!
//! | Mode     | Returned tree | Diagnostics |
//! |----------|---------------|-------------|
//! | `Lint`   | the input     | all findings |
//! | `Format` | rewritten     | all findings |

#ifndef REFORM_ENGINE_RUNNER_HPP
#define REFORM_ENGINE_RUNNER_HPP

#include "config/config.hpp"
#include "diag/diagnostic.hpp"
#include "syntax/syntax.hpp"

#include <vector>

namespace reform::engine {

enum class RunMode {
    Lint,  ///< Report only
    Format ///< Report and rewrite
};

struct RunResult {
    syntax::NodePtr tree;
    std::vector<diag::Diagnostic> diagnostics;
    bool changed = false; ///< True when `tree` differs from the input
};

/// Runs every enabled rule over `root`.
///
/// Diagnostics anchor nodes of the input tree, in both modes.
[[nodiscard]] auto run(const syntax::NodePtr& root, const config::Configuration& config,
                       RunMode mode) -> RunResult;

} // namespace reform::engine

#endif // REFORM_ENGINE_RUNNER_HPP
