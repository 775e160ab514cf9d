//! # Configuration
//!
//! Rule settings loaded from `reform.toml` in the project root.
//!
//! ## Format
//!
//! ```toml
//! [rules]
//! OneVariableDeclarationPerLine = true       # enabled at its default severity
//! OneVariableDeclarationPerLine = false      # disabled (also "off")
//! OneVariableDeclarationPerLine = "error"    # enabled, reported as an error
//! ```
//!
//! Only the `[rules]` section is read. Other sections are skipped with a
//! warning so that a shared project file can carry settings for other tools.
//!
//! ## Defaults
//!
//! A missing file, or a rule without an entry, means the rule is enabled at
//! the severity of its catalog message.

#ifndef REFORM_CONFIG_CONFIG_HPP
#define REFORM_CONFIG_CONFIG_HPP

#include "common.hpp"
#include "diag/diagnostic.hpp"

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace reform::config {

namespace fs = std::filesystem;

/// Name of the configuration file looked up in the project root.
constexpr const char* CONFIG_FILE_NAME = "reform.toml";

/// Settings for one rule.
struct RuleSettings {
    bool enabled = true;
    std::optional<diag::Severity> severity; ///< Unset means the catalog default
};

/// Parsed configuration.
struct Configuration {
    std::map<std::string, RuleSettings, std::less<>> rules;

    /// Settings for `name`, with the severity resolved against `fallback`.
    [[nodiscard]] auto rule(std::string_view name,
                            diag::Severity fallback = diag::Severity::Warning) const
        -> RuleSettings;
};

/// Parses configuration text.
///
/// Returns an error message naming the line for a line without `=`, an
/// unterminated section header, or a value that is neither a boolean nor a
/// severity.
[[nodiscard]] auto parse_config(std::string_view text) -> Result<Configuration, std::string>;

/// Loads `reform.toml` from `project_root`. A missing file yields the defaults.
[[nodiscard]] auto load_config(const fs::path& project_root) -> Result<Configuration, std::string>;

} // namespace reform::config

#endif // REFORM_CONFIG_CONFIG_HPP
