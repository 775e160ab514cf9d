#include "config/config.hpp"

#include "log/log.hpp"

#include <fstream>
#include <sstream>

namespace reform::config {

auto Configuration::rule(std::string_view name, diag::Severity fallback) const -> RuleSettings {
    RuleSettings settings;
    auto it = rules.find(name);
    if (it != rules.end()) {
        settings = it->second;
    }
    if (!settings.severity) {
        settings.severity = fallback;
    }
    return settings;
}

// ============================================================================
// Parsing
// ============================================================================

namespace {

auto trim(std::string_view text) -> std::string_view {
    size_t start = text.find_first_not_of(" \t\r");
    if (start == std::string_view::npos)
        return {};
    size_t end = text.find_last_not_of(" \t\r");
    return text.substr(start, end - start + 1);
}

/// Drops a `#` comment that is not inside a quoted string.
auto strip_comment(std::string_view line) -> std::string_view {
    bool in_string = false;
    for (size_t i = 0; i < line.size(); ++i) {
        if (line[i] == '"') {
            in_string = !in_string;
        } else if (line[i] == '#' && !in_string) {
            return line.substr(0, i);
        }
    }
    return line;
}

auto parse_rule_value(std::string_view value) -> std::optional<RuleSettings> {
    RuleSettings settings;
    if (value == "true")
        return settings;
    if (value == "false") {
        settings.enabled = false;
        return settings;
    }

    if (value.size() < 2 || value.front() != '"' || value.back() != '"')
        return std::nullopt;
    value = value.substr(1, value.size() - 2);

    if (value == "off") {
        settings.enabled = false;
        return settings;
    }
    auto severity = diag::parse_severity(value);
    if (!severity)
        return std::nullopt;
    settings.severity = severity;
    return settings;
}

} // namespace

auto parse_config(std::string_view text) -> Result<Configuration, std::string> {
    Configuration config;
    bool in_rules_section = false;
    size_t line_number = 0;

    while (!text.empty()) {
        size_t newline = text.find('\n');
        std::string_view raw = text.substr(0, newline);
        text = newline == std::string_view::npos ? std::string_view{} : text.substr(newline + 1);
        ++line_number;

        std::string_view line = trim(strip_comment(raw));
        if (line.empty())
            continue;

        if (line.front() == '[') {
            if (line.back() != ']') {
                return "line " + std::to_string(line_number) + ": unterminated section header";
            }
            std::string_view section = trim(line.substr(1, line.size() - 2));
            in_rules_section = section == "rules";
            if (!in_rules_section) {
                REFORM_LOG_WARN("config", "skipping unknown section [" << section << "]");
            }
            continue;
        }

        size_t eq_pos = line.find('=');
        if (eq_pos == std::string_view::npos) {
            return "line " + std::to_string(line_number) + ": expected 'key = value'";
        }
        if (!in_rules_section)
            continue;

        std::string_view key = trim(line.substr(0, eq_pos));
        std::string_view value = trim(line.substr(eq_pos + 1));
        auto settings = parse_rule_value(value);
        if (!settings) {
            return "line " + std::to_string(line_number) + ": invalid value '" + std::string(value) +
                   "' for rule " + std::string(key);
        }
        config.rules[std::string(key)] = *settings;
    }

    return config;
}

// ============================================================================
// Loading
// ============================================================================

auto load_config(const fs::path& project_root) -> Result<Configuration, std::string> {
    fs::path config_path = project_root / CONFIG_FILE_NAME;
    std::error_code ec;
    if (!fs::exists(config_path, ec)) {
        REFORM_LOG_DEBUG("config", "no " << CONFIG_FILE_NAME << " in " << project_root.string()
                                         << ", using defaults");
        return Configuration{};
    }

    std::ifstream file(config_path);
    if (!file) {
        return "cannot read " + config_path.string();
    }
    std::stringstream buffer;
    buffer << file.rdbuf();

    auto result = parse_config(buffer.str());
    if (is_err(result)) {
        return config_path.string() + ": " + unwrap_err(result);
    }
    REFORM_LOG_DEBUG("config", "loaded " << config_path.string());
    return result;
}

} // namespace reform::config
