//! # reform Logging
//!
//! Module-tagged logging for the library. reform has no `main`: the
//! logger configures itself from the `REFORM_LOG` environment variable the
//! first time it is used, and host tools or tests replace its sinks and
//! filter afterwards.
//!
//! ## REFORM_LOG
//!
//! | Value                 | Effect                                       |
//! |-----------------------|----------------------------------------------|
//! | unset                 | warnings and errors from every module        |
//! | `debug`               | everything at debug level and above          |
//! | `rules=trace,*=error` | rules at trace level, other modules at error |
//! | `rules,config`        | rules and config at trace level              |
//!
//! ## Modules
//!
//! `rewrite` (tree traversal), `rules` (rule decisions), `diag`,
//! `config` and `engine` (one line per run).
//!
//! ## Usage
//!
//! ```cpp
//! REFORM_LOG_DEBUG("rules", "splitting '" << text << "' into " << n << " declarations");
//! REFORM_LOG_WARN("config", "skipping unknown section [" << name << "]");
//! ```

#ifndef REFORM_LOG_HPP
#define REFORM_LOG_HPP

#include <atomic>
#include <cstdint>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace reform::log {

// ============================================================================
// Levels
// ============================================================================

enum class LogLevel : uint8_t {
    Trace, ///< Tree traversal and rebuilt nodes
    Debug, ///< Individual rewrites
    Info,  ///< Per-run summaries
    Warn,  ///< Suspicious input the library recovered from
    Error, ///< Broken invariants, logged before the exception is thrown
    Off,   ///< Threshold only: nothing passes
};

/// "TRACE", "DEBUG", ...
auto level_name(LogLevel level) -> const char*;

/// Parses a level name in any letter case. `warning` is accepted for `warn`.
auto parse_level(std::string_view text) -> std::optional<LogLevel>;

// ============================================================================
// Records and Sinks
// ============================================================================

/// A record as handed to sinks. Views are valid for the duration of the
/// `write` call only.
struct LogRecord {
    LogLevel level;
    std::string_view module;
    std::string_view message;
    const char* file;
    int line;
};

class LogSink {
public:
    virtual ~LogSink() = default;

    virtual void write(const LogRecord& record) = 0;
    virtual void flush() {}
};

/// Writes `LEVEL [module] message` lines to a stream, stderr by default.
class ConsoleSink : public LogSink {
public:
    explicit ConsoleSink(std::ostream& out = std::cerr, bool colors = false)
        : out_(out), colors_(colors) {}

    void write(const LogRecord& record) override;
    void flush() override {
        out_.flush();
    }

private:
    std::ostream& out_;
    bool colors_;
};

/// A record as kept by MemorySink.
struct CapturedRecord {
    LogLevel level;
    std::string module;
    std::string message;
};

/// Keeps every record. Lets tests assert on what the library logged.
class MemorySink : public LogSink {
public:
    void write(const LogRecord& record) override;

    [[nodiscard]] auto records() const -> std::vector<CapturedRecord>;

    /// True if a record from `module` has `needle` in its message.
    [[nodiscard]] auto contains(std::string_view module, std::string_view needle) const -> bool;

    void clear();

private:
    mutable std::mutex mutex_;
    std::vector<CapturedRecord> records_;
};

// ============================================================================
// Filter
// ============================================================================

/// Per-module level thresholds with a default for all other modules.
class LogFilter {
public:
    /// Replaces the thresholds with those in `spec` (see the REFORM_LOG
    /// table above). An empty spec restores the defaults. Returns false if
    /// some entry named an unknown level; that entry is ignored.
    bool parse(std::string_view spec);

    [[nodiscard]] auto threshold(std::string_view module) const -> LogLevel;

    /// Lowest threshold of any module, used for the lock-free fast path.
    [[nodiscard]] auto lowest() const -> LogLevel;

    void set_default(LogLevel level) {
        default_ = level;
    }
    [[nodiscard]] auto default_level() const -> LogLevel {
        return default_;
    }

private:
    LogLevel default_ = LogLevel::Warn;
    std::map<std::string, LogLevel, std::less<>> modules_;
};

/// Filter described by `REFORM_LOG`, or the default filter if it is unset.
/// An unparsable value is reported once on stderr.
auto filter_from_env() -> LogFilter;

/// True if stderr is a terminal that understands ANSI colors.
bool stderr_supports_colors();

// ============================================================================
// Logger
// ============================================================================

/// Process-wide logger.
///
/// Created on first use with a colored-if-possible ConsoleSink and the
/// filter from `filter_from_env()`.
class Logger {
public:
    static Logger& instance();

    /// Cheap check the macros make before formatting the message.
    bool enabled(LogLevel level, std::string_view module) const;

    void log(LogLevel level, std::string_view module, std::string_view message, const char* file,
             int line);

    void add_sink(std::unique_ptr<LogSink> sink);
    void clear_sinks();

    /// Parses and installs a filter spec. Returns false as `LogFilter::parse` does.
    bool set_filter(std::string_view spec);

    /// Sets the threshold of modules without their own entry.
    void set_level(LogLevel level);

    void flush();

private:
    Logger();

    void refresh_floor();

    LogFilter filter_;
    std::atomic<LogLevel> floor_{LogLevel::Warn};
    std::vector<std::unique_ptr<LogSink>> sinks_;
    mutable std::mutex mutex_;
};

/// Writes `text` to `out` escaped for a JSON string literal.
void escape_json(std::ostream& out, std::string_view text);

// ============================================================================
// Macros
// ============================================================================

// Levels below this are compiled out: 0=Trace ... 4=Error.
#ifndef REFORM_MIN_LOG_LEVEL
#define REFORM_MIN_LOG_LEVEL 0
#endif

#define REFORM_LOG_IMPL(level, module_str, msg)                                                    \
    do {                                                                                           \
        if (static_cast<int>(level) >= REFORM_MIN_LOG_LEVEL) {                                     \
            auto& reform_logger_ = ::reform::log::Logger::instance();                              \
            if (reform_logger_.enabled(level, module_str)) {                                       \
                std::ostringstream reform_msg_;                                                    \
                reform_msg_ << msg;                                                                \
                reform_logger_.log(level, module_str, reform_msg_.str(), __FILE__, __LINE__);      \
            }                                                                                      \
        }                                                                                          \
    } while (0)

/// Usage: REFORM_LOG_DEBUG("module", "text " << value);
#define REFORM_LOG_TRACE(module, msg) REFORM_LOG_IMPL(::reform::log::LogLevel::Trace, module, msg)
#define REFORM_LOG_DEBUG(module, msg) REFORM_LOG_IMPL(::reform::log::LogLevel::Debug, module, msg)
#define REFORM_LOG_INFO(module, msg) REFORM_LOG_IMPL(::reform::log::LogLevel::Info, module, msg)
#define REFORM_LOG_WARN(module, msg) REFORM_LOG_IMPL(::reform::log::LogLevel::Warn, module, msg)
#define REFORM_LOG_ERROR(module, msg) REFORM_LOG_IMPL(::reform::log::LogLevel::Error, module, msg)

} // namespace reform::log

#endif // REFORM_LOG_HPP
