//! # Logger Implementation
//!
//! Level names, the built-in sinks, LogFilter and the Logger singleton.

#include "log/log.hpp"

#include <algorithm>
#include <cctype>

namespace reform::log {

// ============================================================================
// Levels
// ============================================================================

namespace {

struct LevelEntry {
    LogLevel level;
    const char* name;
    const char* color;
};

constexpr LevelEntry LEVELS[] = {
    {LogLevel::Trace, "TRACE", "\033[90m"}, {LogLevel::Debug, "DEBUG", "\033[36m"},
    {LogLevel::Info, "INFO", "\033[32m"},   {LogLevel::Warn, "WARN", "\033[33m"},
    {LogLevel::Error, "ERROR", "\033[31m"}, {LogLevel::Off, "OFF", ""},
};

auto entry(LogLevel level) -> const LevelEntry& {
    return LEVELS[static_cast<size_t>(level)];
}

auto iequals(std::string_view lhs, std::string_view rhs) -> bool {
    return lhs.size() == rhs.size() &&
           std::equal(lhs.begin(), lhs.end(), rhs.begin(), [](char a, char b) {
               return std::tolower(static_cast<unsigned char>(a)) ==
                      std::tolower(static_cast<unsigned char>(b));
           });
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t'))
        text.remove_prefix(1);
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t'))
        text.remove_suffix(1);
    return text;
}

} // namespace

auto level_name(LogLevel level) -> const char* {
    return entry(level).name;
}

auto parse_level(std::string_view text) -> std::optional<LogLevel> {
    if (iequals(text, "warning"))
        return LogLevel::Warn;
    for (const auto& e : LEVELS) {
        if (iequals(text, e.name))
            return e.level;
    }
    return std::nullopt;
}

void escape_json(std::ostream& out, std::string_view text) {
    for (char c : text) {
        switch (c) {
        case '"':
            out << "\\\"";
            break;
        case '\\':
            out << "\\\\";
            break;
        case '\n':
            out << "\\n";
            break;
        case '\r':
            out << "\\r";
            break;
        case '\t':
            out << "\\t";
            break;
        default:
            out << c;
        }
    }
}

// ============================================================================
// Sinks
// ============================================================================

void ConsoleSink::write(const LogRecord& record) {
    // One insertion per line keeps concurrent writers from interleaving.
    std::ostringstream line;
    const LevelEntry& e = entry(record.level);
    if (colors_) {
        line << e.color << e.name << "\033[0m";
    } else {
        line << e.name;
    }
    line << " [" << record.module << "] " << record.message << "\n";
    out_ << line.str();
}

void MemorySink::write(const LogRecord& record) {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.push_back({record.level, std::string(record.module), std::string(record.message)});
}

auto MemorySink::records() const -> std::vector<CapturedRecord> {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
}

auto MemorySink::contains(std::string_view module, std::string_view needle) const -> bool {
    std::lock_guard<std::mutex> lock(mutex_);
    return std::any_of(records_.begin(), records_.end(), [&](const CapturedRecord& r) {
        return r.module == module && r.message.find(needle) != std::string::npos;
    });
}

void MemorySink::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    records_.clear();
}

// ============================================================================
// LogFilter
// ============================================================================

bool LogFilter::parse(std::string_view spec) {
    default_ = LogLevel::Warn;
    modules_.clear();

    bool ok = true;
    while (!spec.empty()) {
        size_t comma = spec.find(',');
        std::string_view item = trim(spec.substr(0, comma));
        spec = comma == std::string_view::npos ? std::string_view{} : spec.substr(comma + 1);
        if (item.empty())
            continue;

        size_t eq = item.find('=');
        if (eq == std::string_view::npos) {
            // A lone level name sets the default; anything else is a module.
            if (auto level = parse_level(item)) {
                default_ = *level;
            } else {
                modules_[std::string(item)] = LogLevel::Trace;
            }
            continue;
        }

        std::string_view module = trim(item.substr(0, eq));
        auto level = parse_level(trim(item.substr(eq + 1)));
        if (!level) {
            ok = false;
            continue;
        }
        if (module == "*") {
            default_ = *level;
        } else {
            modules_[std::string(module)] = *level;
        }
    }
    return ok;
}

auto LogFilter::threshold(std::string_view module) const -> LogLevel {
    auto it = modules_.find(module);
    return it != modules_.end() ? it->second : default_;
}

auto LogFilter::lowest() const -> LogLevel {
    LogLevel low = default_;
    for (const auto& [_, level] : modules_) {
        low = std::min(low, level);
    }
    return low;
}

// ============================================================================
// Logger
// ============================================================================

Logger::Logger() : filter_(filter_from_env()) {
    sinks_.push_back(std::make_unique<ConsoleSink>(std::cerr, stderr_supports_colors()));
    refresh_floor();
}

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

void Logger::refresh_floor() {
    floor_.store(filter_.lowest(), std::memory_order_relaxed);
}

bool Logger::enabled(LogLevel level, std::string_view module) const {
    if (level < floor_.load(std::memory_order_relaxed) || level == LogLevel::Off)
        return false;
    std::lock_guard<std::mutex> lock(mutex_);
    return level >= filter_.threshold(module);
}

void Logger::log(LogLevel level, std::string_view module, std::string_view message,
                 const char* file, int line) {
    LogRecord record{level, module, message, file, line};
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->write(record);
    }
}

void Logger::add_sink(std::unique_ptr<LogSink> sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.push_back(std::move(sink));
}

void Logger::clear_sinks() {
    std::lock_guard<std::mutex> lock(mutex_);
    sinks_.clear();
}

bool Logger::set_filter(std::string_view spec) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool ok = filter_.parse(spec);
    refresh_floor();
    return ok;
}

void Logger::set_level(LogLevel level) {
    std::lock_guard<std::mutex> lock(mutex_);
    filter_.set_default(level);
    refresh_floor();
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& sink : sinks_) {
        sink->flush();
    }
}

} // namespace reform::log
