//! # Logger Environment
//!
//! reform is a library and the host tool owns the command line, so the
//! only settings the logger reads on its own come from the environment.

#include "log/log.hpp"

#include <cstdlib>
#include <string>

#ifdef _WIN32
#include <io.h>
#define REFORM_ISATTY(fd) _isatty(fd)
#define REFORM_FILENO(f) _fileno(f)
#else
#include <unistd.h>
#define REFORM_ISATTY(fd) isatty(fd)
#define REFORM_FILENO(f) fileno(f)
#endif

namespace reform::log {

namespace {

auto read_env(const char* name) -> std::string {
#ifdef _WIN32
    char* buf = nullptr;
    size_t len = 0;
    std::string value;
    if (_dupenv_s(&buf, &len, name) == 0 && buf) {
        value = buf;
        free(buf);
    }
    return value;
#else
    const char* value = std::getenv(name);
    return value ? std::string(value) : std::string{};
#endif
}

} // namespace

auto filter_from_env() -> LogFilter {
    LogFilter filter;
    std::string value = read_env("REFORM_LOG");
    if (value.empty())
        return filter;

    // The logger is not usable yet, so complaints go straight to stderr.
    if (!filter.parse(value)) {
        std::cerr << "reform: ignoring unknown level in REFORM_LOG='" << value << "'\n";
    }
    return filter;
}

bool stderr_supports_colors() {
    if (!REFORM_ISATTY(REFORM_FILENO(stderr)))
        return false;
    std::string term = read_env("TERM");
    return !term.empty() && term != "dumb";
}

} // namespace reform::log
