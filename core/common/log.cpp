#include "common/log.hpp"
#include "common/timestamp.hpp"
#include <cctype>
#include <cstdarg>
#include <cstdio>
#include <ctime>

namespace nonorec {
namespace log {

namespace {

Level& minLevelRef() {
    static Level level = Level::Info;
    return level;
}

bool iequals(const char* a, const char* b) {
    while (*a && *b) {
        if (std::tolower(static_cast<unsigned char>(*a)) !=
            std::tolower(static_cast<unsigned char>(*b))) {
            return false;
        }
        ++a;
        ++b;
    }
    return *a == *b;
}

} // namespace

const char* toString(Level level) {
    switch (level) {
        case Level::Debug:   return "DEBUG";
        case Level::Info:    return "INFO";
        case Level::Warning: return "WARN";
        case Level::Error:   return "ERROR";
    }
    return "UNKNOWN";
}

Level parseLevel(const char* name) {
    if (!name) return Level::Info;
    if (iequals(name, "debug")) return Level::Debug;
    if (iequals(name, "warn") || iequals(name, "warning")) return Level::Warning;
    if (iequals(name, "error")) return Level::Error;
    return Level::Info;
}

Level minLevel() { return minLevelRef(); }

void setMinLevel(Level level) { minLevelRef() = level; }

void write(Level level, const char* fmt, ...) {
    if (level < minLevelRef()) return;

    char ts[20];
    std::time_t now = std::time(nullptr);
    std::tm local{};
    if (portableLocaltime(now, &local)) {
        std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &local);
    } else {
        std::snprintf(ts, sizeof(ts), "%lld", static_cast<long long>(now));
    }

    std::fprintf(stderr, "[%s] %s: ", ts, toString(level));
    va_list ap;
    va_start(ap, fmt);
    std::vfprintf(stderr, fmt, ap);
    va_end(ap);
    std::fputc('\n', stderr);
    std::fflush(stderr);
}

} // namespace log
} // namespace nonorec
