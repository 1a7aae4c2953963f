#pragma once


namespace nonorec {
namespace log {

enum class Level { Debug, Info, Warning, Error };

const char* toString(Level level);

/// Case-insensitive; unknown names map to Info.
Level parseLevel(const char* name);

Level minLevel();
void setMinLevel(Level level);

/// printf-style. Writes "[YYYY-MM-DD HH:MM:SS] LEVEL: message\n" to stderr.
void write(Level level, const char* fmt, ...);

} // namespace log
} // namespace nonorec

#define NONOREC_LOG_DEBUG(...) ::nonorec::log::write(::nonorec::log::Level::Debug,   __VA_ARGS__)
#define NONOREC_LOG_INFO(...)  ::nonorec::log::write(::nonorec::log::Level::Info,    __VA_ARGS__)
#define NONOREC_LOG_WARN(...)  ::nonorec::log::write(::nonorec::log::Level::Warning, __VA_ARGS__)
#define NONOREC_LOG_ERROR(...) ::nonorec::log::write(::nonorec::log::Level::Error,   __VA_ARGS__)
