#pragma once

#include <chrono>
#include <ctime>
#include <optional>
#include <string>

namespace nonorec {

using Clock = std::chrono::system_clock;

/// Wall-clock time at second resolution, the precision of the ledger file.
using Timestamp = std::chrono::time_point<Clock, std::chrono::seconds>;

/// "Never completed". Sorts before every real timestamp.
inline constexpr Timestamp kNeverDone = Timestamp::min();

/// Current time truncated to whole seconds.
Timestamp nowSeconds();

/// Whole days as a duration usable with Timestamp arithmetic.
inline constexpr std::chrono::seconds days(int n) {
    return std::chrono::seconds(static_cast<long long>(n) * 24 * 60 * 60);
}

// --- Portable time conversion shims ---
bool portableLocaltime(std::time_t t, std::tm* out);
std::time_t portableTimegm(std::tm* tm);

/// Local time with its UTC offset, "YYYY-MM-DD HH:MM:SS+HHMM". The offset
/// keeps the repeated hour of a DST changeover unambiguous. Throws
/// ConfigError if the value cannot be represented as a calendar date.
std::string formatTimestamp(Timestamp ts);

/// Accepts:
///   YYYY-MM-DD HH:MM:SS   (optionally with 'T' and a fractional part)
///   YYYY-MM-DD
///   MM/DD/YYYY HH:MM:SS
/// A time may be followed by a UTC offset (+HHMM, +HH:MM or Z); without
/// one it is read as local time.
std::optional<Timestamp> parseTimestamp(const std::string& text);

} // namespace nonorec
