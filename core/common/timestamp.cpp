#include "common/timestamp.hpp"
#include "common/errors.hpp"
#include <cctype>
#include <iomanip>
#include <sstream>

namespace nonorec {

namespace {

const char* const kAcceptedFormats[] = {
    "%Y-%m-%d %H:%M:%S",
    "%Y-%m-%dT%H:%M:%S",
    "%m/%d/%Y %H:%M:%S",
    "%Y-%m-%d",
};

std::string trimmed(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) ++a;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b - 1]))) --b;
    return s.substr(a, b - a);
}

bool allDigits(const std::string& s, size_t pos, size_t n) {
    for (size_t i = pos; i < pos + n; i++) {
        if (!std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    }
    return true;
}

// Splits a trailing UTC offset off `text` (only after a time of day).
// Returns the offset in seconds east of UTC, or nullopt when there is none.
std::optional<long> takeUtcOffset(std::string& text) {
    if (text.find(':') == std::string::npos) return std::nullopt;

    if (!text.empty() && (text.back() == 'Z' || text.back() == 'z')) {
        text.pop_back();
        return 0L;
    }

    size_t n = text.size();
    size_t sign_pos;
    int hours, minutes;
    if (n >= 5 && (text[n - 5] == '+' || text[n - 5] == '-') && allDigits(text, n - 4, 4)) {
        sign_pos = n - 5;
        hours = std::stoi(text.substr(n - 4, 2));
        minutes = std::stoi(text.substr(n - 2, 2));
    } else if (n >= 6 && (text[n - 6] == '+' || text[n - 6] == '-') &&
               allDigits(text, n - 5, 2) && text[n - 3] == ':' && allDigits(text, n - 2, 2)) {
        sign_pos = n - 6;
        hours = std::stoi(text.substr(n - 5, 2));
        minutes = std::stoi(text.substr(n - 2, 2));
    } else {
        return std::nullopt;
    }

    long offset = (hours * 60L + minutes) * 60L;
    if (text[sign_pos] == '-') offset = -offset;
    text.erase(sign_pos);
    while (!text.empty() && std::isspace(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    return offset;
}

// Parses one format; the whole string must be consumed (a fractional
// seconds suffix is tolerated and dropped).
std::optional<std::tm> parseWith(const std::string& text, const char* format) {
    std::tm tm{};
    std::istringstream iss(text);
    iss >> std::get_time(&tm, format);
    if (iss.fail()) return std::nullopt;

    if (iss.peek() == '.') {
        iss.get();
        if (!std::isdigit(iss.peek())) return std::nullopt;
        while (std::isdigit(iss.peek())) iss.get();
    }
    if (iss.peek() != std::char_traits<char>::eof()) return std::nullopt;
    return tm;
}

} // namespace

bool portableLocaltime(std::time_t t, std::tm* out) {
#ifdef _WIN32
    return localtime_s(out, &t) == 0;
#else
    return localtime_r(&t, out) != nullptr;
#endif
}

std::time_t portableTimegm(std::tm* tm) {
#ifdef _WIN32
    return _mkgmtime(tm);
#else
    return timegm(tm);
#endif
}

Timestamp nowSeconds() {
    return std::chrono::time_point_cast<std::chrono::seconds>(Clock::now());
}

std::string formatTimestamp(Timestamp ts) {
    if (ts == kNeverDone) {
        throw ConfigError("Cannot format the 'never done' timestamp");
    }
    std::time_t t = Clock::to_time_t(ts);
    std::tm local{};
    if (!portableLocaltime(t, &local)) {
        throw ConfigError("Timestamp out of range: " + std::to_string(t));
    }
    char buf[40];
    std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S%z", &local);
    return buf;
}

std::optional<Timestamp> parseTimestamp(const std::string& text) {
    std::string s = trimmed(text);
    if (s.empty()) return std::nullopt;

    std::optional<long> utc_offset = takeUtcOffset(s);

    for (const char* format : kAcceptedFormats) {
        auto tm = parseWith(s, format);
        if (!tm) continue;

        std::time_t t;
        if (utc_offset) {
            t = portableTimegm(&*tm);
            if (t == static_cast<std::time_t>(-1)) return std::nullopt;
            t -= *utc_offset;
        } else {
            tm->tm_isdst = -1;
            t = std::mktime(&*tm);
            if (t == static_cast<std::time_t>(-1)) return std::nullopt;
        }
        return std::chrono::time_point_cast<std::chrono::seconds>(Clock::from_time_t(t));
    }
    return std::nullopt;
}

} // namespace nonorec
