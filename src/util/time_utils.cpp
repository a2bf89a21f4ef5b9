#include "selfupdate/util/time_utils.hpp"

#include <cctype>
#include <charconv>
#include <ctime>

namespace selfupdate {

namespace {

bool ParseFixedInt(std::string_view text, size_t pos, size_t len, int& out) {
    if (pos + len > text.size()) return false;
    const char* first = text.data() + pos;
    const char* last = first + len;
    for (const char* p = first; p != last; ++p) {
        if (!std::isdigit(static_cast<unsigned char>(*p))) return false;
    }
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

bool ParseOffset(std::string_view text, long& out_seconds) {
    if (text == "Z" || text == "z") {
        out_seconds = 0;
        return true;
    }
    if (text.size() != 6 || (text[0] != '+' && text[0] != '-') || text[3] != ':') return false;
    int hh = 0;
    int mm = 0;
    if (!ParseFixedInt(text, 1, 2, hh) || !ParseFixedInt(text, 4, 2, mm)) return false;
    if (hh > 23 || mm > 59) return false;
    out_seconds = (hh * 3600L + mm * 60L) * (text[0] == '-' ? -1 : 1);
    return true;
}

} // namespace

std::string FormatRfc3339(TimePoint tp) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (gmtime_r(&t, &tm) == nullptr) return {};
    char buf[32]{};
    std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
    return buf;
}

bool ParseRfc3339(std::string_view text, TimePoint& out) {
    if (text.size() < 20) return false;
    if (text[4] != '-' || text[7] != '-' || (text[10] != 'T' && text[10] != 't') ||
        text[13] != ':' || text[16] != ':') {
        return false;
    }

    std::tm tm{};
    int year = 0;
    int month = 0;
    if (!ParseFixedInt(text, 0, 4, year) || !ParseFixedInt(text, 5, 2, month) ||
        !ParseFixedInt(text, 8, 2, tm.tm_mday) || !ParseFixedInt(text, 11, 2, tm.tm_hour) ||
        !ParseFixedInt(text, 14, 2, tm.tm_min) || !ParseFixedInt(text, 17, 2, tm.tm_sec)) {
        return false;
    }
    if (month < 1 || month > 12 || tm.tm_mday < 1 || tm.tm_mday > 31 || tm.tm_hour > 23 ||
        tm.tm_min > 59 || tm.tm_sec > 60) {
        return false;
    }
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;

    size_t pos = 19;
    if (text[pos] == '.') {
        ++pos;
        const size_t digits_start = pos;
        while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) ++pos;
        if (pos == digits_start) return false;
    }

    long offset = 0;
    if (!ParseOffset(text.substr(pos), offset)) return false;

    const std::time_t utc = timegm(&tm);
    if (utc == static_cast<std::time_t>(-1)) return false;
    out = std::chrono::system_clock::from_time_t(utc - offset);
    return true;
}

std::string FormatLocalTime(TimePoint tp, const char* fmt) {
    const std::time_t t = std::chrono::system_clock::to_time_t(tp);
    std::tm tm{};
    if (localtime_r(&t, &tm) == nullptr) return {};
    char buf[64]{};
    if (std::strftime(buf, sizeof(buf), fmt, &tm) == 0) return {};
    return buf;
}

bool ParseDuration(std::string_view text, std::chrono::seconds& out) {
    if (text.empty()) return false;

    long long total = 0;
    size_t pos = 0;
    while (pos < text.size()) {
        long long value = 0;
        auto [ptr, ec] = std::from_chars(text.data() + pos, text.data() + text.size(), value);
        if (ec != std::errc() || value < 0) return false;
        pos = static_cast<size_t>(ptr - text.data());
        if (pos >= text.size()) return false;

        long long unit = 0;
        switch (text[pos]) {
            case 's': unit = 1; break;
            case 'm': unit = 60; break;
            case 'h': unit = 3600; break;
            case 'd': unit = 86400; break;
            case 'w': unit = 7 * 86400; break;
            default: return false;
        }
        ++pos;
        total += value * unit;
    }

    out = std::chrono::seconds(total);
    return true;
}

std::string FormatDuration(std::chrono::seconds d) {
    long long s = d.count();
    if (s <= 0) return "0s";

    std::string out;
    const long long days = s / 86400;
    s %= 86400;
    const long long hours = s / 3600;
    s %= 3600;
    const long long minutes = s / 60;
    s %= 60;

    if (days) out += std::to_string(days) + "d";
    if (hours) out += std::to_string(hours) + "h";
    if (minutes) out += std::to_string(minutes) + "m";
    if (s && days == 0) out += std::to_string(s) + "s";
    return out;
}

} // namespace selfupdate
