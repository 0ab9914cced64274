#include "als/parser/timestamp.hpp"

#include <array>
#include <cctype>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <optional>
#include <sstream>

namespace als::parser {
namespace {

enum class Fraction { Optional, Millis, None };
enum class Zone { Any, Utc, Offset, Absent };

struct Layout {
    char date_time_separator;
    Fraction fraction;
    Zone zone;
};

// Priority order matters only for which layout "wins"; every layout that
// accepts a string yields the same instant for it.
constexpr std::array<Layout, 6> kLayouts{{
    {'T', Fraction::Optional, Zone::Any},
    {'T', Fraction::Millis, Zone::Utc},
    {'T', Fraction::None, Zone::Utc},
    {'T', Fraction::Millis, Zone::Offset},
    {'T', Fraction::None, Zone::Offset},
    {' ', Fraction::None, Zone::Absent},
}};

constexpr std::size_t kDateTimeWidth = 19;

bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

bool all_digits(const std::string& s, std::size_t pos, std::size_t count) {
    if (pos + count > s.size()) {
        return false;
    }
    for (std::size_t i = pos; i < pos + count; ++i) {
        if (!is_digit(s[i])) {
            return false;
        }
    }
    return true;
}

bool valid_fields(const std::tm& tm) {
    static const int days_in_month[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (tm.tm_mon < 0 || tm.tm_mon > 11 || tm.tm_mday < 1 ||
        tm.tm_hour > 23 || tm.tm_min > 59 || tm.tm_sec > 59) {
        return false;
    }
    const int year = tm.tm_year + 1900;
    const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    const int limit = days_in_month[tm.tm_mon] + (tm.tm_mon == 1 && leap ? 1 : 0);
    return tm.tm_mday <= limit;
}

// Fixed-width "YYYY-MM-DD<sep>hh:mm:ss" prefix. get_time alone accepts
// single-digit fields, so the digit positions are checked first.
bool parse_date_time(const std::string& raw, char separator, std::tm& tm) {
    if (raw.size() < kDateTimeWidth || raw[10] != separator) {
        return false;
    }
    if (!all_digits(raw, 0, 4) || !all_digits(raw, 5, 2) || !all_digits(raw, 8, 2) ||
        !all_digits(raw, 11, 2) || !all_digits(raw, 14, 2) || !all_digits(raw, 17, 2)) {
        return false;
    }

    std::istringstream in(raw.substr(0, kDateTimeWidth));
    in >> std::get_time(&tm, separator == 'T' ? "%Y-%m-%dT%H:%M:%S" : "%Y-%m-%d %H:%M:%S");
    return !in.fail() && valid_fields(tm);
}

// ".d{1,9}" at raw[pos], scaled to nanoseconds; pos moves past it.
bool parse_fraction(const std::string& raw, std::size_t& pos, Fraction kind, long& nanos) {
    nanos = 0;
    if (pos >= raw.size() || raw[pos] != '.') {
        return kind != Fraction::Millis;
    }
    if (kind == Fraction::None) {
        return false;
    }

    std::size_t end = pos + 1;
    while (end < raw.size() && is_digit(raw[end])) {
        ++end;
    }
    const std::size_t count = end - pos - 1;
    if (count == 0 || count > 9 || (kind == Fraction::Millis && count != 3)) {
        return false;
    }
    for (std::size_t i = pos + 1; i < end; ++i) {
        nanos = nanos * 10 + (raw[i] - '0');
    }
    for (std::size_t i = count; i < 9; ++i) {
        nanos *= 10;
    }
    pos = end;
    return true;
}

// The rest of raw from pos must be exactly the zone the layout allows.
bool parse_zone(const std::string& raw, std::size_t pos, Zone kind, long& offset_seconds) {
    offset_seconds = 0;
    const std::string zone = raw.substr(pos);
    switch (kind) {
        case Zone::Absent:
            return zone.empty();
        case Zone::Utc:
            return zone == "Z";
        case Zone::Any:
            if (zone == "Z") {
                return true;
            }
            break;
        case Zone::Offset:
            break;
    }

    if (zone.size() != 6 || (zone[0] != '+' && zone[0] != '-') || zone[3] != ':' ||
        !all_digits(zone, 1, 2) || !all_digits(zone, 4, 2)) {
        return false;
    }
    const int hours = std::stoi(zone.substr(1, 2));
    const int minutes = std::stoi(zone.substr(4, 2));
    if (hours > 23 || minutes > 59) {
        return false;
    }
    offset_seconds = (hours * 3600L + minutes * 60L) * (zone[0] == '-' ? -1 : 1);
    return true;
}

std::optional<Timestamp> try_layout(const std::string& raw, const Layout& layout) {
    std::tm tm{};
    if (!parse_date_time(raw, layout.date_time_separator, tm)) {
        return std::nullopt;
    }

    std::size_t pos = kDateTimeWidth;
    long nanos = 0;
    long offset_seconds = 0;
    if (!parse_fraction(raw, pos, layout.fraction, nanos) ||
        !parse_zone(raw, pos, layout.zone, offset_seconds)) {
        return std::nullopt;
    }

    const std::time_t seconds = timegm(&tm) - offset_seconds;
    return std::chrono::system_clock::from_time_t(seconds) +
           std::chrono::duration_cast<std::chrono::system_clock::duration>(
               std::chrono::nanoseconds(nanos));
}

} // namespace

Timestamp parse_timestamp(const std::string& raw) {
    if (raw.empty()) {
        return Timestamp{};
    }
    for (const auto& layout : kLayouts) {
        if (auto ts = try_layout(raw, layout)) {
            return *ts;
        }
    }
    return Timestamp{};
}

std::string format_timestamp(Timestamp ts) {
    if (is_zero(ts)) {
        return {};
    }

    const auto since_epoch = ts.time_since_epoch();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(since_epoch - secs).count();
    if (nanos < 0) {
        secs -= std::chrono::seconds(1);
        nanos += 1000000000L;
    }

    const std::time_t t = static_cast<std::time_t>(secs.count());
    std::tm tm{};
    gmtime_r(&t, &tm);

    char base[32];
    std::snprintf(base, sizeof(base), "%04d-%02d-%02dT%02d:%02d:%02d",
                  tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                  tm.tm_hour, tm.tm_min, tm.tm_sec);

    std::string out(base);
    if (nanos != 0) {
        char frac[16];
        std::snprintf(frac, sizeof(frac), ".%09ld", static_cast<long>(nanos));
        std::string f(frac);
        while (f.back() == '0') {
            f.pop_back();
        }
        out += f;
    }
    out += 'Z';
    return out;
}

} // namespace als::parser
