#pragma once

#include <optional>
#include <string>

namespace report {

struct Date {
    int year = 0;
    int month = 0;  // 1..12
    int day = 0;    // 1..31
};

inline bool operator==(const Date& a, const Date& b) {
    return a.year == b.year && a.month == b.month && a.day == b.day;
}

// Accepts "YYYY-MM-DD", optionally followed by a 'T' or ' ' and a time
// "HH:MM[:SS[.fff]]" with an optional "Z" or "+HH:MM"/"-HH:MM" offset (the
// JSON form of a JavaScript Date). The time is checked, then ignored.
std::optional<Date> parse_date(const std::string& text);

// "YYYY-MM-DD"
std::string format_date(const Date& d);

}  // namespace report
