#include "report/Date.hpp"

#include <cctype>
#include <cstdio>
#include <initializer_list>

namespace report {

static bool is_digit(char c) {
    return std::isdigit(static_cast<unsigned char>(c)) != 0;
}

static int read_number(const std::string& s, size_t pos, size_t len) {
    int v = 0;
    for (size_t i = pos; i < pos + len; ++i) v = v * 10 + (s[i] - '0');
    return v;
}

static bool is_leap_year(int y) {
    return (y % 4 == 0 && y % 100 != 0) || y % 400 == 0;
}

static int days_in_month(int y, int m) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (m == 2 && is_leap_year(y)) return 29;
    return kDays[m - 1];
}

static bool digits_at(const std::string& s, size_t pos, size_t len) {
    if (pos + len > s.size()) return false;
    for (size_t i = pos; i < pos + len; ++i) {
        if (!is_digit(s[i])) return false;
    }
    return true;
}

// "HH:MM[:SS[.fff]][Z|+HH:MM|-HH:MM]" starting at pos, to the end of text.
static bool is_valid_time(const std::string& text, size_t pos) {
    if (!digits_at(text, pos, 2) || pos + 2 >= text.size() || text[pos + 2] != ':' ||
        !digits_at(text, pos + 3, 2)) {
        return false;
    }
    if (read_number(text, pos, 2) > 23 || read_number(text, pos + 3, 2) > 59) return false;
    pos += 5;

    if (pos < text.size() && text[pos] == ':') {
        if (!digits_at(text, pos + 1, 2) || read_number(text, pos + 1, 2) > 59) return false;
        pos += 3;
        if (pos < text.size() && text[pos] == '.') {
            ++pos;
            const size_t first = pos;
            while (pos < text.size() && is_digit(text[pos])) ++pos;
            if (pos == first) return false;
        }
    }

    if (pos == text.size()) return true;
    if (text[pos] == 'Z') return pos + 1 == text.size();
    if (text[pos] != '+' && text[pos] != '-') return false;
    if (pos + 6 != text.size() || text[pos + 3] != ':') return false;
    if (!digits_at(text, pos + 1, 2) || !digits_at(text, pos + 4, 2)) return false;
    return read_number(text, pos + 1, 2) <= 23 && read_number(text, pos + 4, 2) <= 59;
}

std::optional<Date> parse_date(const std::string& text) {
    if (text.size() < 10) return std::nullopt;

    for (size_t i : {0, 1, 2, 3, 5, 6, 8, 9}) {
        if (!is_digit(text[i])) return std::nullopt;
    }
    if (text[4] != '-' || text[7] != '-') return std::nullopt;
    if (text.size() > 10) {
        if (text[10] != 'T' && text[10] != ' ') return std::nullopt;
        if (!is_valid_time(text, 11)) return std::nullopt;
    }

    Date d;
    d.year = read_number(text, 0, 4);
    d.month = read_number(text, 5, 2);
    d.day = read_number(text, 8, 2);

    if (d.year < 1) return std::nullopt;
    if (d.month < 1 || d.month > 12) return std::nullopt;
    if (d.day < 1 || d.day > days_in_month(d.year, d.month)) return std::nullopt;
    return d;
}

std::string format_date(const Date& d) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", d.year, d.month, d.day);
    return buf;
}

}  // namespace report
