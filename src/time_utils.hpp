#pragma once

#include <cstdio>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Session date helpers. Dates are stored as int YYYYMMDD.
// ---------------------------------------------------------------------------
namespace time_utils {

constexpr int YEAR_DIVISOR  = 10000;
constexpr int MONTH_DIVISOR = 100;

inline int date_year(int date)  { return date / YEAR_DIVISOR; }
inline int date_month(int date) { return (date / MONTH_DIVISOR) % 100; }
inline int date_day(int date)   { return date % 100; }

inline bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

inline int days_in_month(int year, int month) {
    static constexpr int DAYS[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && is_leap_year(year)) return 29;
    return DAYS[month - 1];
}

inline bool is_valid_date(int date) {
    int y = date_year(date);
    int m = date_month(date);
    int d = date_day(date);
    if (y <= 0 || m < 1 || m > 12) return false;
    return d >= 1 && d <= days_in_month(y, m);
}

// 20240315 -> "2024-03-15"
inline std::string format_date(int date) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d",
                  date_year(date), date_month(date), date_day(date));
    return buf;
}

// Accepts "YYYY-MM-DD", "YYYY/MM/DD" and "YYYYMMDD". A trailing time part
// ("2024-03-15 00:00:00") is ignored.
inline std::optional<int> parse_date(const std::string& text) {
    int y = 0, m = 0, d = 0;
    if (text.size() >= 10 && (text[4] == '-' || text[4] == '/')) {
        char sep1 = 0, sep2 = 0;
        if (std::sscanf(text.c_str(), "%4d%c%2d%c%2d", &y, &sep1, &m, &sep2, &d) != 5) {
            return std::nullopt;
        }
        if (sep1 != sep2) return std::nullopt;
    } else if (text.size() == 8) {
        for (char c : text) {
            if (c < '0' || c > '9') return std::nullopt;
        }
        int packed = std::stoi(text);
        y = date_year(packed);
        m = date_month(packed);
        d = date_day(packed);
    } else {
        return std::nullopt;
    }

    int date = y * YEAR_DIVISOR + m * MONTH_DIVISOR + d;
    if (!is_valid_date(date)) return std::nullopt;
    return date;
}

}  // namespace time_utils
