#include "annual_mosaic/core/dates.hpp"
#include "annual_mosaic/core/errors.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace annual_mosaic::core {

bool is_leap_year(int year) {
    return (year % 4 == 0 && year % 100 != 0) || (year % 400 == 0);
}

int days_in_month(int year, int month) {
    static const int kDays[12] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month < 1 || month > 12) return 0;
    if (month == 2 && is_leap_year(year)) return 29;
    return kDays[month - 1];
}

bool is_valid_date(const Date& d) {
    return d.year >= 1 && d.year <= 9999 && d.month >= 1 && d.month <= 12 &&
           d.day >= 1 && d.day <= days_in_month(d.year, d.month);
}

static bool all_digits(const std::string& s) {
    if (s.empty()) return false;
    for (unsigned char c : s) {
        if (!std::isdigit(c)) return false;
    }
    return true;
}

std::optional<Date> parse_date(const std::string& text) {
    std::string s = text;
    auto t_pos = s.find('T');
    if (t_pos != std::string::npos) {
        s = s.substr(0, t_pos);
    }

    Date d;
    if (s.size() == 8 && all_digits(s)) {
        d.year = std::stoi(s.substr(0, 4));
        d.month = std::stoi(s.substr(4, 2));
        d.day = std::stoi(s.substr(6, 2));
    } else if (s.size() == 10 && s[4] == '-' && s[7] == '-' &&
               all_digits(s.substr(0, 4)) && all_digits(s.substr(5, 2)) &&
               all_digits(s.substr(8, 2))) {
        d.year = std::stoi(s.substr(0, 4));
        d.month = std::stoi(s.substr(5, 2));
        d.day = std::stoi(s.substr(8, 2));
    } else {
        return std::nullopt;
    }

    if (!is_valid_date(d)) return std::nullopt;
    return d;
}

std::string format_date(const Date& d) {
    std::ostringstream oss;
    oss << std::setfill('0') << std::setw(4) << d.year << '-'
        << std::setw(2) << d.month << '-' << std::setw(2) << d.day;
    return oss.str();
}

std::vector<YearWindow> year_windows(int first_year, int last_year) {
    if (first_year < 1 || last_year > 9999) {
        throw ValidationError("year range must lie in [1,9999]");
    }
    if (first_year > last_year) {
        throw ValidationError("first year " + std::to_string(first_year) +
                              " is after last year " + std::to_string(last_year));
    }

    std::vector<YearWindow> out;
    out.reserve(static_cast<size_t>(last_year - first_year + 1));
    for (int y = first_year; y <= last_year; ++y) {
        out.push_back({y, {{y, 1, 1}, {y, 12, 31}}});
    }
    return out;
}

} // namespace annual_mosaic::core
