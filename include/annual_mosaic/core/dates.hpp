#pragma once

#include "types.hpp"
#include <optional>
#include <string>
#include <vector>

namespace annual_mosaic::core {

bool is_leap_year(int year);
int days_in_month(int year, int month);
bool is_valid_date(const Date& d);

// Accepts "YYYY-MM-DD", "YYYYMMDD" and "YYYY-MM-DDThh:mm:ss[...]".
std::optional<Date> parse_date(const std::string& text);

std::string format_date(const Date& d);

// One closed [Jan 1, Dec 31] window per year in [first_year, last_year].
std::vector<YearWindow> year_windows(int first_year, int last_year);

} // namespace annual_mosaic::core
