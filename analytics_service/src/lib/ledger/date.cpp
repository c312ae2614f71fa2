#include "date.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

#include <fmt/format.h>

#include "analytics_errors/analytics_errors.hpp"

namespace finance_analytics {

namespace {

std::string Trim(const std::string& s) {
    size_t a = s.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return "";
    size_t b = s.find_last_not_of(" \t\r\n");
    return s.substr(a, b - a + 1);
}

bool ParseWithFormat(const std::string& str, const char* format, std::tm& tm) {
    std::istringstream ss(str);
    ss >> std::get_time(&tm, format);
    if (ss.fail()) {
        return false;
    }
    // Trailing garbage such as "2024-01-05x" is not a date
    return ss.peek() == std::char_traits<char>::eof();
}

}  // namespace

YearMonth YearMonth::FromIndex(int index) {
    int year = index / 12;
    int month = index % 12;
    if (month < 0) {
        month += 12;
        --year;
    }
    return YearMonth{year, month + 1};
}

std::string YearMonth::ToString() const {
    return fmt::format("{:04}-{:02}", year, month);
}

YearMonth YearMonth::Parse(const std::string& str) {
    std::tm tm{};
    if (!ParseWithFormat(Trim(str), "%Y-%m", tm)) {
        throw InvalidConfigError("Malformed month, expected YYYY-MM: '" + str + "'");
    }
    return YearMonth{tm.tm_year + 1900, tm.tm_mon + 1};
}

std::string Date::ToString() const {
    return fmt::format("{:04}-{:02}-{:02}", year, month, day);
}

Date Date::Parse(const std::string& str) {
    std::tm tm{};
    if (!ParseWithFormat(Trim(str), "%Y-%m-%d", tm)) {
        throw InvalidLedgerError("Malformed date, expected YYYY-MM-DD: '" + str + "'");
    }
    Date date{tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday};
    if (date.day < 1 || date.day > DaysInMonth(date.year, date.month)) {
        throw InvalidLedgerError("Day out of range for month: '" + str + "'");
    }
    return date;
}

int DaysInMonth(int year, int month) {
    switch (month) {
        case 2: {
            const bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
            return leap ? 29 : 28;
        }
        case 4:
        case 6:
        case 9:
        case 11:
            return 30;
        default:
            return 31;
    }
}

}  // namespace finance_analytics
