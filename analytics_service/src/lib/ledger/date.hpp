#pragma once

#include <string>

namespace finance_analytics {

struct YearMonth {
    int year = 1970;
    int month = 1;

    // Contiguous month number, consecutive months differ by one
    int Index() const { return year * 12 + (month - 1); }
    static YearMonth FromIndex(int index);

    YearMonth Plus(int months) const { return FromIndex(Index() + months); }
    int MonthsUntil(const YearMonth& other) const { return other.Index() - Index(); }

    // YYYY-MM
    std::string ToString() const;
    static YearMonth Parse(const std::string& str);
};

inline bool operator==(const YearMonth& lhs, const YearMonth& rhs) {
    return lhs.Index() == rhs.Index();
}
inline bool operator!=(const YearMonth& lhs, const YearMonth& rhs) { return !(lhs == rhs); }
inline bool operator<(const YearMonth& lhs, const YearMonth& rhs) {
    return lhs.Index() < rhs.Index();
}
inline bool operator<=(const YearMonth& lhs, const YearMonth& rhs) { return !(rhs < lhs); }

struct Date {
    int year = 1970;
    int month = 1;
    int day = 1;

    YearMonth GetYearMonth() const { return YearMonth{year, month}; }

    // YYYY-MM-DD
    std::string ToString() const;
    static Date Parse(const std::string& str);
};

inline bool operator==(const Date& lhs, const Date& rhs) {
    return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}
inline bool operator<(const Date& lhs, const Date& rhs) {
    if (lhs.year != rhs.year) return lhs.year < rhs.year;
    if (lhs.month != rhs.month) return lhs.month < rhs.month;
    return lhs.day < rhs.day;
}

int DaysInMonth(int year, int month);

// Inclusive range of months [first, last]
struct MonthRange {
    YearMonth first;
    YearMonth last;

    int Size() const { return first.MonthsUntil(last) + 1; }
    bool Contains(const YearMonth& month) const { return first <= month && month <= last; }
};

}  // namespace finance_analytics
