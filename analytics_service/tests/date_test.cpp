#include <userver/utest/utest.hpp>

#include "analytics_errors/analytics_errors.hpp"
#include "ledger/date.hpp"

using finance_analytics::Date;
using finance_analytics::InvalidConfigError;
using finance_analytics::InvalidLedgerError;
using finance_analytics::MonthRange;
using finance_analytics::YearMonth;

TEST(DateTest, ParsesCalendarDay) {
    const Date date = Date::Parse("2024-02-29");
    EXPECT_EQ(date.year, 2024);
    EXPECT_EQ(date.month, 2);
    EXPECT_EQ(date.day, 29);
    EXPECT_EQ(date.ToString(), "2024-02-29");
}

TEST(DateTest, RejectsMalformedDates) {
    EXPECT_THROW(Date::Parse("2023-02-29"), InvalidLedgerError);
    EXPECT_THROW(Date::Parse("2024-04-31"), InvalidLedgerError);
    EXPECT_THROW(Date::Parse("2024-13-01"), InvalidLedgerError);
    EXPECT_THROW(Date::Parse("2024-01-05x"), InvalidLedgerError);
    EXPECT_THROW(Date::Parse("yesterday"), InvalidLedgerError);
    EXPECT_THROW(Date::Parse(""), InvalidLedgerError);
}

TEST(DateTest, OrdersChronologically) {
    EXPECT_TRUE(Date::Parse("2023-12-31") < Date::Parse("2024-01-01"));
    EXPECT_TRUE(Date::Parse("2024-01-01") < Date::Parse("2024-01-02"));
    EXPECT_FALSE(Date::Parse("2024-01-02") < Date::Parse("2024-01-02"));
}

TEST(YearMonthTest, ArithmeticCrossesYearBoundaries) {
    const YearMonth november{2023, 11};
    EXPECT_EQ(november.Plus(2), (YearMonth{2024, 1}));
    EXPECT_EQ(november.Plus(-11), (YearMonth{2022, 12}));
    EXPECT_EQ(november.MonthsUntil(YearMonth{2024, 2}), 3);
    EXPECT_EQ(YearMonth::FromIndex(november.Index()), november);
}

TEST(YearMonthTest, ParsesAndFormats) {
    EXPECT_EQ(YearMonth::Parse("2024-03"), (YearMonth{2024, 3}));
    EXPECT_EQ((YearMonth{2024, 3}).ToString(), "2024-03");
    EXPECT_THROW(YearMonth::Parse("2024-3-1"), InvalidConfigError);
    EXPECT_THROW(YearMonth::Parse("March"), InvalidConfigError);
}

TEST(MonthRangeTest, IsInclusive) {
    const MonthRange range{YearMonth{2023, 11}, YearMonth{2024, 2}};
    EXPECT_EQ(range.Size(), 4);
    EXPECT_TRUE(range.Contains(YearMonth{2023, 11}));
    EXPECT_TRUE(range.Contains(YearMonth{2024, 2}));
    EXPECT_FALSE(range.Contains(YearMonth{2024, 3}));
}
