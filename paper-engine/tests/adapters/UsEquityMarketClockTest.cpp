#include <gtest/gtest.h>
#include "adapters/secondary/market/UsEquityMarketClock.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>

using namespace paper::adapters::secondary;
using paper::domain::SessionStatus;

namespace {

/// UTC "YYYY-MM-DD HH:MM:SS" -> time_point
std::chrono::system_clock::time_point utc(const std::string& text) {
    auto pt = boost::posix_time::time_from_string(text);
    return std::chrono::system_clock::from_time_t(boost::posix_time::to_time_t(pt));
}

int64_t utcSeconds(const std::string& text) {
    return boost::posix_time::to_time_t(boost::posix_time::time_from_string(text));
}

UsEquityMarketClock clockAt(const std::string& text) {
    auto tp = utc(text);
    return UsEquityMarketClock([tp]() { return tp; });
}

} // namespace

// ================================================================
// SESSIONS (зима, EST = UTC-5)
// ================================================================

TEST(UsEquityMarketClockTest, WinterPreMarket) {
    // Пн 2024-01-08 08:00 EST
    auto clock = clockAt("2024-01-08 13:00:00");
    auto session = clock.getMarketSession();

    EXPECT_EQ(session.status, SessionStatus::PRE_MARKET);
    EXPECT_FALSE(session.isOpen);
    EXPECT_EQ(session.nextOpen.toUnixSeconds(), utcSeconds("2024-01-08 14:30:00"));
    EXPECT_EQ(session.nextClose.toUnixSeconds(), utcSeconds("2024-01-08 21:00:00"));
}

TEST(UsEquityMarketClockTest, WinterRegularOpenBoundary) {
    // ровно 09:30 EST уже основная сессия
    auto clock = clockAt("2024-01-08 14:30:00");

    auto session = clock.getMarketSession();

    EXPECT_EQ(session.status, SessionStatus::OPEN);
    EXPECT_TRUE(session.isOpen);
    EXPECT_EQ(session.nextOpen.toUnixSeconds(), utcSeconds("2024-01-09 14:30:00"));
}

TEST(UsEquityMarketClockTest, WinterAfterHours) {
    // Пн 16:30 EST
    auto clock = clockAt("2024-01-08 21:30:00");

    auto session = clock.getMarketSession();

    EXPECT_EQ(session.status, SessionStatus::AFTER_HOURS);
    EXPECT_EQ(session.nextClose.toUnixSeconds(), utcSeconds("2024-01-09 21:00:00"));
}

TEST(UsEquityMarketClockTest, LateEvening_Closed) {
    // Пн 21:00 EST = Вт 02:00 UTC
    auto clock = clockAt("2024-01-09 02:00:00");

    auto session = clock.getMarketSession();

    EXPECT_EQ(session.status, SessionStatus::CLOSED);
    EXPECT_EQ(session.nextOpen.toUnixSeconds(), utcSeconds("2024-01-09 14:30:00"));
}

// ================================================================
// DST / WEEKENDS / HOLIDAYS
// ================================================================

TEST(UsEquityMarketClockTest, SummerUsesDaylightOffset) {
    // Пн 2024-03-11 10:00 EDT (UTC-4), на следующий день после перехода
    auto clock = clockAt("2024-03-11 14:00:00");

    auto session = clock.getMarketSession();

    EXPECT_EQ(session.status, SessionStatus::OPEN);
    EXPECT_EQ(session.nextClose.toUnixSeconds(), utcSeconds("2024-03-11 20:00:00"));
}

TEST(UsEquityMarketClockTest, Saturday_ClosedUntilMonday) {
    auto clock = clockAt("2024-01-13 16:00:00");

    auto session = clock.getMarketSession();

    EXPECT_EQ(session.status, SessionStatus::CLOSED);
    EXPECT_EQ(session.nextOpen.toUnixSeconds(), utcSeconds("2024-01-15 14:30:00"));
}

TEST(UsEquityMarketClockTest, IndependenceDay_Closed) {
    // Чт 2024-07-04 11:00 EDT
    auto clock = clockAt("2024-07-04 15:00:00");

    auto session = clock.getMarketSession();

    EXPECT_EQ(session.status, SessionStatus::CLOSED);
    EXPECT_EQ(session.nextOpen.toUnixSeconds(), utcSeconds("2024-07-05 13:30:00"));
}

TEST(UsEquityMarketClockTest, TradingDayCalendar) {
    UsEquityMarketClock clock;

    EXPECT_TRUE(clock.isTradingDay(boost::gregorian::date(2024, 1, 2)));
    EXPECT_FALSE(clock.isTradingDay(boost::gregorian::date(2024, 1, 1)));
    EXPECT_FALSE(clock.isTradingDay(boost::gregorian::date(2024, 12, 25)));
    EXPECT_FALSE(clock.isTradingDay(boost::gregorian::date(2024, 1, 7)));
}
