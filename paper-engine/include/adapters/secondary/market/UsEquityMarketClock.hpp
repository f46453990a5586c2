#pragma once

#include "ports/output/IMarketClock.hpp"
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/date_time/local_time/local_time.hpp>
#include <boost/date_time/gregorian/gregorian.hpp>
#include <boost/make_shared.hpp>
#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <vector>

namespace paper::adapters::secondary {

/**
 * @brief Часы американского фондового рынка (America/New_York)
 *
 * Сессии по времени ET:
 * - 04:00 - 09:30 pre-market
 * - 09:30 - 16:00 основная
 * - 16:00 - 20:00 after-hours
 * - иначе закрыт; выходные и праздники закрыты целиком
 *
 * Переход на летнее время задаётся POSIX-правилом (Boost.DateTime),
 * праздники - фиксированные даты (1 января, 4 июля, 25 декабря).
 * Источник текущего времени инжектируется для тестов.
 */
class UsEquityMarketClock : public ports::output::IMarketClock {
public:
    using NowFunction = std::function<std::chrono::system_clock::time_point()>;

    /// Boost трактует смещение в POSIX-строке как смещение от UTC (EST = UTC-5)
    static constexpr const char* EASTERN_TZ = "EST-05EDT+01,M3.2.0/02:00,M11.1.0/02:00";

    static constexpr int PRE_MARKET_OPEN_MIN = 4 * 60;
    static constexpr int REGULAR_OPEN_MIN = 9 * 60 + 30;
    static constexpr int REGULAR_CLOSE_MIN = 16 * 60;
    static constexpr int AFTER_HOURS_CLOSE_MIN = 20 * 60;

    explicit UsEquityMarketClock(NowFunction now = []() { return std::chrono::system_clock::now(); })
        : now_(std::move(now))
        , tz_(boost::make_shared<boost::local_time::posix_time_zone>(std::string(EASTERN_TZ)))
        , holidays_{{1, 1}, {7, 4}, {12, 25}}
    {}

    domain::MarketSession getMarketSession() override {
        auto local = toLocal(now_());
        auto today = local.date();
        int minutes = static_cast<int>(local.time_of_day().total_seconds() / 60);

        domain::MarketSession session;
        session.status = classify(today, minutes);
        session.isOpen = session.status == domain::SessionStatus::OPEN;

        bool tradingToday = isTradingDay(today);
        session.nextOpen = tradingToday && minutes < REGULAR_OPEN_MIN
            ? toTimestamp(today, REGULAR_OPEN_MIN)
            : toTimestamp(nextTradingDay(today), REGULAR_OPEN_MIN);
        session.nextClose = tradingToday && minutes < REGULAR_CLOSE_MIN
            ? toTimestamp(today, REGULAR_CLOSE_MIN)
            : toTimestamp(nextTradingDay(today), REGULAR_CLOSE_MIN);
        return session;
    }

    /**
     * @brief Рабочий ли день (не выходной и не праздник)
     */
    bool isTradingDay(const boost::gregorian::date& day) const {
        auto weekday = day.day_of_week();
        if (weekday == boost::date_time::Saturday || weekday == boost::date_time::Sunday) {
            return false;
        }
        for (const auto& [month, dayOfMonth] : holidays_) {
            if (day.month() == month && day.day() == dayOfMonth) {
                return false;
            }
        }
        return true;
    }

private:
    NowFunction now_;
    boost::local_time::time_zone_ptr tz_;
    std::vector<std::pair<int, int>> holidays_;

    domain::SessionStatus classify(const boost::gregorian::date& day, int minutes) const {
        if (!isTradingDay(day)) {
            return domain::SessionStatus::CLOSED;
        }
        if (minutes >= PRE_MARKET_OPEN_MIN && minutes < REGULAR_OPEN_MIN) {
            return domain::SessionStatus::PRE_MARKET;
        }
        if (minutes >= REGULAR_OPEN_MIN && minutes < REGULAR_CLOSE_MIN) {
            return domain::SessionStatus::OPEN;
        }
        if (minutes >= REGULAR_CLOSE_MIN && minutes < AFTER_HOURS_CLOSE_MIN) {
            return domain::SessionStatus::AFTER_HOURS;
        }
        return domain::SessionStatus::CLOSED;
    }

    boost::gregorian::date nextTradingDay(boost::gregorian::date day) const {
        do {
            day += boost::gregorian::days(1);
        } while (!isTradingDay(day));
        return day;
    }

    boost::posix_time::ptime toLocal(std::chrono::system_clock::time_point tp) const {
        auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
        boost::posix_time::ptime utc = epoch() + boost::posix_time::milliseconds(millis);
        boost::local_time::local_date_time local(utc, tz_);
        return local.local_time();
    }

    domain::Timestamp toTimestamp(const boost::gregorian::date& day, int minutesOfDay) const {
        boost::local_time::local_date_time local(
            day,
            boost::posix_time::minutes(minutesOfDay),
            tz_,
            boost::local_time::local_date_time::EXCEPTION_ON_ERROR);
        auto millis = (local.utc_time() - epoch()).total_milliseconds();
        return domain::Timestamp::fromUnixMillis(millis);
    }

    static boost::posix_time::ptime epoch() {
        return boost::posix_time::ptime(boost::gregorian::date(1970, 1, 1));
    }
};

} // namespace paper::adapters::secondary
