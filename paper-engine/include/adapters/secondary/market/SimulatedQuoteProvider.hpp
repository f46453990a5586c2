#pragma once

#include "ports/output/IQuoteProvider.hpp"
#include <algorithm>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

namespace paper::adapters::secondary {

/**
 * @brief Симулятор котировок
 *
 * Geometric random walk: P(t+1) = P(t) * (1 + sigma * Z), Z ~ N(0, 1).
 * Шаги применяются лениво при запросе котировки, по одному на каждый
 * прошедший интервал step (не более MAX_CATCH_UP_STEPS за раз).
 * Для неизвестного символа котировки нет (nullopt).
 *
 * @example
 * ```cpp
 * SimulatedQuoteProvider sim(std::chrono::milliseconds{1000}, 42);
 * sim.initInstrument("AAPL", 190.0, 0.002);
 * auto quote = sim.getQuote("AAPL");   // ~190.0
 * sim.setPrice("AAPL", 185.0);         // детерминированно
 * ```
 *
 * Thread-safe: да
 */
class SimulatedQuoteProvider : public ports::output::IQuoteProvider {
public:
    static constexpr int64_t MAX_CATCH_UP_STEPS = 100;

    /**
     * @param step Интервал одного шага блуждания
     * @param seed Seed генератора (0 = random_device)
     */
    explicit SimulatedQuoteProvider(
        std::chrono::milliseconds step = std::chrono::milliseconds{1000},
        unsigned int seed = 0)
        : step_(step.count() > 0 ? step : std::chrono::milliseconds{1000})
        , rng_(seed == 0 ? std::random_device{}() : seed)
    {}

    /**
     * @param volatility Волатильность за шаг в долях (0.002 = 0.2%)
     */
    void initInstrument(const std::string& symbol, double basePrice, double volatility = 0.002) {
        std::lock_guard<std::mutex> lock(mutex_);

        InstrumentState state;
        state.price = std::max(0.01, basePrice);
        state.volatility = std::max(0.0, volatility);
        state.volume = 1000000;
        state.lastStep = std::chrono::steady_clock::now();
        state.asOf = std::chrono::system_clock::now();

        instruments_[symbol] = state;
    }

    bool hasInstrument(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return instruments_.find(symbol) != instruments_.end();
    }

    std::optional<domain::Quote> getQuote(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = instruments_.find(symbol);
        if (it == instruments_.end()) {
            return std::nullopt;
        }

        auto& state = it->second;
        advance(state);

        domain::Quote quote;
        quote.symbol = symbol;
        quote.price = state.price;
        quote.volume = state.volume;
        quote.asOf = domain::Timestamp(state.asOf);
        return quote;
    }

    /**
     * @brief Установить цену (для демонстраций и тестов)
     * @return true если инструмент найден
     */
    bool setPrice(const std::string& symbol, double price) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = instruments_.find(symbol);
        if (it == instruments_.end()) {
            return false;
        }

        it->second.price = std::max(0.01, price);
        it->second.lastStep = std::chrono::steady_clock::now();
        it->second.asOf = std::chrono::system_clock::now();
        return true;
    }

    /**
     * @brief Изменить цену на процент (-5.0 = -5%)
     * @return Новая цена или 0.0 если инструмент не найден
     */
    double movePricePercent(const std::string& symbol, double percent) {
        std::lock_guard<std::mutex> lock(mutex_);

        auto it = instruments_.find(symbol);
        if (it == instruments_.end()) {
            return 0.0;
        }

        it->second.price = std::max(0.01, it->second.price * (1.0 + percent / 100.0));
        it->second.asOf = std::chrono::system_clock::now();
        return it->second.price;
    }

    size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return instruments_.size();
    }

private:
    struct InstrumentState {
        double price = 100.0;
        double volatility = 0.002;
        int64_t volume = 1000000;
        std::chrono::steady_clock::time_point lastStep;
        std::chrono::system_clock::time_point asOf;
    };

    std::chrono::milliseconds step_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, InstrumentState> instruments_;
    std::mt19937 rng_;

    void advance(InstrumentState& state) {
        auto now = std::chrono::steady_clock::now();
        auto steps = (now - state.lastStep) / step_;
        if (steps <= 0) {
            return;
        }

        std::normal_distribution<double> dist(0.0, state.volatility);
        std::uniform_int_distribution<int64_t> volumeDist(100, 5000);
        for (int64_t i = 0; i < std::min<int64_t>(steps, MAX_CATCH_UP_STEPS); ++i) {
            state.price = std::max(0.01, state.price * (1.0 + dist(rng_)));
            state.volume += volumeDist(rng_);
        }

        state.lastStep += step_ * steps;
        state.asOf = std::chrono::system_clock::now();
    }
};

} // namespace paper::adapters::secondary
