#pragma once

#include "ports/output/IQuoteProvider.hpp"
#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace paper::tests {

/**
 * @brief Mock реализация IQuoteProvider для тестов
 *
 * Каждый символ отдаёт цены из очереди по одной на вызов,
 * последняя цена повторяется бесконечно. nullopt в очереди
 * означает "котировки нет" на этом вызове.
 */
class MockQuoteProvider : public ports::output::IQuoteProvider {
public:
    // Настройка ответов
    void setPrice(const std::string& symbol, double price) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_[symbol] = {price};
    }

    void scriptPrices(const std::string& symbol, std::vector<std::optional<double>> prices) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_[symbol] = std::deque<std::optional<double>>(prices.begin(), prices.end());
    }

    void makeUnavailable(const std::string& symbol) {
        std::lock_guard<std::mutex> lock(mutex_);
        script_[symbol] = {std::nullopt};
    }

    // Счётчики вызовов
    int callCount(const std::string& symbol) const {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(symbol);
        return it != calls_.end() ? it->second : 0;
    }

    void resetCallCount() {
        std::lock_guard<std::mutex> lock(mutex_);
        calls_.clear();
    }

    // IQuoteProvider implementation
    std::optional<domain::Quote> getQuote(const std::string& symbol) override {
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_[symbol];

        auto it = script_.find(symbol);
        if (it == script_.end() || it->second.empty()) {
            return std::nullopt;
        }

        auto price = it->second.front();
        if (it->second.size() > 1) {
            it->second.pop_front();
        }
        if (!price) {
            return std::nullopt;
        }

        domain::Quote quote;
        quote.symbol = symbol;
        quote.price = *price;
        quote.volume = 1000;
        return quote;
    }

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::deque<std::optional<double>>> script_;
    std::map<std::string, int> calls_;
};

} // namespace paper::tests
