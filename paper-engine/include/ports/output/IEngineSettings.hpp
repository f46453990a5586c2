#pragma once

#include <chrono>

namespace paper::ports::output {

/**
 * @brief Настройки фоновых циклов движка
 */
class IEngineSettings {
public:
    virtual ~IEngineSettings() = default;

    /// Период Price Refresh в основную сессию
    virtual std::chrono::milliseconds getPriceRefreshOpenInterval() const = 0;

    /// Период Price Refresh вне основной сессии
    virtual std::chrono::milliseconds getPriceRefreshClosedInterval() const = 0;

    /// Период Order Monitor в основную сессию
    virtual std::chrono::milliseconds getOrderMonitorOpenInterval() const = 0;

    /// Период Order Monitor вне основной сессии
    virtual std::chrono::milliseconds getOrderMonitorClosedInterval() const = 0;
};

} // namespace paper::ports::output
