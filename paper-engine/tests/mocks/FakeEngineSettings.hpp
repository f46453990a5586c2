#pragma once

#include "ports/output/IEngineSettings.hpp"

namespace paper::tests {

/**
 * @brief Настройки движка с периодами из теста
 */
class FakeEngineSettings : public ports::output::IEngineSettings {
public:
    std::chrono::milliseconds priceRefreshOpen{50};
    std::chrono::milliseconds priceRefreshClosed{500};
    std::chrono::milliseconds orderMonitorOpen{20};
    std::chrono::milliseconds orderMonitorClosed{200};

    std::chrono::milliseconds getPriceRefreshOpenInterval() const override { return priceRefreshOpen; }
    std::chrono::milliseconds getPriceRefreshClosedInterval() const override { return priceRefreshClosed; }
    std::chrono::milliseconds getOrderMonitorOpenInterval() const override { return orderMonitorOpen; }
    std::chrono::milliseconds getOrderMonitorClosedInterval() const override { return orderMonitorClosed; }
};

} // namespace paper::tests
