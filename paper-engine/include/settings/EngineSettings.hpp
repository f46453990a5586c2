// include/settings/EngineSettings.hpp
#pragma once

#include "ports/output/IEngineSettings.hpp"
#include <chrono>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace paper::settings
{

    /**
     * @brief Настройки движка: периоды фоновых циклов, задержки, хранилище
     *
     * Читает параметры из переменных окружения.
     */
    class EngineSettings : public ports::output::IEngineSettings
    {
    public:
        EngineSettings()
        {
            priceRefreshOpen_ = readMillis("PAPER_PRICE_REFRESH_OPEN_MS", "5000");
            priceRefreshClosed_ = readMillis("PAPER_PRICE_REFRESH_CLOSED_MS", "30000");
            orderMonitorOpen_ = readMillis("PAPER_ORDER_MONITOR_OPEN_MS", "2000");
            orderMonitorClosed_ = readMillis("PAPER_ORDER_MONITOR_CLOSED_MS", "10000");
            quoteTimeout_ = readMillis("PAPER_QUOTE_TIMEOUT_MS", "2000");
            execDelayMin_ = readMillis("PAPER_EXEC_DELAY_MIN_MS", "100");
            execDelayMax_ = readMillis("PAPER_EXEC_DELAY_MAX_MS", "500");
            storeType_ = getEnvOrDefault("PAPER_STORE", "memory");
            demoOwner_ = getEnvOrDefault("PAPER_DEMO_OWNER", "");

            if (execDelayMin_ > execDelayMax_) {
                throw std::invalid_argument("PAPER_EXEC_DELAY_MIN_MS must not exceed PAPER_EXEC_DELAY_MAX_MS");
            }
            if (storeType_ != "memory" && storeType_ != "postgres") {
                throw std::invalid_argument("PAPER_STORE must be 'memory' or 'postgres', got: " + storeType_);
            }
        }

        std::chrono::milliseconds getPriceRefreshOpenInterval() const override { return priceRefreshOpen_; }
        std::chrono::milliseconds getPriceRefreshClosedInterval() const override { return priceRefreshClosed_; }
        std::chrono::milliseconds getOrderMonitorOpenInterval() const override { return orderMonitorOpen_; }
        std::chrono::milliseconds getOrderMonitorClosedInterval() const override { return orderMonitorClosed_; }

        std::chrono::milliseconds getQuoteTimeout() const { return quoteTimeout_; }
        std::chrono::milliseconds getExecDelayMin() const { return execDelayMin_; }
        std::chrono::milliseconds getExecDelayMax() const { return execDelayMax_; }
        std::string getStoreType() const { return storeType_; }
        std::string getDemoOwner() const { return demoOwner_; }

    private:
        std::chrono::milliseconds priceRefreshOpen_;
        std::chrono::milliseconds priceRefreshClosed_;
        std::chrono::milliseconds orderMonitorOpen_;
        std::chrono::milliseconds orderMonitorClosed_;
        std::chrono::milliseconds quoteTimeout_;
        std::chrono::milliseconds execDelayMin_;
        std::chrono::milliseconds execDelayMax_;
        std::string storeType_;
        std::string demoOwner_;

        static std::chrono::milliseconds readMillis(const char *name, const char *defaultValue)
        {
            long value = std::stol(getEnvOrDefault(name, defaultValue));
            if (value < 0) {
                throw std::invalid_argument(std::string(name) + " must be non-negative");
            }
            return std::chrono::milliseconds(value);
        }

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace paper::settings
