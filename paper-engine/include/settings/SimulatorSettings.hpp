// include/settings/SimulatorSettings.hpp
#pragma once

#include <chrono>
#include <cstdlib>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace paper::settings
{

    /**
     * @brief Инструмент симулятора: тикер и стартовая цена
     */
    struct SimulatedInstrument
    {
        std::string symbol;
        double startPrice = 0.0;
    };

    /**
     * @brief Настройки симулятора котировок
     *
     * SIM_SYMBOLS задаётся списком "TICKER:price" через запятую,
     * например "AAPL:190,MSFT:410".
     */
    class SimulatorSettings
    {
    public:
        SimulatorSettings()
        {
            instruments_ = parseInstruments(getEnvOrDefault("SIM_SYMBOLS", "AAPL:190,MSFT:410,NVDA:120"));
            volatility_ = std::stod(getEnvOrDefault("SIM_VOLATILITY", "0.002"));
            step_ = std::chrono::milliseconds(std::stol(getEnvOrDefault("SIM_STEP_MS", "1000")));

            if (volatility_ < 0.0) {
                throw std::invalid_argument("SIM_VOLATILITY must be non-negative");
            }
            if (step_.count() <= 0) {
                throw std::invalid_argument("SIM_STEP_MS must be positive");
            }
        }

        const std::vector<SimulatedInstrument>& getInstruments() const { return instruments_; }
        double getVolatility() const { return volatility_; }
        std::chrono::milliseconds getStep() const { return step_; }

        static std::vector<SimulatedInstrument> parseInstruments(const std::string& value)
        {
            std::vector<SimulatedInstrument> result;
            std::stringstream ss(value);
            std::string item;
            while (std::getline(ss, item, ',')) {
                if (item.empty()) continue;

                auto colon = item.find(':');
                if (colon == std::string::npos || colon == 0) {
                    throw std::invalid_argument("SIM_SYMBOLS entry must be TICKER:price, got: " + item);
                }

                SimulatedInstrument instrument;
                instrument.symbol = item.substr(0, colon);
                instrument.startPrice = std::stod(item.substr(colon + 1));
                if (instrument.startPrice <= 0.0) {
                    throw std::invalid_argument("SIM_SYMBOLS price must be positive for " + instrument.symbol);
                }
                result.push_back(instrument);
            }
            return result;
        }

    private:
        std::vector<SimulatedInstrument> instruments_;
        double volatility_;
        std::chrono::milliseconds step_;

        static std::string getEnvOrDefault(const char *name, const char *defaultValue)
        {
            const char *value = std::getenv(name);
            return value ? std::string(value) : std::string(defaultValue);
        }
    };

} // namespace paper::settings
