#pragma once

#include <algorithm>
#include <optional>

namespace paper::domain {

/**
 * @brief Параметры автоматического управления риском позиции
 *
 * Хранятся типизированно (отдельные колонки в БД).
 * peakPriceSinceEntry - максимум цены с момента подключения правил,
 * от него считается уровень trailing stop. Только растёт.
 */
struct RiskParams {
    std::optional<double> stopLoss;             ///< Закрыть, если цена <= stopLoss
    std::optional<double> takeProfit;           ///< Закрыть, если цена >= takeProfit
    std::optional<double> trailingStopPercent;  ///< Отступ от пика в процентах, (0, 100)
    double peakPriceSinceEntry = 0.0;

    bool hasAnyRule() const {
        return stopLoss.has_value() || takeProfit.has_value() || trailingStopPercent.has_value();
    }

    /**
     * @brief Учесть новую цену в пике (монотонный максимум)
     */
    void observePrice(double price) {
        peakPriceSinceEntry = std::max(peakPriceSinceEntry, price);
    }

    /**
     * @brief Текущий уровень срабатывания trailing stop
     */
    std::optional<double> trailingTrigger() const {
        if (!trailingStopPercent) return std::nullopt;
        return peakPriceSinceEntry * (1.0 - *trailingStopPercent / 100.0);
    }
};

} // namespace paper::domain
