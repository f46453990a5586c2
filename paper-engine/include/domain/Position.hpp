#pragma once

#include "RiskParams.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace paper::domain {

/**
 * @brief Позиция счёта по инструменту
 *
 * Существует только при quantity > 0: продажа до нуля удаляет позицию.
 */
struct Position {
    std::string accountId;
    std::string symbol;
    int64_t quantity = 0;
    double averagePrice = 0.0;          ///< Средневзвешенная цена входа (без комиссии)
    double currentPrice = 0.0;          ///< Последняя известная рыночная цена
    double marketValue = 0.0;           ///< currentPrice * quantity
    double unrealizedPnL = 0.0;         ///< marketValue - averagePrice * quantity
    double unrealizedPnLPercent = 0.0;
    Timestamp entryDate;
    Timestamp updatedAt;
    std::optional<RiskParams> risk;     ///< Правила SL/TP/trailing, если подключены

    /**
     * @brief Переоценить позицию по новой цене
     */
    void reprice(double price) {
        currentPrice = price;
        marketValue = currentPrice * static_cast<double>(quantity);

        double costBasis = averagePrice * static_cast<double>(quantity);
        unrealizedPnL = marketValue - costBasis;
        unrealizedPnLPercent = costBasis > 0.0 ? unrealizedPnL / costBasis * 100.0 : 0.0;
    }
};

} // namespace paper::domain
