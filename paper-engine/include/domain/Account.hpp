#pragma once

#include "Timestamp.hpp"
#include <string>

namespace paper::domain {

/**
 * @brief Виртуальный торговый счёт
 *
 * Инварианты (поддерживаются AccountAggregator):
 * - totalValue == availableCash + сумма marketValue позиций
 * - totalPnL == totalValue - initialBalance
 */
struct Account {
    std::string id;
    std::string ownerId;
    std::string name;
    double initialBalance = 0.0;
    double availableCash = 0.0;
    double totalValue = 0.0;
    double totalPnL = 0.0;
    double totalPnLPercent = 0.0;
    bool active = true;
    Timestamp createdAt;
    Timestamp updatedAt;
};

} // namespace paper::domain
