#pragma once

#include "domain/Account.hpp"
#include "domain/Position.hpp"
#include <vector>

namespace paper::application {

/**
 * @brief Пересчёт итогов счёта по кэшу и позициям
 *
 * Идемпотентен: повторный вызов на тех же данных ничего не меняет.
 */
class AccountAggregator {
public:
    static void recompute(domain::Account& account, const std::vector<domain::Position>& positions) {
        double positionsValue = 0.0;
        for (const auto& position : positions) {
            positionsValue += position.marketValue;
        }

        account.totalValue = account.availableCash + positionsValue;
        account.totalPnL = account.totalValue - account.initialBalance;
        account.totalPnLPercent = account.initialBalance != 0.0
            ? account.totalPnL / account.initialBalance * 100.0
            : 0.0;
    }
};

} // namespace paper::application
