#pragma once

#include "domain/Account.hpp"
#include "domain/Position.hpp"
#include "domain/enums/OrderSide.hpp"
#include "domain/Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace paper::application {

/**
 * @brief Итог применения сделки к счёту
 */
struct FillOutcome {
    domain::Account account;                  ///< Счёт с обновлённым кэшем
    std::optional<domain::Position> position; ///< nullopt - позиция закрыта
};

/**
 * @brief Применение исполненной сделки к кэшу и позиции
 *
 * Комиссия влияет на кэш, но не на среднюю цену позиции.
 */
class PositionLedger {
public:
    /**
     * @brief Применить сделку
     *
     * @param account Счёт до сделки
     * @param existing Текущая позиция по символу (если есть)
     * @throws std::invalid_argument при quantity <= 0 или продаже сверх позиции
     */
    static FillOutcome applyFill(
        const domain::Account& account,
        const std::optional<domain::Position>& existing,
        const std::string& symbol,
        domain::OrderSide side,
        int64_t quantity,
        double executionPrice,
        double commission,
        const domain::Timestamp& now = domain::Timestamp::now())
    {
        if (quantity <= 0) {
            throw std::invalid_argument("Fill quantity must be positive");
        }

        FillOutcome outcome{account, existing};
        double notional = executionPrice * static_cast<double>(quantity);

        if (side == domain::OrderSide::BUY) {
            outcome.account.availableCash -= notional + commission;

            if (!existing) {
                domain::Position position;
                position.accountId = account.id;
                position.symbol = symbol;
                position.quantity = quantity;
                position.averagePrice = executionPrice;
                position.entryDate = now;
                position.updatedAt = now;
                position.reprice(executionPrice);
                outcome.position = position;
            } else {
                auto position = *existing;
                double costBefore = position.averagePrice * static_cast<double>(position.quantity);
                position.quantity += quantity;
                position.averagePrice = (costBefore + notional) / static_cast<double>(position.quantity);
                position.updatedAt = now;
                position.reprice(position.currentPrice > 0.0 ? position.currentPrice : executionPrice);
                outcome.position = position;
            }
        } else {
            if (!existing || existing->quantity < quantity) {
                throw std::invalid_argument("Cannot sell " + std::to_string(quantity) +
                                            " shares of " + symbol + ": position too small");
            }

            outcome.account.availableCash += notional - commission;

            auto position = *existing;
            position.quantity -= quantity;
            if (position.quantity == 0) {
                outcome.position = std::nullopt;
            } else {
                position.updatedAt = now;
                position.reprice(position.currentPrice);
                outcome.position = position;
            }
        }

        outcome.account.updatedAt = now;
        return outcome;
    }
};

} // namespace paper::application
