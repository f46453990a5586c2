#pragma once

#include "Account.hpp"
#include "Order.hpp"
#include "Position.hpp"
#include "Transaction.hpp"
#include <optional>
#include <string>
#include <vector>

namespace paper::domain {

/**
 * @brief Атомарный набор изменений одного счёта
 *
 * Хранилище применяет его целиком или не применяет вовсе.
 * Если задан order, запись проходит только когда сохранённый ордер
 * всё ещё PENDING (защита от двойного исполнения).
 */
struct LedgerUpdate {
    Account account;
    std::vector<Position> upserts;
    std::vector<std::string> removedSymbols;
    std::optional<Order> order;
    std::vector<Transaction> transactions;
};

} // namespace paper::domain
