#pragma once

#include "Account.hpp"
#include "Order.hpp"
#include "Position.hpp"
#include "Transaction.hpp"
#include <vector>

namespace paper::domain {

/**
 * @brief Счёт вместе с позициями, ордерами и транзакциями
 *
 * Ордера и транзакции отсортированы от новых к старым.
 */
struct AccountSnapshot {
    Account account;
    std::vector<Position> positions;
    std::vector<Order> orders;
    std::vector<Transaction> transactions;
};

} // namespace paper::domain
