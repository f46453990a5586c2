#pragma once

#include "enums/OrderSide.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace paper::domain {

/**
 * @brief Запись движения денег (append-only)
 *
 * amount - знаковое влияние на кэш с учётом комиссии:
 * покупка -(notional + commission), продажа +(notional - commission).
 */
struct Transaction {
    std::string id;
    std::string accountId;
    std::optional<std::string> orderId;   ///< Нет у риск-выходов
    std::string symbol;
    OrderSide type = OrderSide::BUY;
    int64_t quantity = 0;
    double price = 0.0;
    double amount = 0.0;
    double commission = 0.0;
    std::string description;
    Timestamp timestamp;
};

} // namespace paper::domain
