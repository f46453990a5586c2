#pragma once

#include "enums/OrderType.hpp"
#include "enums/OrderSide.hpp"
#include "enums/OrderStatus.hpp"
#include "Timestamp.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace paper::domain {

/**
 * @brief Ордер на виртуальном счёте
 *
 * Изменяется только переходами fill / cancel / reject,
 * после конечного статуса неизменяем.
 */
struct Order {
    std::string id;
    std::string accountId;
    std::string symbol;
    OrderType type = OrderType::MARKET;
    OrderSide side = OrderSide::BUY;
    int64_t quantity = 0;
    std::optional<double> price;        ///< Лимит (LIMIT, STOP_LIMIT)
    std::optional<double> stopPrice;    ///< Стоп (STOP, STOP_LIMIT)
    OrderStatus status = OrderStatus::PENDING;
    int64_t filledQuantity = 0;
    double averagePrice = 0.0;          ///< Цена исполнения после fill
    double commission = 0.0;            ///< Оценка при выставлении, факт после fill
    std::string notes;
    Timestamp createdAt;
    Timestamp updatedAt;

    bool isPending() const {
        return status == OrderStatus::PENDING;
    }
};

} // namespace paper::domain
