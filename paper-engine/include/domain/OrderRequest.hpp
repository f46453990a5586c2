#pragma once

#include "enums/OrderType.hpp"
#include "enums/OrderSide.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace paper::domain {

/**
 * @brief Запрос на выставление ордера
 */
struct OrderRequest {
    std::string accountId;
    std::string symbol;
    OrderType type = OrderType::MARKET;
    OrderSide side = OrderSide::BUY;
    int64_t quantity = 0;
    std::optional<double> price;
    std::optional<double> stopPrice;
    std::string notes;
};

} // namespace paper::domain
