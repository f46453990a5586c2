#pragma once

#include <string>
#include <stdexcept>

namespace paper::domain {

/**
 * @brief Направление сделки (и тип транзакции)
 */
enum class OrderSide {
    BUY,
    SELL
};

inline std::string toString(OrderSide side) {
    switch (side) {
        case OrderSide::BUY:  return "BUY";
        case OrderSide::SELL: return "SELL";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderSide orderSideFromString(const std::string& str) {
    if (str == "BUY")  return OrderSide::BUY;
    if (str == "SELL") return OrderSide::SELL;
    throw std::invalid_argument("Unknown OrderSide: " + str);
}

} // namespace paper::domain
