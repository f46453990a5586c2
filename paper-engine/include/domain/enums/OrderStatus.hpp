#pragma once

#include <string>
#include <stdexcept>

namespace paper::domain {

/**
 * @brief Статус ордера
 *
 * PENDING -> FILLED | CANCELLED | REJECTED, все три конечные.
 */
enum class OrderStatus {
    PENDING,    ///< Ожидает исполнения
    FILLED,     ///< Исполнен полностью
    CANCELLED,  ///< Отменён пользователем
    REJECTED    ///< Отклонён при исполнении
};

inline std::string toString(OrderStatus status) {
    switch (status) {
        case OrderStatus::PENDING:   return "PENDING";
        case OrderStatus::FILLED:    return "FILLED";
        case OrderStatus::CANCELLED: return "CANCELLED";
        case OrderStatus::REJECTED:  return "REJECTED";
    }
    return "UNKNOWN";
}

/**
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderStatus orderStatusFromString(const std::string& str) {
    if (str == "PENDING")   return OrderStatus::PENDING;
    if (str == "FILLED")    return OrderStatus::FILLED;
    if (str == "CANCELLED") return OrderStatus::CANCELLED;
    if (str == "REJECTED")  return OrderStatus::REJECTED;
    throw std::invalid_argument("Unknown OrderStatus: " + str);
}

/**
 * @brief Является ли статус конечным
 */
inline bool isFinalStatus(OrderStatus status) {
    return status != OrderStatus::PENDING;
}

} // namespace paper::domain
