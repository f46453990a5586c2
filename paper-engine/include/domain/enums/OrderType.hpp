#pragma once

#include <string>
#include <stdexcept>

namespace paper::domain {

/**
 * @brief Тип торгового ордера
 */
enum class OrderType {
    MARKET,      ///< Рыночный ордер (исполняется сразу по текущей цене)
    LIMIT,       ///< Лимитный ордер (по указанной цене или лучше)
    STOP,        ///< Стоп-ордер (становится рыночным при достижении stopPrice)
    STOP_LIMIT   ///< Стоп-лимит (при достижении stopPrice проверяется лимит)
};

inline std::string toString(OrderType type) {
    switch (type) {
        case OrderType::MARKET:     return "MARKET";
        case OrderType::LIMIT:      return "LIMIT";
        case OrderType::STOP:       return "STOP";
        case OrderType::STOP_LIMIT: return "STOP_LIMIT";
    }
    return "UNKNOWN";
}

/**
 * @brief Создать из строки
 * @throws std::invalid_argument если строка не распознана
 */
inline OrderType orderTypeFromString(const std::string& str) {
    if (str == "MARKET")     return OrderType::MARKET;
    if (str == "LIMIT")      return OrderType::LIMIT;
    if (str == "STOP")       return OrderType::STOP;
    if (str == "STOP_LIMIT") return OrderType::STOP_LIMIT;
    throw std::invalid_argument("Unknown OrderType: " + str);
}

/**
 * @brief Требует ли тип ордера лимитной цены (price)
 */
inline bool requiresPrice(OrderType type) {
    return type == OrderType::LIMIT || type == OrderType::STOP_LIMIT;
}

/**
 * @brief Требует ли тип ордера стоп-цены (stopPrice)
 */
inline bool requiresStopPrice(OrderType type) {
    return type == OrderType::STOP || type == OrderType::STOP_LIMIT;
}

/**
 * @brief Метка для описаний транзакций ("STOP-LIMIT BUY ...")
 */
inline std::string descriptionLabel(OrderType type) {
    switch (type) {
        case OrderType::MARKET:     return "";
        case OrderType::LIMIT:      return "LIMIT";
        case OrderType::STOP:       return "STOP";
        case OrderType::STOP_LIMIT: return "STOP-LIMIT";
    }
    return "";
}

} // namespace paper::domain
