#pragma once

#include "domain/enums/OrderSide.hpp"
#include "domain/TradingRules.hpp"
#include <cstdint>

namespace paper::application {

/**
 * @brief Модель стоимости исполнения: комиссия и проскальзывание
 *
 * Чистые функции без состояния.
 */
class PricingModel {
public:
    /**
     * @brief Фиксированная комиссия по объёму сделки
     *
     * Объём < $1000 -> $0.99, иначе $9.99 (ровно $1000 - уже крупная).
     */
    static double commission(int64_t quantity, double price) {
        double notional = static_cast<double>(quantity) * price;
        return notional < domain::rules::COMMISSION_THRESHOLD
            ? domain::rules::COMMISSION_SMALL
            : domain::rules::COMMISSION_LARGE;
    }

    /**
     * @brief Доля проскальзывания по объёму сделки
     *
     * < $10k -> 0.1%, < $100k -> 0.2%, иначе 0.5%.
     */
    static double slippage(double notional) {
        if (notional < domain::rules::SLIPPAGE_SMALL_LIMIT) {
            return domain::rules::SLIPPAGE_SMALL;
        }
        if (notional < domain::rules::SLIPPAGE_MEDIUM_LIMIT) {
            return domain::rules::SLIPPAGE_MEDIUM;
        }
        return domain::rules::SLIPPAGE_LARGE;
    }

    /**
     * @brief Цена исполнения: проскальзывание всегда против трейдера
     */
    static double executionPrice(double basePrice, domain::OrderSide side, double slip) {
        return side == domain::OrderSide::BUY
            ? basePrice * (1.0 + slip)
            : basePrice * (1.0 - slip);
    }
};

} // namespace paper::application
