#pragma once

#include "DomainEvent.hpp"
#include "domain/Order.hpp"
#include "domain/Transaction.hpp"

namespace paper::domain {

/**
 * @brief Событие: ордер исполнен
 */
struct OrderFilledEvent : public DomainEvent {
    Order order;
    Transaction transaction;
    double basePrice = 0.0;     ///< Котировка до проскальзывания
    double slippage = 0.0;      ///< Доля, 0.001 = 0.1%

    OrderFilledEvent() : DomainEvent("order.filled") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<OrderFilledEvent>(*this);
    }
};

} // namespace paper::domain
