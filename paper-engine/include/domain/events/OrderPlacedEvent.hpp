#pragma once

#include "DomainEvent.hpp"
#include "domain/Order.hpp"

namespace paper::domain {

/**
 * @brief Событие: ордер принят и ожидает исполнения
 */
struct OrderPlacedEvent : public DomainEvent {
    Order order;

    OrderPlacedEvent() : DomainEvent("order.placed") {}

    explicit OrderPlacedEvent(const Order& o) : DomainEvent("order.placed"), order(o) {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<OrderPlacedEvent>(*this);
    }
};

} // namespace paper::domain
