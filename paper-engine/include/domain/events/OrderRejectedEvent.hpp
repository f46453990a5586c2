#pragma once

#include "DomainEvent.hpp"
#include <string>

namespace paper::domain {

/**
 * @brief Событие: ордер отклонён при исполнении
 */
struct OrderRejectedEvent : public DomainEvent {
    std::string orderId;
    std::string accountId;
    std::string symbol;
    std::string reason;

    OrderRejectedEvent() : DomainEvent("order.rejected") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<OrderRejectedEvent>(*this);
    }
};

} // namespace paper::domain
