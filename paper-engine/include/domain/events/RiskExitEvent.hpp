#pragma once

#include "DomainEvent.hpp"
#include "domain/enums/ExitReason.hpp"
#include "domain/Transaction.hpp"

namespace paper::domain {

/**
 * @brief Событие: позиция закрыта риск-менеджером
 */
struct RiskExitEvent : public DomainEvent {
    ExitReason reason = ExitReason::STOP_LOSS;
    Transaction transaction;
    double triggerPrice = 0.0;  ///< Цена, на которой сработало правило

    RiskExitEvent() : DomainEvent("position.risk_exit") {}

    std::string toJson() const override;

    std::unique_ptr<DomainEvent> clone() const override {
        return std::make_unique<RiskExitEvent>(*this);
    }
};

} // namespace paper::domain
