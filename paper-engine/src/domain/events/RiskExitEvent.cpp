#include "domain/events/RiskExitEvent.hpp"
#include <nlohmann/json.hpp>

namespace paper::domain {

std::string RiskExitEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["accountId"] = transaction.accountId;
    j["symbol"] = transaction.symbol;
    j["reason"] = toString(reason);
    j["quantity"] = transaction.quantity;
    j["triggerPrice"] = triggerPrice;
    j["executionPrice"] = transaction.price;
    j["commission"] = transaction.commission;
    j["amount"] = transaction.amount;
    j["transactionId"] = transaction.id;
    return j.dump();
}

} // namespace paper::domain
