#include "domain/events/OrderCancelledEvent.hpp"
#include <nlohmann/json.hpp>

namespace paper::domain {

std::string OrderCancelledEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["orderId"] = orderId;
    j["accountId"] = accountId;
    j["symbol"] = symbol;
    return j.dump();
}

} // namespace paper::domain
