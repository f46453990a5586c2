#include "domain/events/OrderRejectedEvent.hpp"
#include <nlohmann/json.hpp>

namespace paper::domain {

std::string OrderRejectedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["orderId"] = orderId;
    j["accountId"] = accountId;
    j["symbol"] = symbol;
    j["reason"] = reason;
    return j.dump();
}

} // namespace paper::domain
