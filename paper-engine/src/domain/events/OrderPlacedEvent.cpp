#include "domain/events/OrderPlacedEvent.hpp"
#include <nlohmann/json.hpp>

namespace paper::domain {

std::string OrderPlacedEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["orderId"] = order.id;
    j["accountId"] = order.accountId;
    j["symbol"] = order.symbol;
    j["type"] = toString(order.type);
    j["side"] = toString(order.side);
    j["quantity"] = order.quantity;
    if (order.price) {
        j["price"] = *order.price;
    }
    if (order.stopPrice) {
        j["stopPrice"] = *order.stopPrice;
    }
    j["estimatedCommission"] = order.commission;
    return j.dump();
}

} // namespace paper::domain
