#include "domain/events/OrderFilledEvent.hpp"
#include <nlohmann/json.hpp>

namespace paper::domain {

std::string OrderFilledEvent::toJson() const {
    nlohmann::json j;
    j["eventId"] = eventId;
    j["eventType"] = eventType;
    j["timestamp"] = timestamp.toString();
    j["orderId"] = order.id;
    j["accountId"] = order.accountId;
    j["symbol"] = order.symbol;
    j["type"] = toString(order.type);
    j["side"] = toString(order.side);
    j["quantity"] = order.filledQuantity;
    j["basePrice"] = basePrice;
    j["executionPrice"] = order.averagePrice;
    j["slippage"] = slippage;
    j["commission"] = order.commission;
    j["amount"] = transaction.amount;
    j["transactionId"] = transaction.id;
    return j.dump();
}

} // namespace paper::domain
