#pragma once

#include "enums/ErrorKind.hpp"
#include "Order.hpp"
#include <optional>
#include <string>

namespace paper::domain {

/**
 * @brief Результат операции над ордером
 *
 * При ошибке order пуст (или содержит состояние на момент отказа),
 * error указывает вид ошибки.
 */
struct OrderResult {
    ErrorKind error = ErrorKind::NONE;
    std::string message;
    std::optional<Order> order;

    bool isSuccess() const {
        return error == ErrorKind::NONE;
    }

    static OrderResult ok(Order order, std::string message = "") {
        OrderResult result;
        result.order = std::move(order);
        result.message = std::move(message);
        return result;
    }

    static OrderResult fail(ErrorKind error, std::string message) {
        OrderResult result;
        result.error = error;
        result.message = std::move(message);
        return result;
    }
};

} // namespace paper::domain
