#pragma once

#include "enums/ErrorKind.hpp"
#include "AccountSnapshot.hpp"
#include <optional>
#include <string>

namespace paper::domain {

/**
 * @brief Результат создания или чтения счёта
 */
struct AccountResult {
    ErrorKind error = ErrorKind::NONE;
    std::string message;
    std::optional<AccountSnapshot> snapshot;

    bool isSuccess() const {
        return error == ErrorKind::NONE;
    }

    static AccountResult ok(AccountSnapshot snapshot) {
        AccountResult result;
        result.snapshot = std::move(snapshot);
        return result;
    }

    static AccountResult fail(ErrorKind error, std::string message) {
        AccountResult result;
        result.error = error;
        result.message = std::move(message);
        return result;
    }
};

} // namespace paper::domain
