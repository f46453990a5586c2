#pragma once

#include "enums/ErrorKind.hpp"
#include <string>

namespace paper::domain {

/**
 * @brief Результат операции без полезной нагрузки
 */
struct OperationResult {
    ErrorKind error = ErrorKind::NONE;
    std::string message;

    bool isSuccess() const {
        return error == ErrorKind::NONE;
    }

    static OperationResult ok(std::string message = "") {
        return OperationResult{ErrorKind::NONE, std::move(message)};
    }

    static OperationResult fail(ErrorKind error, std::string message) {
        return OperationResult{error, std::move(message)};
    }
};

} // namespace paper::domain
