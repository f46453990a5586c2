#pragma once

#include <string>

namespace paper::domain {

/**
 * @brief Вид ошибки операции, по которому вызывающий код принимает решение
 */
enum class ErrorKind {
    NONE,
    VALIDATION_ERROR,
    INSUFFICIENT_FUNDS,
    INSUFFICIENT_SHARES,
    MARKET_CLOSED,
    QUOTE_UNAVAILABLE,
    ACCOUNT_NOT_FOUND,
    ORDER_NOT_FOUND,
    CANNOT_CANCEL,
    POSITION_NOT_FOUND,
    ACCOUNT_NOT_EMPTY,
    PERSISTENCE_ERROR
};

inline std::string toString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::NONE:                return "NONE";
        case ErrorKind::VALIDATION_ERROR:    return "VALIDATION_ERROR";
        case ErrorKind::INSUFFICIENT_FUNDS:  return "INSUFFICIENT_FUNDS";
        case ErrorKind::INSUFFICIENT_SHARES: return "INSUFFICIENT_SHARES";
        case ErrorKind::MARKET_CLOSED:       return "MARKET_CLOSED";
        case ErrorKind::QUOTE_UNAVAILABLE:   return "QUOTE_UNAVAILABLE";
        case ErrorKind::ACCOUNT_NOT_FOUND:   return "ACCOUNT_NOT_FOUND";
        case ErrorKind::ORDER_NOT_FOUND:     return "ORDER_NOT_FOUND";
        case ErrorKind::CANNOT_CANCEL:       return "CANNOT_CANCEL";
        case ErrorKind::POSITION_NOT_FOUND:  return "POSITION_NOT_FOUND";
        case ErrorKind::ACCOUNT_NOT_EMPTY:   return "ACCOUNT_NOT_EMPTY";
        case ErrorKind::PERSISTENCE_ERROR:   return "PERSISTENCE_ERROR";
    }
    return "UNKNOWN";
}

} // namespace paper::domain
