#pragma once

#include <string>

namespace paper::domain {

/**
 * @brief Причина автоматического закрытия позиции риск-менеджером
 */
enum class ExitReason {
    STOP_LOSS,
    TAKE_PROFIT,
    TRAILING_STOP
};

inline std::string toString(ExitReason reason) {
    switch (reason) {
        case ExitReason::STOP_LOSS:     return "stop_loss";
        case ExitReason::TAKE_PROFIT:   return "take_profit";
        case ExitReason::TRAILING_STOP: return "trailing_stop";
    }
    return "unknown";
}

} // namespace paper::domain
