#pragma once

#include <string>

namespace paper::domain {

/**
 * @brief Торговая сессия американского фондового рынка (время ET)
 */
enum class SessionStatus {
    PRE_MARKET,   ///< 04:00 - 09:30
    OPEN,         ///< 09:30 - 16:00, основная сессия
    AFTER_HOURS,  ///< 16:00 - 20:00
    CLOSED        ///< ночь, выходные, праздники
};

inline std::string toString(SessionStatus status) {
    switch (status) {
        case SessionStatus::PRE_MARKET:  return "pre-market";
        case SessionStatus::OPEN:        return "open";
        case SessionStatus::AFTER_HOURS: return "after-hours";
        case SessionStatus::CLOSED:      return "closed";
    }
    return "unknown";
}

} // namespace paper::domain
