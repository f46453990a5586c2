#pragma once

#include "enums/SessionStatus.hpp"
#include "Timestamp.hpp"

namespace paper::domain {

/**
 * @brief Состояние рынка на момент запроса
 */
struct MarketSession {
    bool isOpen = false;                          ///< Идёт основная сессия
    SessionStatus status = SessionStatus::CLOSED;
    Timestamp nextOpen;                           ///< Ближайшее открытие основной сессии
    Timestamp nextClose;                          ///< Ближайшее закрытие основной сессии
};

} // namespace paper::domain
