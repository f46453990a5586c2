#pragma once

#include "domain/MarketSession.hpp"

namespace paper::ports::output {

/**
 * @brief Источник состояния торговой сессии
 */
class IMarketClock {
public:
    virtual ~IMarketClock() = default;

    virtual domain::MarketSession getMarketSession() = 0;
};

} // namespace paper::ports::output
