#pragma once

#include <cstdint>

namespace paper::domain {

/**
 * @brief Торговая статистика счёта (иллюстративная)
 */
struct TradingStats {
    int64_t totalTrades = 0;
    int64_t winningTrades = 0;
    int64_t losingTrades = 0;
    double winRate = 0.0;           ///< %
    double averageWin = 0.0;
    double averageLoss = 0.0;       ///< Положительное число
    double profitFactor = 0.0;
    double maxDrawdown = 0.0;       ///< %
    double sharpeRatio = 0.0;
    double totalReturn = 0.0;       ///< %
    double annualizedReturn = 0.0;  ///< %
};

} // namespace paper::domain
