#pragma once

#include "domain/Account.hpp"
#include "domain/Position.hpp"
#include "domain/RiskMetrics.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace paper::application {

/**
 * @brief Эвристические метрики риска портфеля
 *
 * Это заглушки для отображения: все значения выводятся из одного
 * отношения P&L к стоимости счёта, без исторических данных.
 * Движок исполнения их не использует.
 */
class RiskMetricsCalculator {
public:
    static constexpr double RISK_FREE_RATE = 0.02;
    static constexpr double VAR95_Z = 1.65;

    static domain::RiskMetrics compute(
        const domain::Account& account,
        const std::vector<domain::Position>& positions)
    {
        domain::RiskMetrics metrics;
        if (positions.empty() || account.totalValue <= 0.0) {
            return metrics;
        }

        double pnlRatio = account.totalPnL / account.totalValue;
        double volatility = std::abs(pnlRatio) * 100.0;
        double beta = account.totalPnL > 0.0 ? 0.8 : 1.2;
        double sharpe = volatility > 0.0 ? (pnlRatio - RISK_FREE_RATE) / (volatility / 100.0) : 0.0;
        double drawdown = account.initialBalance != 0.0
            ? std::min(0.0, account.totalPnL / account.initialBalance) * 100.0
            : 0.0;
        double var95 = account.totalValue * (volatility / 100.0) * VAR95_Z;
        double correlation = positions.size() > 1 ? 0.3 : 0.0;

        metrics.volatility = std::clamp(volatility, 0.0, 100.0);
        metrics.beta = std::clamp(beta, 0.0, 3.0);
        metrics.sharpeRatio = std::clamp(sharpe, -3.0, 3.0);
        metrics.maxDrawdown = std::clamp(drawdown, -100.0, 0.0);
        metrics.var95 = std::max(0.0, var95);
        metrics.correlation = std::clamp(correlation, 0.0, 1.0);
        return metrics;
    }
};

} // namespace paper::application
