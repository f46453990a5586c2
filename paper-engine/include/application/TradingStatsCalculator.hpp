#pragma once

#include "application/RiskMetricsCalculator.hpp"
#include "domain/Account.hpp"
#include "domain/Position.hpp"
#include "domain/TradingStats.hpp"
#include "domain/Transaction.hpp"
#include <algorithm>
#include <cmath>
#include <vector>

namespace paper::application {

/**
 * @brief Торговая статистика счёта
 *
 * Иллюстративный расчёт: каждая покупка сопоставляется с первой продажей
 * того же символа, P&L сделки считается за вычетом обеих комиссий.
 * Просадка и Sharpe берутся из RiskMetricsCalculator.
 */
class TradingStatsCalculator {
public:
    /**
     * @param transactions Транзакции в любом порядке
     * @param now Момент расчёта (для годовой доходности)
     */
    static domain::TradingStats compute(
        const domain::Account& account,
        const std::vector<domain::Position>& positions,
        std::vector<domain::Transaction> transactions,
        const domain::Timestamp& now = domain::Timestamp::now())
    {
        std::sort(transactions.begin(), transactions.end(),
                  [](const auto& a, const auto& b) { return a.timestamp < b.timestamp; });

        std::vector<const domain::Transaction*> sells;
        for (const auto& txn : transactions) {
            if (txn.type == domain::OrderSide::SELL) {
                sells.push_back(&txn);
            }
        }

        domain::TradingStats stats;
        double totalWins = 0.0;
        double totalLosses = 0.0;

        for (const auto& buy : transactions) {
            if (buy.type != domain::OrderSide::BUY) continue;

            auto sell = std::find_if(sells.begin(), sells.end(),
                                     [&buy](const auto* s) { return s->symbol == buy.symbol; });
            if (sell == sells.end()) continue;

            ++stats.totalTrades;
            double tradePnL = ((*sell)->price - buy.price) * static_cast<double>(buy.quantity)
                              - buy.commission - (*sell)->commission;
            if (tradePnL > 0.0) {
                ++stats.winningTrades;
                totalWins += tradePnL;
            } else {
                ++stats.losingTrades;
                totalLosses += std::abs(tradePnL);
            }
        }

        double winRate = stats.totalTrades > 0
            ? static_cast<double>(stats.winningTrades) / static_cast<double>(stats.totalTrades) * 100.0
            : 0.0;
        double averageWin = stats.winningTrades > 0 ? totalWins / static_cast<double>(stats.winningTrades) : 0.0;
        double averageLoss = stats.losingTrades > 0 ? totalLosses / static_cast<double>(stats.losingTrades) : 0.0;
        double profitFactor = averageLoss > 0.0 ? averageWin / averageLoss : 0.0;

        double ageYears = now.daysSince(account.createdAt) / 365.0;
        double returnRatio = account.initialBalance != 0.0 ? account.totalPnL / account.initialBalance : 0.0;
        double annualized = ageYears > 0.0 ? returnRatio / ageYears * 100.0 : 0.0;

        auto risk = RiskMetricsCalculator::compute(account, positions);

        stats.winRate = round2(winRate);
        stats.averageWin = round2(averageWin);
        stats.averageLoss = round2(averageLoss);
        stats.profitFactor = round2(profitFactor);
        stats.maxDrawdown = round2(risk.maxDrawdown);
        stats.sharpeRatio = round2(risk.sharpeRatio);
        stats.totalReturn = round2(account.totalPnLPercent);
        stats.annualizedReturn = round2(annualized);
        return stats;
    }

private:
    static double round2(double value) {
        return std::round(value * 100.0) / 100.0;
    }
};

} // namespace paper::application
