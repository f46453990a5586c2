#pragma once

#include "application/PositionLedger.hpp"
#include "application/PricingModel.hpp"
#include "domain/Account.hpp"
#include "domain/Position.hpp"
#include "domain/Transaction.hpp"
#include "domain/enums/ExitReason.hpp"
#include "utils/PriceFormat.hpp"
#include "utils/IdGenerator.hpp"
#include <algorithm>
#include <cctype>
#include <optional>
#include <string>

namespace paper::application {

/**
 * @brief Результат риск-выхода: счёт после продажи и запись транзакции
 */
struct RiskExit {
    domain::Account account;
    domain::Transaction transaction;
    domain::ExitReason reason;
    double triggerPrice = 0.0;
};

/**
 * @brief Правила автоматического закрытия позиций
 *
 * Приоритет проверки: stop-loss, take-profit, trailing stop.
 * Срабатывает первое подходящее правило, не более одного выхода за цикл.
 */
class RiskManager {
public:
    /**
     * @brief Проверить правила позиции по её currentPrice
     *
     * Сначала обновляет peakPriceSinceEntry (он должен расти и тогда,
     * когда выход не срабатывает), затем проверяет правила по приоритету.
     *
     * @param position Позиция, уже переоценённая по свежей котировке
     * @return Причина выхода или nullopt
     */
    static std::optional<domain::ExitReason> evaluate(domain::Position& position) {
        if (!position.risk) {
            return std::nullopt;
        }

        auto& risk = *position.risk;
        double price = position.currentPrice;
        risk.observePrice(price);

        if (risk.stopLoss && price <= *risk.stopLoss) {
            return domain::ExitReason::STOP_LOSS;
        }
        if (risk.takeProfit && price >= *risk.takeProfit) {
            return domain::ExitReason::TAKE_PROFIT;
        }
        if (auto trigger = risk.trailingTrigger(); trigger && price <= *trigger) {
            return domain::ExitReason::TRAILING_STOP;
        }
        return std::nullopt;
    }

    /**
     * @brief Продать позицию целиком по текущей цене
     *
     * Минует валидацию ордеров, но не бесплатна: проскальзывание
     * и комиссия считаются как для обычной продажи.
     */
    static RiskExit executeRiskExit(
        const domain::Account& account,
        const domain::Position& position,
        domain::ExitReason reason,
        const domain::Timestamp& now = domain::Timestamp::now())
    {
        double basePrice = position.currentPrice;
        double notional = basePrice * static_cast<double>(position.quantity);
        double slip = PricingModel::slippage(notional);
        double executionPrice = PricingModel::executionPrice(basePrice, domain::OrderSide::SELL, slip);
        double commission = PricingModel::commission(position.quantity, executionPrice);

        auto outcome = PositionLedger::applyFill(
            account, position, position.symbol, domain::OrderSide::SELL,
            position.quantity, executionPrice, commission, now);

        domain::Transaction txn;
        txn.id = utils::IdGenerator::transactionId();
        txn.accountId = account.id;
        txn.symbol = position.symbol;
        txn.type = domain::OrderSide::SELL;
        txn.quantity = position.quantity;
        txn.price = executionPrice;
        txn.amount = executionPrice * static_cast<double>(position.quantity) - commission;
        txn.commission = commission;
        txn.description = "RISK EXIT: " + upper(domain::toString(reason)) + " - " +
                          std::to_string(position.quantity) + " shares of " + position.symbol +
                          " at " + utils::formatPrice(executionPrice);
        txn.timestamp = now;

        return RiskExit{outcome.account, txn, reason, basePrice};
    }

private:
    static std::string upper(std::string s) {
        std::transform(s.begin(), s.end(), s.begin(),
                       [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
        return s;
    }
};

} // namespace paper::application
