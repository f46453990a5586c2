#pragma once

#include "ports/input/IRiskService.hpp"
#include "ports/output/ITradingStore.hpp"
#include "ports/output/IQuoteProvider.hpp"
#include "ports/output/IEventBus.hpp"
#include "application/AccountAggregator.hpp"
#include "application/AccountLocks.hpp"
#include "application/RiskManager.hpp"
#include "domain/events/RiskExitEvent.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace paper::application {

/**
 * @brief Переоценка позиций и автоматические риск-выходы (Price Refresh)
 *
 * Для каждого счёта за один цикл:
 * 1. Переоценивает все позиции по свежим котировкам
 * 2. Проверяет правила риска на уже переоценённых позициях
 * 3. Пересчитывает итоги счёта
 * 4. Записывает всё одним атомарным commit
 *
 * Котировки запрашиваются вне мьютекса счёта, по одной на символ за цикл.
 */
class RiskService : public ports::input::IRiskService {
public:
    /// Котировки текущего цикла: nullopt - котировки нет
    using QuoteCache = std::unordered_map<std::string, std::optional<double>>;

    RiskService(
        std::shared_ptr<ports::output::ITradingStore> store,
        std::shared_ptr<ports::output::IQuoteProvider> quotes,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<AccountLocks> locks)
        : store_(std::move(store))
        , quotes_(std::move(quotes))
        , eventBus_(std::move(eventBus))
        , locks_(std::move(locks))
    {
        std::cout << "[RiskService] Created" << std::endl;
    }

    /**
     * @brief Подключить правила SL / TP / trailing stop к позиции
     *
     * Пик для trailing stop инициализируется max(averagePrice, currentPrice).
     * Повторный вызов заменяет правила, пик не уменьшается.
     */
    domain::OperationResult addRiskManagement(
        const std::string& accountId,
        const std::string& symbol,
        std::optional<double> stopLoss,
        std::optional<double> takeProfit,
        std::optional<double> trailingStopPercent) override
    {
        if (!stopLoss && !takeProfit && !trailingStopPercent) {
            return domain::OperationResult::fail(domain::ErrorKind::VALIDATION_ERROR,
                                                 "At least one of stopLoss, takeProfit, trailingStop is required");
        }
        if (stopLoss && *stopLoss <= 0.0) {
            return domain::OperationResult::fail(domain::ErrorKind::VALIDATION_ERROR, "stopLoss must be positive");
        }
        if (takeProfit && *takeProfit <= 0.0) {
            return domain::OperationResult::fail(domain::ErrorKind::VALIDATION_ERROR, "takeProfit must be positive");
        }
        if (trailingStopPercent && (*trailingStopPercent <= 0.0 || *trailingStopPercent >= 100.0)) {
            return domain::OperationResult::fail(domain::ErrorKind::VALIDATION_ERROR,
                                                 "trailingStop must be between 0 and 100 percent");
        }

        try {
            auto guard = locks_->acquire(accountId);

            if (!store_->findAccount(accountId)) {
                locks_->forget(accountId);
                return domain::OperationResult::fail(domain::ErrorKind::ACCOUNT_NOT_FOUND,
                                                     "Account not found: " + accountId);
            }

            auto position = store_->findPosition(accountId, symbol);
            if (!position) {
                return domain::OperationResult::fail(domain::ErrorKind::POSITION_NOT_FOUND,
                                                     "No open position in " + symbol);
            }

            domain::RiskParams risk;
            risk.stopLoss = stopLoss;
            risk.takeProfit = takeProfit;
            risk.trailingStopPercent = trailingStopPercent;
            risk.peakPriceSinceEntry = std::max(position->averagePrice, position->currentPrice);
            if (position->risk) {
                risk.observePrice(position->risk->peakPriceSinceEntry);
            }

            position->risk = risk;
            position->updatedAt = domain::Timestamp::now();
            if (!store_->updatePosition(*position)) {
                return domain::OperationResult::fail(domain::ErrorKind::POSITION_NOT_FOUND,
                                                     "No open position in " + symbol);
            }
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[RiskService] addRiskManagement failed: " << e.what() << std::endl;
            return domain::OperationResult::fail(domain::ErrorKind::PERSISTENCE_ERROR, e.what());
        }

        std::cout << "[RiskService] Risk management set for " << accountId << "/" << symbol << std::endl;
        return domain::OperationResult::ok("Risk management added for " + symbol);
    }

    /**
     * @brief Один проход Price Refresh по всем счетам
     *
     * Ошибка хранилища на одном счёте логируется, счёт пропускается.
     */
    size_t refreshAll() override {
        std::vector<domain::Account> accounts;
        try {
            accounts = store_->findAllAccounts();
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[RiskService] Cannot load accounts: " << e.what() << std::endl;
            return 0;
        }

        QuoteCache cache;
        size_t exits = 0;
        for (const auto& account : accounts) {
            try {
                exits += refreshAccount(account.id, cache);
            } catch (const domain::PersistenceException& e) {
                std::cerr << "[RiskService] Skipping account " << account.id << ": " << e.what() << std::endl;
            }
        }
        return exits;
    }

    /**
     * @brief Переоценить один счёт
     * @return Количество риск-выходов
     * @throws domain::PersistenceException
     */
    size_t refreshAccount(const std::string& accountId) {
        QuoteCache cache;
        return refreshAccount(accountId, cache);
    }

    size_t refreshAccount(const std::string& accountId, QuoteCache& cache) {
        for (const auto& position : store_->findPositions(accountId)) {
            if (cache.find(position.symbol) == cache.end()) {
                auto quote = quotes_->getQuote(position.symbol);
                cache[position.symbol] = quote ? std::optional<double>(quote->price) : std::nullopt;
            }
        }

        std::vector<domain::RiskExitEvent> events;
        {
            auto guard = locks_->acquire(accountId);

            auto account = store_->findAccount(accountId);
            if (!account) {
                locks_->forget(accountId);
                return 0;
            }
            auto positions = store_->findPositions(accountId);
            if (positions.empty()) {
                return 0;
            }

            auto now = domain::Timestamp::now();
            domain::LedgerUpdate update;

            // Сначала переоценка всех позиций, потом правила риска
            std::vector<bool> priced(positions.size(), false);
            for (size_t i = 0; i < positions.size(); ++i) {
                auto it = cache.find(positions[i].symbol);
                if (it == cache.end() || !it->second) continue;
                positions[i].reprice(*it->second);
                positions[i].updatedAt = now;
                priced[i] = true;
            }

            std::vector<domain::Position> kept;
            for (size_t i = 0; i < positions.size(); ++i) {
                auto& position = positions[i];
                if (priced[i]) {
                    if (auto reason = RiskManager::evaluate(position)) {
                        auto exit = RiskManager::executeRiskExit(*account, position, *reason, now);
                        *account = exit.account;
                        update.transactions.push_back(exit.transaction);
                        update.removedSymbols.push_back(position.symbol);

                        domain::RiskExitEvent event;
                        event.reason = exit.reason;
                        event.transaction = exit.transaction;
                        event.triggerPrice = exit.triggerPrice;
                        events.push_back(event);
                        continue;
                    }
                    update.upserts.push_back(position);
                }
                kept.push_back(position);
            }

            AccountAggregator::recompute(*account, kept);
            account->updatedAt = now;
            update.account = *account;
            if (!store_->commit(update)) {
                return 0;
            }
        }

        for (const auto& event : events) {
            std::cout << "[RiskService] Risk exit " << domain::toString(event.reason) << ": "
                      << event.transaction.description << std::endl;
            eventBus_->publish(event);
        }
        return events.size();
    }

private:
    std::shared_ptr<ports::output::ITradingStore> store_;
    std::shared_ptr<ports::output::IQuoteProvider> quotes_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<AccountLocks> locks_;
};

} // namespace paper::application
