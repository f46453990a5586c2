#pragma once

#include "ports/input/IOrderService.hpp"
#include "ports/output/ITradingStore.hpp"
#include "ports/output/IQuoteProvider.hpp"
#include "ports/output/IMarketClock.hpp"
#include "ports/output/IExecutionLatency.hpp"
#include "ports/output/IEventBus.hpp"
#include "application/AccountAggregator.hpp"
#include "application/AccountLocks.hpp"
#include "application/PositionLedger.hpp"
#include "application/PricingModel.hpp"
#include "domain/events/OrderPlacedEvent.hpp"
#include "domain/events/OrderFilledEvent.hpp"
#include "domain/events/OrderCancelledEvent.hpp"
#include "domain/events/OrderRejectedEvent.hpp"
#include "domain/TradingRules.hpp"
#include "utils/PriceFormat.hpp"
#include "utils/IdGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>

namespace paper::application {

/**
 * @brief Движок ордеров бумажной торговли
 *
 * Отвечает за:
 * - Валидацию и выставление ордеров
 * - Немедленное исполнение MARKET ордеров
 * - Проверку условий LIMIT / STOP / STOP_LIMIT (Order Monitor)
 * - Отмену ордеров
 *
 * Все изменения счёта выполняются под мьютексом счёта (AccountLocks),
 * котировки запрашиваются вне мьютекса. Двойное исполнение исключено
 * повторной проверкой статуса под мьютексом и условной записью в хранилище.
 *
 * Thread-safe: да
 */
class OrderEngine : public ports::input::IOrderService {
public:
    OrderEngine(
        std::shared_ptr<ports::output::ITradingStore> store,
        std::shared_ptr<ports::output::IQuoteProvider> quotes,
        std::shared_ptr<ports::output::IMarketClock> clock,
        std::shared_ptr<ports::output::IExecutionLatency> latency,
        std::shared_ptr<ports::output::IEventBus> eventBus,
        std::shared_ptr<AccountLocks> locks)
        : store_(std::move(store))
        , quotes_(std::move(quotes))
        , clock_(std::move(clock))
        , latency_(std::move(latency))
        , eventBus_(std::move(eventBus))
        , locks_(std::move(locks))
    {
        std::cout << "[OrderEngine] Created" << std::endl;
    }

    /**
     * @brief Проверить и выставить ордер
     *
     * Проверки (первая неудачная завершает вызов):
     * 1. Количество в [1, 1000000]
     * 2. Наличие и положительность price / stopPrice по типу ордера
     * 3. Доступность котировки, существование счёта
     * 4. MARKET только в основную сессию
     * 5. BUY: estimatedPrice * qty + commission <= cash * 0.95
     * 6. SELL: в позиции достаточно бумаг
     */
    domain::OrderResult placeOrder(const domain::OrderRequest& request) override {
        if (auto error = validateRequest(request)) {
            return *error;
        }

        auto quote = quotes_->getQuote(request.symbol);
        if (!quote) {
            return domain::OrderResult::fail(domain::ErrorKind::QUOTE_UNAVAILABLE,
                                             "Quote unavailable for " + request.symbol);
        }

        domain::Order order = buildOrder(request);

        try {
            auto guard = locks_->acquire(request.accountId);

            auto account = store_->findAccount(request.accountId);
            if (!account) {
                locks_->forget(request.accountId);
                return domain::OrderResult::fail(domain::ErrorKind::ACCOUNT_NOT_FOUND,
                                                 "Account not found: " + request.accountId);
            }

            if (order.type == domain::OrderType::MARKET) {
                auto session = clock_->getMarketSession();
                if (session.status != domain::SessionStatus::OPEN) {
                    return domain::OrderResult::fail(
                        domain::ErrorKind::MARKET_CLOSED,
                        "Market orders are accepted only during regular trading hours (market is " +
                            domain::toString(session.status) + ")");
                }
            }

            double estimatedPrice = order.price.value_or(quote->price);
            order.commission = PricingModel::commission(order.quantity, estimatedPrice);

            if (order.side == domain::OrderSide::BUY) {
                double required = estimatedPrice * static_cast<double>(order.quantity) + order.commission;
                double allowed = account->availableCash * domain::rules::MAX_CASH_USAGE;
                if (required > allowed) {
                    return domain::OrderResult::fail(
                        domain::ErrorKind::INSUFFICIENT_FUNDS,
                        "Insufficient funds: need " + utils::formatPrice(required) +
                            ", available " + utils::formatPrice(allowed));
                }
            } else {
                auto position = store_->findPosition(order.accountId, order.symbol);
                int64_t held = position ? position->quantity : 0;
                if (held < order.quantity) {
                    return domain::OrderResult::fail(
                        domain::ErrorKind::INSUFFICIENT_SHARES,
                        "Insufficient shares: holding " + std::to_string(held) + " " + order.symbol +
                            ", requested " + std::to_string(order.quantity));
                }
            }

            store_->saveOrder(order);
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[OrderEngine] placeOrder failed: " << e.what() << std::endl;
            return domain::OrderResult::fail(domain::ErrorKind::PERSISTENCE_ERROR, e.what());
        }

        std::cout << "[OrderEngine] Placed " << domain::toString(order.type) << " "
                  << domain::toString(order.side) << " " << order.quantity << " "
                  << order.symbol << " (" << order.id << ")" << std::endl;
        eventBus_->publish(domain::OrderPlacedEvent(order));

        if (order.type == domain::OrderType::MARKET) {
            return fillMarketOrder(order.id);
        }
        return domain::OrderResult::ok(order, "Order placed, waiting for trigger");
    }

    /**
     * @brief Исполнить PENDING рыночный ордер по свежей котировке
     *
     * Для ордера не в статусе PENDING ничего не делает.
     * Если котировки нет, ордер отклоняется.
     */
    domain::OrderResult fillMarketOrder(const std::string& orderId) {
        std::unique_ptr<domain::DomainEvent> event;
        domain::OrderResult result;

        try {
            auto order = store_->findOrder(orderId);
            if (!order) {
                return domain::OrderResult::fail(domain::ErrorKind::ORDER_NOT_FOUND,
                                                 "Order not found: " + orderId);
            }
            if (!order->isPending()) {
                return alreadyFinal(*order);
            }

            auto quote = quotes_->getQuote(order->symbol);

            auto guard = locks_->acquire(order->accountId);
            order = store_->findOrder(orderId);
            if (!order || !order->isPending()) {
                return order ? alreadyFinal(*order)
                             : domain::OrderResult::fail(domain::ErrorKind::ORDER_NOT_FOUND,
                                                         "Order not found: " + orderId);
            }

            if (!quote) {
                result = reject(*order, domain::ErrorKind::QUOTE_UNAVAILABLE,
                                "Quote unavailable at execution", event);
            } else {
                result = fill(*order, quote->price, event);
            }
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[OrderEngine] fillMarketOrder(" << orderId << ") failed: " << e.what() << std::endl;
            return domain::OrderResult::fail(domain::ErrorKind::PERSISTENCE_ERROR, e.what());
        }

        if (event) {
            eventBus_->publish(*event);
        }
        return result;
    }

    /**
     * @brief Отменить ордер
     *
     * Только PENDING и только в основную сессию, иначе CANNOT_CANCEL.
     */
    domain::OrderResult cancelOrder(const std::string& orderId) override {
        domain::OrderCancelledEvent event;
        domain::Order order;

        try {
            auto existing = store_->findOrder(orderId);
            if (!existing) {
                return domain::OrderResult::fail(domain::ErrorKind::ORDER_NOT_FOUND,
                                                 "Order not found: " + orderId);
            }

            auto guard = locks_->acquire(existing->accountId);
            existing = store_->findOrder(orderId);
            if (!existing) {
                return domain::OrderResult::fail(domain::ErrorKind::ORDER_NOT_FOUND,
                                                 "Order not found: " + orderId);
            }
            if (!existing->isPending()) {
                return domain::OrderResult::fail(
                    domain::ErrorKind::CANNOT_CANCEL,
                    "Only pending orders can be cancelled (order is " + domain::toString(existing->status) + ")");
            }

            auto session = clock_->getMarketSession();
            if (!session.isOpen) {
                return domain::OrderResult::fail(
                    domain::ErrorKind::CANNOT_CANCEL,
                    "Orders can be cancelled only during regular trading hours");
            }

            order = *existing;
            order.status = domain::OrderStatus::CANCELLED;
            order.updatedAt = domain::Timestamp::now();
            if (!store_->transitionOrder(order)) {
                return domain::OrderResult::fail(domain::ErrorKind::CANNOT_CANCEL,
                                                 "Order is no longer pending");
            }
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[OrderEngine] cancelOrder(" << orderId << ") failed: " << e.what() << std::endl;
            return domain::OrderResult::fail(domain::ErrorKind::PERSISTENCE_ERROR, e.what());
        }

        std::cout << "[OrderEngine] Cancelled order " << orderId << std::endl;
        event.orderId = order.id;
        event.accountId = order.accountId;
        event.symbol = order.symbol;
        eventBus_->publish(event);

        return domain::OrderResult::ok(order, "Order cancelled");
    }

    /**
     * @brief Один проход Order Monitor
     *
     * Для каждого PENDING ордера кроме MARKET проверяет условие срабатывания.
     * При срабатывании выдерживает задержку исполнения, берёт свежую котировку
     * и исполняет (или отклоняет STOP_LIMIT, если лимит не выполнен).
     * Нет котировки - ордер ждёт следующего прохода.
     *
     * @return Количество ордеров, перешедших в конечный статус
     */
    size_t monitorPendingOrders() override {
        std::vector<domain::Order> pending;
        try {
            pending = store_->findPendingOrders();
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[OrderEngine] Cannot load pending orders: " << e.what() << std::endl;
            return 0;
        }

        std::unordered_map<std::string, std::optional<domain::Quote>> quoteCache;
        size_t finalized = 0;

        for (const auto& order : pending) {
            if (order.type == domain::OrderType::MARKET) continue;

            try {
                auto cached = quoteCache.find(order.symbol);
                if (cached == quoteCache.end()) {
                    cached = quoteCache.emplace(order.symbol, quotes_->getQuote(order.symbol)).first;
                }
                if (!cached->second || !isTriggered(order, cached->second->price)) {
                    continue;
                }

                latency_->wait(latency_->next());

                auto fresh = quotes_->getQuote(order.symbol);
                if (!fresh) {
                    std::cout << "[OrderEngine] " << order.id << " triggered, quote gone after delay; retry next cycle"
                              << std::endl;
                    continue;
                }

                if (executeTriggered(order.id, order.accountId, fresh->price)) {
                    ++finalized;
                }
            } catch (const domain::PersistenceException& e) {
                std::cerr << "[OrderEngine] Skipping order " << order.id << ": " << e.what() << std::endl;
            }
        }

        return finalized;
    }

    /**
     * @brief Выполнено ли условие срабатывания ордера при цене price
     *
     * LIMIT: buy price <= limit, sell price >= limit.
     * STOP и STOP_LIMIT: buy price >= stop, sell price <= stop.
     */
    static bool isTriggered(const domain::Order& order, double price) {
        bool buy = order.side == domain::OrderSide::BUY;
        switch (order.type) {
            case domain::OrderType::MARKET:
                return true;
            case domain::OrderType::LIMIT:
                if (!order.price) return false;
                return buy ? price <= *order.price : price >= *order.price;
            case domain::OrderType::STOP:
            case domain::OrderType::STOP_LIMIT:
                if (!order.stopPrice) return false;
                return buy ? price >= *order.stopPrice : price <= *order.stopPrice;
        }
        return false;
    }

    /**
     * @brief Выполнено ли лимитное условие STOP_LIMIT на свежей котировке
     */
    static bool isLimitSatisfied(const domain::Order& order, double price) {
        if (!order.price) return false;
        return order.side == domain::OrderSide::BUY ? price <= *order.price : price >= *order.price;
    }

private:
    std::shared_ptr<ports::output::ITradingStore> store_;
    std::shared_ptr<ports::output::IQuoteProvider> quotes_;
    std::shared_ptr<ports::output::IMarketClock> clock_;
    std::shared_ptr<ports::output::IExecutionLatency> latency_;
    std::shared_ptr<ports::output::IEventBus> eventBus_;
    std::shared_ptr<AccountLocks> locks_;

    std::optional<domain::OrderResult> validateRequest(const domain::OrderRequest& request) const {
        if (request.quantity < domain::rules::MIN_ORDER_SIZE || request.quantity > domain::rules::MAX_ORDER_SIZE) {
            return domain::OrderResult::fail(
                domain::ErrorKind::VALIDATION_ERROR,
                "Quantity must be between " + std::to_string(domain::rules::MIN_ORDER_SIZE) +
                    " and " + std::to_string(domain::rules::MAX_ORDER_SIZE));
        }
        if (request.symbol.empty()) {
            return domain::OrderResult::fail(domain::ErrorKind::VALIDATION_ERROR, "Symbol is required");
        }
        if (domain::requiresPrice(request.type)) {
            if (!request.price) {
                return domain::OrderResult::fail(domain::ErrorKind::VALIDATION_ERROR,
                                                 domain::toString(request.type) + " order requires price");
            }
            if (*request.price <= 0.0) {
                return domain::OrderResult::fail(domain::ErrorKind::VALIDATION_ERROR, "Price must be positive");
            }
        }
        if (domain::requiresStopPrice(request.type)) {
            if (!request.stopPrice) {
                return domain::OrderResult::fail(domain::ErrorKind::VALIDATION_ERROR,
                                                 domain::toString(request.type) + " order requires stopPrice");
            }
            if (*request.stopPrice <= 0.0) {
                return domain::OrderResult::fail(domain::ErrorKind::VALIDATION_ERROR, "Stop price must be positive");
            }
        }
        return std::nullopt;
    }

    /**
     * @brief Новый PENDING ордер; цены, не относящиеся к типу, отбрасываются
     */
    static domain::Order buildOrder(const domain::OrderRequest& request) {
        auto now = domain::Timestamp::now();

        domain::Order order;
        order.id = utils::IdGenerator::orderId();
        order.accountId = request.accountId;
        order.symbol = request.symbol;
        order.type = request.type;
        order.side = request.side;
        order.quantity = request.quantity;
        if (domain::requiresPrice(request.type)) {
            order.price = request.price;
        }
        if (domain::requiresStopPrice(request.type)) {
            order.stopPrice = request.stopPrice;
        }
        order.status = domain::OrderStatus::PENDING;
        order.notes = request.notes;
        order.createdAt = now;
        order.updatedAt = now;
        return order;
    }

    /**
     * @brief Исполнить сработавший ордер (под мьютексом счёта)
     * @return true если ордер перешёл в конечный статус
     */
    bool executeTriggered(const std::string& orderId, const std::string& accountId, double freshPrice) {
        std::unique_ptr<domain::DomainEvent> event;
        {
            auto guard = locks_->acquire(accountId);
            auto order = store_->findOrder(orderId);
            if (!order || !order->isPending()) {
                return false;
            }

            if (order->type == domain::OrderType::STOP_LIMIT && !isLimitSatisfied(*order, freshPrice)) {
                reject(*order, domain::ErrorKind::VALIDATION_ERROR,
                       "Stop triggered at " + utils::formatPrice(freshPrice) + " but limit price " +
                           utils::formatPrice(*order->price) + " not met",
                       event);
            } else {
                fill(*order, freshPrice, event);
            }
        }

        if (event) {
            eventBus_->publish(*event);
            return true;
        }
        return false;
    }

    /**
     * @brief Исполнить ордер по базовой цене (вызывается под мьютексом счёта)
     *
     * event заполняется только если ордер действительно сменил статус.
     */
    domain::OrderResult fill(const domain::Order& order, double basePrice,
                             std::unique_ptr<domain::DomainEvent>& event)
    {
        auto account = store_->findAccount(order.accountId);
        if (!account) {
            return reject(order, domain::ErrorKind::ACCOUNT_NOT_FOUND, "Account not found at execution", event);
        }

        double notional = basePrice * static_cast<double>(order.quantity);
        double slip = PricingModel::slippage(notional);
        double executionPrice = PricingModel::executionPrice(basePrice, order.side, slip);
        double commission = PricingModel::commission(order.quantity, executionPrice);
        double executedNotional = executionPrice * static_cast<double>(order.quantity);

        auto position = store_->findPosition(order.accountId, order.symbol);
        if (order.side == domain::OrderSide::SELL) {
            int64_t held = position ? position->quantity : 0;
            if (held < order.quantity) {
                return reject(order, domain::ErrorKind::INSUFFICIENT_SHARES,
                              "Insufficient shares at execution: holding " + std::to_string(held), event);
            }
        } else if (executedNotional + commission > account->availableCash) {
            return reject(order, domain::ErrorKind::INSUFFICIENT_FUNDS,
                          "Insufficient cash at execution: need " +
                              utils::formatPrice(executedNotional + commission), event);
        }

        auto now = domain::Timestamp::now();
        auto outcome = PositionLedger::applyFill(*account, position, order.symbol, order.side,
                                                 order.quantity, executionPrice, commission, now);

        domain::LedgerUpdate update;
        auto positions = store_->findPositions(order.accountId);
        positions.erase(std::remove_if(positions.begin(), positions.end(),
                                       [&order](const auto& p) { return p.symbol == order.symbol; }),
                        positions.end());
        if (outcome.position) {
            auto updated = *outcome.position;
            updated.reprice(basePrice);
            positions.push_back(updated);
            update.upserts.push_back(updated);
        } else {
            update.removedSymbols.push_back(order.symbol);
        }
        AccountAggregator::recompute(outcome.account, positions);
        update.account = outcome.account;

        domain::Order filled = order;
        filled.status = domain::OrderStatus::FILLED;
        filled.filledQuantity = order.quantity;
        filled.averagePrice = executionPrice;
        filled.commission = commission;
        filled.updatedAt = now;
        update.order = filled;

        domain::Transaction txn;
        txn.id = utils::IdGenerator::transactionId();
        txn.accountId = order.accountId;
        txn.orderId = order.id;
        txn.symbol = order.symbol;
        txn.type = order.side;
        txn.quantity = order.quantity;
        txn.price = executionPrice;
        txn.amount = order.side == domain::OrderSide::BUY
            ? -(executedNotional + commission)
            : executedNotional - commission;
        txn.commission = commission;
        txn.description = describeFill(order, executionPrice, basePrice, slip);
        txn.timestamp = now;
        update.transactions.push_back(txn);

        if (!store_->commit(update)) {
            return alreadyFinal(order);
        }

        std::cout << "[OrderEngine] Filled " << order.id << ": " << txn.description << std::endl;

        auto filledEvent = std::make_unique<domain::OrderFilledEvent>();
        filledEvent->order = filled;
        filledEvent->transaction = txn;
        filledEvent->basePrice = basePrice;
        filledEvent->slippage = slip;
        event = std::move(filledEvent);

        return domain::OrderResult::ok(filled, txn.description);
    }

    /**
     * @brief Отклонить ордер с пояснением (вызывается под мьютексом счёта)
     */
    domain::OrderResult reject(const domain::Order& order, domain::ErrorKind kind, const std::string& note,
                               std::unique_ptr<domain::DomainEvent>& event)
    {
        domain::Order rejected = order;
        rejected.status = domain::OrderStatus::REJECTED;
        rejected.notes = order.notes.empty() ? note : order.notes + "; " + note;
        rejected.updatedAt = domain::Timestamp::now();

        if (!store_->transitionOrder(rejected)) {
            return alreadyFinal(order);
        }

        std::cout << "[OrderEngine] Rejected " << order.id << ": " << note << std::endl;

        auto rejectedEvent = std::make_unique<domain::OrderRejectedEvent>();
        rejectedEvent->orderId = order.id;
        rejectedEvent->accountId = order.accountId;
        rejectedEvent->symbol = order.symbol;
        rejectedEvent->reason = note;
        event = std::move(rejectedEvent);

        domain::OrderResult result;
        result.error = kind;
        result.message = note;
        result.order = rejected;
        return result;
    }

    /**
     * @brief Ответ для ордера, который уже не PENDING (ничего не меняем)
     */
    domain::OrderResult alreadyFinal(const domain::Order& order) {
        auto current = store_->findOrder(order.id);
        auto snapshot = current ? *current : order;
        return domain::OrderResult::ok(snapshot, "Order already " + domain::toString(snapshot.status));
    }

    static std::string describeFill(const domain::Order& order, double executionPrice, double basePrice, double slip) {
        std::string body = domain::toString(order.side) + " " + std::to_string(order.quantity) +
                           " shares of " + order.symbol + " at " + utils::formatPrice(executionPrice);

        switch (order.type) {
            case domain::OrderType::MARKET:
                return body + " (slippage: " + utils::formatPercent(slip) + ")";
            case domain::OrderType::LIMIT:
            case domain::OrderType::STOP:
                return domain::descriptionLabel(order.type) + " " + body +
                       " (triggered at " + utils::formatPrice(basePrice) + ")";
            case domain::OrderType::STOP_LIMIT:
                return domain::descriptionLabel(order.type) + " " + body +
                       " (stop: " + utils::formatPrice(order.stopPrice.value_or(0.0)) +
                       ", limit: " + utils::formatPrice(order.price.value_or(0.0)) + ")";
        }
        return body;
    }
};

} // namespace paper::application
