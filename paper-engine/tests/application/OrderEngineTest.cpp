/**
 * @file OrderEngineTest.cpp
 * @brief Тесты движка ордеров
 *
 * Проверяет:
 * - Валидацию и отказы при выставлении
 * - Исполнение MARKET с проскальзыванием и комиссией
 * - Условия LIMIT / STOP / STOP_LIMIT в Order Monitor
 * - Правила отмены
 * - Отсутствие двойного исполнения
 */

#include <gtest/gtest.h>
#include "../mocks/EngineFixture.hpp"
#include <string>
#include <thread>
#include <vector>

using namespace paper;
using namespace paper::domain;
using namespace paper::tests;

class OrderEngineTest : public EngineFixture {};

// ================================================================
// VALIDATION
// ================================================================

TEST_F(OrderEngineTest, PlaceOrder_ZeroQuantity_ValidationError) {
    auto accountId = createAccount();

    auto result = orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 0));

    EXPECT_FALSE(result.isSuccess());
    EXPECT_EQ(result.error, ErrorKind::VALIDATION_ERROR);
}

TEST_F(OrderEngineTest, PlaceOrder_QuantityAboveMaximum_ValidationError) {
    auto accountId = createAccount();

    auto result = orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 1000001));

    EXPECT_EQ(result.error, ErrorKind::VALIDATION_ERROR);
}

TEST_F(OrderEngineTest, PlaceOrder_LimitWithoutPrice_ValidationError) {
    auto accountId = createAccount();
    auto req = market(accountId, OrderSide::BUY, 10);
    req.type = OrderType::LIMIT;

    auto result = orderEngine_->placeOrder(req);

    EXPECT_EQ(result.error, ErrorKind::VALIDATION_ERROR);
}

TEST_F(OrderEngineTest, PlaceOrder_StopLimitWithoutStopPrice_ValidationError) {
    auto accountId = createAccount();
    auto req = limit(accountId, OrderSide::BUY, 10, 95.0);
    req.type = OrderType::STOP_LIMIT;

    auto result = orderEngine_->placeOrder(req);

    EXPECT_EQ(result.error, ErrorKind::VALIDATION_ERROR);
}

TEST_F(OrderEngineTest, PlaceOrder_NegativeLimitPrice_ValidationError) {
    auto accountId = createAccount();

    auto result = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 10, -1.0));

    EXPECT_EQ(result.error, ErrorKind::VALIDATION_ERROR);
}

TEST_F(OrderEngineTest, PlaceOrder_NoQuote_QuoteUnavailable) {
    auto accountId = createAccount();
    quotes_->makeUnavailable(AAPL);

    auto result = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 10, 95.0));

    EXPECT_EQ(result.error, ErrorKind::QUOTE_UNAVAILABLE);
    EXPECT_TRUE(store_->findOrders(accountId).empty());
}

TEST_F(OrderEngineTest, PlaceOrder_UnknownAccount_AccountNotFound) {
    auto result = orderEngine_->placeOrder(market("acc-missing", OrderSide::BUY, 1));

    EXPECT_EQ(result.error, ErrorKind::ACCOUNT_NOT_FOUND);
}

TEST_F(OrderEngineTest, PlaceOrder_UnknownAccounts_DoNotAccumulateLocks) {
    auto accountId = createAccount();
    ASSERT_TRUE(orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 1, 90.0)).isSuccess());
    size_t before = locks_->size();

    for (int i = 0; i < 100; ++i) {
        auto result = orderEngine_->placeOrder(limit("acc-missing-" + std::to_string(i), OrderSide::BUY, 1, 90.0));
        EXPECT_EQ(result.error, ErrorKind::ACCOUNT_NOT_FOUND);
    }

    EXPECT_EQ(locks_->size(), before);
}

TEST_F(OrderEngineTest, PlaceOrder_MarketOutsideRegularHours_MarketClosed) {
    auto accountId = createAccount();
    clock_->setStatus(SessionStatus::PRE_MARKET);

    auto result = orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 10));

    EXPECT_EQ(result.error, ErrorKind::MARKET_CLOSED);
    EXPECT_NE(result.message.find("pre-market"), std::string::npos);
    EXPECT_TRUE(store_->findOrders(accountId).empty());
}

TEST_F(OrderEngineTest, PlaceOrder_LimitWhileClosed_AcceptedAsPending) {
    auto accountId = createAccount();
    clock_->setStatus(SessionStatus::CLOSED);

    auto result = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 10, 95.0));

    ASSERT_TRUE(result.isSuccess()) << result.message;
    EXPECT_EQ(result.order->status, OrderStatus::PENDING);
}

TEST_F(OrderEngineTest, PlaceOrder_BuyAboveCashBuffer_InsufficientFunds) {
    auto accountId = createAccount(1000.0);

    // 10 * $100 + $9.99 > $1000 * 0.95
    auto result = orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 10));

    EXPECT_EQ(result.error, ErrorKind::INSUFFICIENT_FUNDS);
    EXPECT_DOUBLE_EQ(account(accountId).availableCash, 1000.0);
}

TEST_F(OrderEngineTest, PlaceOrder_LimitUsesLimitPriceForFundsCheck) {
    auto accountId = createAccount(1000.0);
    quotes_->setPrice(AAPL, 200.0);

    // по котировке 5 * $200 не хватает, по лимиту 5 * $150 + $0.99 <= $950
    auto result = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 5, 150.0));

    EXPECT_TRUE(result.isSuccess()) << result.message;
}

TEST_F(OrderEngineTest, PlaceOrder_SellWithoutPosition_InsufficientShares) {
    auto accountId = createAccount();

    auto result = orderEngine_->placeOrder(market(accountId, OrderSide::SELL, 1));

    EXPECT_EQ(result.error, ErrorKind::INSUFFICIENT_SHARES);
}

TEST_F(OrderEngineTest, PlaceOrder_MarketIgnoresSuppliedPrices) {
    auto accountId = createAccount();
    auto req = market(accountId, OrderSide::BUY, 1);
    req.price = 1.0;
    req.stopPrice = 2.0;

    auto result = orderEngine_->placeOrder(req);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_FALSE(result.order->price.has_value());
    EXPECT_FALSE(result.order->stopPrice.has_value());
}

// ================================================================
// MARKET EXECUTION
// ================================================================

TEST_F(OrderEngineTest, MarketBuy_FillsWithAdverseSlippageAndCommission) {
    auto accountId = createAccount();

    auto result = orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 10));

    ASSERT_TRUE(result.isSuccess()) << result.message;
    EXPECT_EQ(result.order->status, OrderStatus::FILLED);
    EXPECT_EQ(result.order->filledQuantity, 10);
    EXPECT_NEAR(result.order->averagePrice, 100.1, 1e-9);
    EXPECT_DOUBLE_EQ(result.order->commission, 9.99);

    auto acc = account(accountId);
    EXPECT_NEAR(acc.availableCash, 100000.0 - 1001.0 - 9.99, 1e-6);
    // позиция переоценена по котировке без проскальзывания
    EXPECT_NEAR(acc.totalValue, acc.availableCash + 1000.0, 1e-6);
    EXPECT_NEAR(acc.totalPnL, acc.totalValue - 100000.0, 1e-6);

    auto position = store_->findPosition(accountId, AAPL);
    ASSERT_TRUE(position.has_value());
    EXPECT_EQ(position->quantity, 10);
    EXPECT_NEAR(position->averagePrice, 100.1, 1e-9);
    EXPECT_DOUBLE_EQ(position->currentPrice, 100.0);
}

TEST_F(OrderEngineTest, MarketBuy_WritesSignedTransaction) {
    auto accountId = createAccount();

    auto result = orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 10));
    ASSERT_TRUE(result.isSuccess());

    auto transactions = store_->findTransactions(accountId);
    ASSERT_EQ(transactions.size(), 1u);
    EXPECT_EQ(transactions[0].type, OrderSide::BUY);
    EXPECT_EQ(transactions[0].orderId, result.order->id);
    EXPECT_NEAR(transactions[0].amount, -(1001.0 + 9.99), 1e-6);
    EXPECT_EQ(transactions[0].description, "BUY 10 shares of AAPL at $100.10 (slippage: 0.10%)");
}

TEST_F(OrderEngineTest, MarketSell_SmallNotionalUsesSmallCommission) {
    auto accountId = createAccount();
    ASSERT_TRUE(orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 10)).isSuccess());
    double cashBefore = account(accountId).availableCash;

    auto result = orderEngine_->placeOrder(market(accountId, OrderSide::SELL, 10));

    ASSERT_TRUE(result.isSuccess()) << result.message;
    // 10 * $99.90 = $999 < $1000
    EXPECT_NEAR(result.order->averagePrice, 99.9, 1e-9);
    EXPECT_DOUBLE_EQ(result.order->commission, 0.99);
    EXPECT_NEAR(account(accountId).availableCash, cashBefore + 999.0 - 0.99, 1e-6);
    EXPECT_FALSE(store_->findPosition(accountId, AAPL).has_value());
}

TEST_F(OrderEngineTest, MarketBuy_LargeNotionalUsesHigherSlippage) {
    auto accountId = createAccount(1000000.0);

    // 200 * $100 = $20,000 -> 0.2%
    auto result = orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 200));

    ASSERT_TRUE(result.isSuccess());
    EXPECT_NEAR(result.order->averagePrice, 100.2, 1e-9);
}

TEST_F(OrderEngineTest, MarketBuy_QuoteGoneBeforeFill_Rejected) {
    auto accountId = createAccount();
    quotes_->scriptPrices(AAPL, {100.0, std::nullopt});

    auto result = orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 10));

    EXPECT_EQ(result.error, ErrorKind::QUOTE_UNAVAILABLE);
    ASSERT_TRUE(result.order.has_value());
    EXPECT_EQ(result.order->status, OrderStatus::REJECTED);
    EXPECT_DOUBLE_EQ(account(accountId).availableCash, 100000.0);
    EXPECT_TRUE(store_->findTransactions(accountId).empty());
}

TEST_F(OrderEngineTest, MarketBuy_PublishesPlacedThenFilled) {
    auto accountId = createAccount();

    ASSERT_TRUE(orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 10)).isSuccess());

    auto types = eventBus_->eventTypes();
    ASSERT_EQ(types.size(), 2u);
    EXPECT_EQ(types[0], "order.placed");
    EXPECT_EQ(types[1], "order.filled");
}

TEST_F(OrderEngineTest, FillMarketOrder_AlreadyFilled_NoSecondExecution) {
    auto accountId = createAccount();
    auto placed = orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 10));
    ASSERT_TRUE(placed.isSuccess());
    double cash = account(accountId).availableCash;

    auto again = orderEngine_->fillMarketOrder(placed.order->id);

    EXPECT_TRUE(again.isSuccess());
    EXPECT_EQ(again.message, "Order already FILLED");
    EXPECT_DOUBLE_EQ(account(accountId).availableCash, cash);
    EXPECT_EQ(store_->findTransactions(accountId).size(), 1u);
}

// ================================================================
// ORDER MONITOR
// ================================================================

TEST_F(OrderEngineTest, Monitor_LimitBuyNotTriggered_StaysPending) {
    auto accountId = createAccount();
    auto placed = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 10, 95.0));
    ASSERT_TRUE(placed.isSuccess());

    EXPECT_EQ(orderEngine_->monitorPendingOrders(), 0u);

    EXPECT_EQ(store_->findOrder(placed.order->id)->status, OrderStatus::PENDING);
    EXPECT_EQ(latency_->waitCount(), 0);
}

TEST_F(OrderEngineTest, Monitor_LimitBuyTriggered_FillsAtFreshQuote) {
    auto accountId = createAccount();
    quotes_->scriptPrices(AAPL, {100.0, 94.0});
    auto placed = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 10, 95.0));
    ASSERT_TRUE(placed.isSuccess());

    EXPECT_EQ(orderEngine_->monitorPendingOrders(), 1u);

    auto order = store_->findOrder(placed.order->id);
    EXPECT_EQ(order->status, OrderStatus::FILLED);
    EXPECT_NEAR(order->averagePrice, 94.0 * 1.001, 1e-9);
    EXPECT_EQ(latency_->waitCount(), 1);

    auto transactions = store_->findTransactions(accountId);
    ASSERT_EQ(transactions.size(), 1u);
    EXPECT_EQ(transactions[0].description, "LIMIT BUY 10 shares of AAPL at $94.09 (triggered at $94.00)");
}

TEST_F(OrderEngineTest, Monitor_LimitSellTriggeredAtOrAboveLimit) {
    auto accountId = createAccount();
    ASSERT_TRUE(orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 10)).isSuccess());
    auto placed = orderEngine_->placeOrder(limit(accountId, OrderSide::SELL, 10, 110.0));
    ASSERT_TRUE(placed.isSuccess());

    quotes_->setPrice(AAPL, 110.0);

    EXPECT_EQ(orderEngine_->monitorPendingOrders(), 1u);
    EXPECT_EQ(store_->findOrder(placed.order->id)->status, OrderStatus::FILLED);
    EXPECT_FALSE(store_->findPosition(accountId, AAPL).has_value());
}

TEST_F(OrderEngineTest, Monitor_StopSellTriggeredBelowStop) {
    auto accountId = createAccount();
    ASSERT_TRUE(orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 10)).isSuccess());
    auto placed = orderEngine_->placeOrder(stop(accountId, OrderSide::SELL, 10, 90.0));
    ASSERT_TRUE(placed.isSuccess());

    quotes_->setPrice(AAPL, 95.0);
    EXPECT_EQ(orderEngine_->monitorPendingOrders(), 0u);

    quotes_->setPrice(AAPL, 85.0);
    EXPECT_EQ(orderEngine_->monitorPendingOrders(), 1u);

    auto order = store_->findOrder(placed.order->id);
    EXPECT_EQ(order->status, OrderStatus::FILLED);
    EXPECT_NEAR(order->averagePrice, 85.0 * 0.999, 1e-9);
}

TEST_F(OrderEngineTest, Monitor_StopLimitBuyWithinLimit_Fills) {
    auto accountId = createAccount();
    quotes_->scriptPrices(AAPL, {45.0, 60.0, 47.0});
    auto placed = orderEngine_->placeOrder(stopLimit(accountId, OrderSide::BUY, 10, 50.0, 48.0));
    ASSERT_TRUE(placed.isSuccess());

    EXPECT_EQ(orderEngine_->monitorPendingOrders(), 1u);

    auto order = store_->findOrder(placed.order->id);
    EXPECT_EQ(order->status, OrderStatus::FILLED);
    EXPECT_NEAR(order->averagePrice, 47.0 * 1.001, 1e-9);

    auto transactions = store_->findTransactions(accountId);
    ASSERT_EQ(transactions.size(), 1u);
    EXPECT_EQ(transactions[0].description,
              "STOP-LIMIT BUY 10 shares of AAPL at $47.05 (stop: $50.00, limit: $48.00)");
}

TEST_F(OrderEngineTest, Monitor_StopLimitBuyAboveLimit_Rejected) {
    auto accountId = createAccount();
    quotes_->scriptPrices(AAPL, {45.0, 60.0, 52.0});
    auto placed = orderEngine_->placeOrder(stopLimit(accountId, OrderSide::BUY, 10, 50.0, 48.0));
    ASSERT_TRUE(placed.isSuccess());

    EXPECT_EQ(orderEngine_->monitorPendingOrders(), 1u);

    auto order = store_->findOrder(placed.order->id);
    EXPECT_EQ(order->status, OrderStatus::REJECTED);
    EXPECT_NE(order->notes.find("Stop triggered at $52.00 but limit price $48.00 not met"), std::string::npos);
    EXPECT_DOUBLE_EQ(account(accountId).availableCash, 100000.0);
    EXPECT_EQ(eventBus_->count("order.rejected"), 1u);
}

TEST_F(OrderEngineTest, Monitor_QuoteGoneAfterDelay_RetriesNextCycle) {
    auto accountId = createAccount();
    quotes_->scriptPrices(AAPL, {100.0, 94.0, std::nullopt, 94.0});
    auto placed = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 10, 95.0));
    ASSERT_TRUE(placed.isSuccess());

    EXPECT_EQ(orderEngine_->monitorPendingOrders(), 0u);
    EXPECT_EQ(store_->findOrder(placed.order->id)->status, OrderStatus::PENDING);

    EXPECT_EQ(orderEngine_->monitorPendingOrders(), 1u);
    EXPECT_EQ(store_->findOrder(placed.order->id)->status, OrderStatus::FILLED);
}

TEST_F(OrderEngineTest, Monitor_FetchesOneQuotePerSymbolPerCycle) {
    auto accountId = createAccount();
    ASSERT_TRUE(orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 1, 50.0)).isSuccess());
    ASSERT_TRUE(orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 2, 60.0)).isSuccess());
    ASSERT_TRUE(orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 3, 70.0)).isSuccess());
    quotes_->resetCallCount();

    orderEngine_->monitorPendingOrders();

    EXPECT_EQ(quotes_->callCount(AAPL), 1);
}

TEST_F(OrderEngineTest, Monitor_InsufficientCashAtFill_Rejected) {
    auto accountId = createAccount(1000.0);
    quotes_->scriptPrices(AAPL, {100.0, 90.0, 200.0});
    // на выставлении: 9 * $100 + $0.99 <= $950
    auto placed = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 9, 100.0));
    ASSERT_TRUE(placed.isSuccess()) << placed.message;

    orderEngine_->monitorPendingOrders();

    // свежая котировка $200 для LIMIT не перепроверяется, но кэша не хватает
    auto order = store_->findOrder(placed.order->id);
    EXPECT_EQ(order->status, OrderStatus::REJECTED);
    EXPECT_DOUBLE_EQ(account(accountId).availableCash, 1000.0);
}

TEST_F(OrderEngineTest, Monitor_ConcurrentCycles_FillExactlyOnce) {
    auto accountId = createAccount();
    auto placed = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 10, 100.0));
    ASSERT_TRUE(placed.isSuccess());

    std::vector<std::thread> threads;
    for (int i = 0; i < 4; ++i) {
        threads.emplace_back([this]() { orderEngine_->monitorPendingOrders(); });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(store_->findOrder(placed.order->id)->status, OrderStatus::FILLED);
    EXPECT_EQ(store_->findTransactions(accountId).size(), 1u);
    EXPECT_EQ(eventBus_->count("order.filled"), 1u);
}

TEST_F(OrderEngineTest, Monitor_CancelledOrderIsNotFilled) {
    auto accountId = createAccount();
    auto placed = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 10, 95.0));
    ASSERT_TRUE(placed.isSuccess());
    ASSERT_TRUE(orderEngine_->cancelOrder(placed.order->id).isSuccess());

    quotes_->setPrice(AAPL, 90.0);

    EXPECT_EQ(orderEngine_->monitorPendingOrders(), 0u);
    EXPECT_EQ(store_->findOrder(placed.order->id)->status, OrderStatus::CANCELLED);
    EXPECT_TRUE(store_->findTransactions(accountId).empty());
}

// ================================================================
// CANCEL
// ================================================================

TEST_F(OrderEngineTest, Cancel_PendingDuringRegularHours_Cancelled) {
    auto accountId = createAccount();
    auto placed = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 10, 95.0));
    ASSERT_TRUE(placed.isSuccess());

    auto result = orderEngine_->cancelOrder(placed.order->id);

    ASSERT_TRUE(result.isSuccess());
    EXPECT_EQ(result.order->status, OrderStatus::CANCELLED);
    EXPECT_EQ(eventBus_->count("order.cancelled"), 1u);
}

TEST_F(OrderEngineTest, Cancel_OutsideRegularHours_CannotCancel) {
    auto accountId = createAccount();
    auto placed = orderEngine_->placeOrder(limit(accountId, OrderSide::BUY, 10, 95.0));
    ASSERT_TRUE(placed.isSuccess());
    clock_->setStatus(SessionStatus::AFTER_HOURS);

    auto result = orderEngine_->cancelOrder(placed.order->id);

    EXPECT_EQ(result.error, ErrorKind::CANNOT_CANCEL);
    EXPECT_EQ(store_->findOrder(placed.order->id)->status, OrderStatus::PENDING);
}

TEST_F(OrderEngineTest, Cancel_FilledOrder_CannotCancel) {
    auto accountId = createAccount();
    auto placed = orderEngine_->placeOrder(market(accountId, OrderSide::BUY, 10));
    ASSERT_TRUE(placed.isSuccess());

    auto result = orderEngine_->cancelOrder(placed.order->id);

    EXPECT_EQ(result.error, ErrorKind::CANNOT_CANCEL);
}

TEST_F(OrderEngineTest, Cancel_UnknownOrder_OrderNotFound) {
    auto result = orderEngine_->cancelOrder("ord-missing");

    EXPECT_EQ(result.error, ErrorKind::ORDER_NOT_FOUND);
}

// ================================================================
// TRIGGER TABLE
// ================================================================

TEST(OrderTriggerTest, LimitAndStopConditions) {
    Order buyLimit;
    buyLimit.type = OrderType::LIMIT;
    buyLimit.side = OrderSide::BUY;
    buyLimit.price = 100.0;
    EXPECT_TRUE(application::OrderEngine::isTriggered(buyLimit, 100.0));
    EXPECT_FALSE(application::OrderEngine::isTriggered(buyLimit, 100.01));

    Order sellStop;
    sellStop.type = OrderType::STOP;
    sellStop.side = OrderSide::SELL;
    sellStop.stopPrice = 90.0;
    EXPECT_TRUE(application::OrderEngine::isTriggered(sellStop, 90.0));
    EXPECT_FALSE(application::OrderEngine::isTriggered(sellStop, 90.01));

    Order buyStopLimit;
    buyStopLimit.type = OrderType::STOP_LIMIT;
    buyStopLimit.side = OrderSide::BUY;
    buyStopLimit.stopPrice = 50.0;
    buyStopLimit.price = 48.0;
    EXPECT_FALSE(application::OrderEngine::isTriggered(buyStopLimit, 49.0));
    EXPECT_TRUE(application::OrderEngine::isTriggered(buyStopLimit, 50.0));
    EXPECT_TRUE(application::OrderEngine::isLimitSatisfied(buyStopLimit, 48.0));
    EXPECT_FALSE(application::OrderEngine::isLimitSatisfied(buyStopLimit, 48.5));
}
