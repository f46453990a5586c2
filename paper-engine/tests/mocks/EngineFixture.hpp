#pragma once

#include <gtest/gtest.h>
#include "application/AccountLocks.hpp"
#include "application/AccountService.hpp"
#include "application/OrderEngine.hpp"
#include "application/RiskService.hpp"
#include "adapters/secondary/persistence/InMemoryTradingStore.hpp"
#include "FixedMarketClock.hpp"
#include "MockQuoteProvider.hpp"
#include "NoLatency.hpp"
#include "RecordingEventBus.hpp"

namespace paper::tests {

/**
 * @brief Общая сборка движка на in-memory хранилище и моках
 */
class EngineFixture : public ::testing::Test {
protected:
    const std::string AAPL = "AAPL";
    const std::string MSFT = "MSFT";
    const std::string OWNER = "user-1";

    void SetUp() override {
        store_ = std::make_shared<adapters::secondary::InMemoryTradingStore>();
        quotes_ = std::make_shared<MockQuoteProvider>();
        clock_ = std::make_shared<FixedMarketClock>(domain::SessionStatus::OPEN);
        latency_ = std::make_shared<NoLatency>();
        eventBus_ = std::make_shared<RecordingEventBus>();
        locks_ = std::make_shared<application::AccountLocks>();

        orderEngine_ = std::make_shared<application::OrderEngine>(
            store_, quotes_, clock_, latency_, eventBus_, locks_);
        riskService_ = std::make_shared<application::RiskService>(store_, quotes_, eventBus_, locks_);
        accountService_ = std::make_shared<application::AccountService>(store_, locks_);

        quotes_->setPrice(AAPL, 100.0);
        quotes_->setPrice(MSFT, 400.0);
    }

    std::string createAccount(double balance = 100000.0) {
        auto result = accountService_->createAccount(OWNER, "Test", balance);
        EXPECT_TRUE(result.isSuccess()) << result.message;
        return result.snapshot->account.id;
    }

    domain::OrderRequest market(const std::string& accountId, domain::OrderSide side,
                                int64_t qty, const std::string& symbol = "AAPL") {
        domain::OrderRequest req;
        req.accountId = accountId;
        req.symbol = symbol;
        req.type = domain::OrderType::MARKET;
        req.side = side;
        req.quantity = qty;
        return req;
    }

    domain::OrderRequest limit(const std::string& accountId, domain::OrderSide side,
                               int64_t qty, double price, const std::string& symbol = "AAPL") {
        auto req = market(accountId, side, qty, symbol);
        req.type = domain::OrderType::LIMIT;
        req.price = price;
        return req;
    }

    domain::OrderRequest stop(const std::string& accountId, domain::OrderSide side,
                              int64_t qty, double stopPrice, const std::string& symbol = "AAPL") {
        auto req = market(accountId, side, qty, symbol);
        req.type = domain::OrderType::STOP;
        req.stopPrice = stopPrice;
        return req;
    }

    domain::OrderRequest stopLimit(const std::string& accountId, domain::OrderSide side,
                                   int64_t qty, double stopPrice, double limitPrice,
                                   const std::string& symbol = "AAPL") {
        auto req = market(accountId, side, qty, symbol);
        req.type = domain::OrderType::STOP_LIMIT;
        req.stopPrice = stopPrice;
        req.price = limitPrice;
        return req;
    }

    domain::Account account(const std::string& accountId) {
        auto found = store_->findAccount(accountId);
        EXPECT_TRUE(found.has_value());
        return found.value_or(domain::Account{});
    }

    std::shared_ptr<adapters::secondary::InMemoryTradingStore> store_;
    std::shared_ptr<MockQuoteProvider> quotes_;
    std::shared_ptr<FixedMarketClock> clock_;
    std::shared_ptr<NoLatency> latency_;
    std::shared_ptr<RecordingEventBus> eventBus_;
    std::shared_ptr<application::AccountLocks> locks_;

    std::shared_ptr<application::OrderEngine> orderEngine_;
    std::shared_ptr<application::RiskService> riskService_;
    std::shared_ptr<application::AccountService> accountService_;
};

} // namespace paper::tests
