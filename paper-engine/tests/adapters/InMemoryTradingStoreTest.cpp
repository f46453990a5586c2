#include <gtest/gtest.h>
#include "adapters/secondary/persistence/InMemoryTradingStore.hpp"

using namespace paper::adapters::secondary;
using namespace paper::domain;

class InMemoryTradingStoreTest : public ::testing::Test {
protected:
    InMemoryTradingStore store_;

    Account makeAccount(const std::string& id, const std::string& owner = "user-1") {
        Account a;
        a.id = id;
        a.ownerId = owner;
        a.name = id;
        a.initialBalance = 10000.0;
        a.availableCash = 10000.0;
        a.totalValue = 10000.0;
        return a;
    }

    Order makeOrder(const std::string& id, const std::string& accountId) {
        Order o;
        o.id = id;
        o.accountId = accountId;
        o.symbol = "AAPL";
        o.type = OrderType::LIMIT;
        o.quantity = 1;
        o.price = 90.0;
        return o;
    }
};

// ================================================================
// ACCOUNTS
// ================================================================

TEST_F(InMemoryTradingStoreTest, CreateAndFindAccount) {
    store_.createAccount(makeAccount("acc-1"));

    auto found = store_.findAccount("acc-1");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->ownerId, "user-1");
    EXPECT_FALSE(store_.findAccount("acc-2").has_value());
}

TEST_F(InMemoryTradingStoreTest, DuplicateAccount_Throws) {
    store_.createAccount(makeAccount("acc-1"));

    EXPECT_THROW(store_.createAccount(makeAccount("acc-1")), PersistenceException);
}

TEST_F(InMemoryTradingStoreTest, DeleteAccount_Cascades) {
    store_.createAccount(makeAccount("acc-1"));
    store_.saveOrder(makeOrder("ord-1", "acc-1"));

    LedgerUpdate update;
    update.account = makeAccount("acc-1");
    Position p;
    p.accountId = "acc-1";
    p.symbol = "AAPL";
    p.quantity = 1;
    update.upserts.push_back(p);
    Transaction t;
    t.accountId = "acc-1";
    update.transactions.push_back(t);
    ASSERT_TRUE(store_.commit(update));

    EXPECT_TRUE(store_.deleteAccount("acc-1"));

    EXPECT_FALSE(store_.findOrder("ord-1").has_value());
    EXPECT_TRUE(store_.findPositions("acc-1").empty());
    EXPECT_TRUE(store_.findTransactions("acc-1").empty());
    EXPECT_FALSE(store_.deleteAccount("acc-1"));
}

// ================================================================
// ORDERS
// ================================================================

TEST_F(InMemoryTradingStoreTest, SaveOrder_UnknownAccount_Throws) {
    EXPECT_THROW(store_.saveOrder(makeOrder("ord-1", "acc-missing")), PersistenceException);
}

TEST_F(InMemoryTradingStoreTest, Orders_SortedByInsertion) {
    store_.createAccount(makeAccount("acc-1"));
    store_.saveOrder(makeOrder("ord-a", "acc-1"));
    store_.saveOrder(makeOrder("ord-b", "acc-1"));
    store_.saveOrder(makeOrder("ord-c", "acc-1"));

    auto newestFirst = store_.findOrders("acc-1");
    ASSERT_EQ(newestFirst.size(), 3u);
    EXPECT_EQ(newestFirst[0].id, "ord-c");

    auto pending = store_.findPendingOrders();
    ASSERT_EQ(pending.size(), 3u);
    EXPECT_EQ(pending[0].id, "ord-a");
}

TEST_F(InMemoryTradingStoreTest, TransitionOrder_OnlyFromPending) {
    store_.createAccount(makeAccount("acc-1"));
    auto order = makeOrder("ord-1", "acc-1");
    store_.saveOrder(order);

    order.status = OrderStatus::CANCELLED;
    EXPECT_TRUE(store_.transitionOrder(order));

    order.status = OrderStatus::REJECTED;
    EXPECT_FALSE(store_.transitionOrder(order));
    EXPECT_EQ(store_.findOrder("ord-1")->status, OrderStatus::CANCELLED);
    EXPECT_TRUE(store_.findPendingOrders().empty());
}

// ================================================================
// COMMIT
// ================================================================

TEST_F(InMemoryTradingStoreTest, Commit_NonPendingOrder_WritesNothing) {
    store_.createAccount(makeAccount("acc-1"));
    auto order = makeOrder("ord-1", "acc-1");
    store_.saveOrder(order);
    order.status = OrderStatus::CANCELLED;
    ASSERT_TRUE(store_.transitionOrder(order));

    LedgerUpdate update;
    update.account = makeAccount("acc-1");
    update.account.availableCash = 1.0;
    order.status = OrderStatus::FILLED;
    update.order = order;
    Transaction t;
    t.accountId = "acc-1";
    update.transactions.push_back(t);

    EXPECT_FALSE(store_.commit(update));
    EXPECT_DOUBLE_EQ(store_.findAccount("acc-1")->availableCash, 10000.0);
    EXPECT_TRUE(store_.findTransactions("acc-1").empty());
}

TEST_F(InMemoryTradingStoreTest, Commit_RemovesAndUpsertsPositions) {
    store_.createAccount(makeAccount("acc-1"));
    Position aapl;
    aapl.accountId = "acc-1";
    aapl.symbol = "AAPL";
    aapl.quantity = 5;
    LedgerUpdate first;
    first.account = makeAccount("acc-1");
    first.upserts.push_back(aapl);
    ASSERT_TRUE(store_.commit(first));

    Position msft = aapl;
    msft.symbol = "MSFT";
    LedgerUpdate second;
    second.account = makeAccount("acc-1");
    second.removedSymbols.push_back("AAPL");
    second.upserts.push_back(msft);
    ASSERT_TRUE(store_.commit(second));

    auto positions = store_.findPositions("acc-1");
    ASSERT_EQ(positions.size(), 1u);
    EXPECT_EQ(positions[0].symbol, "MSFT");
}

TEST_F(InMemoryTradingStoreTest, Commit_UnknownAccount_Throws) {
    LedgerUpdate update;
    update.account = makeAccount("acc-missing");

    EXPECT_THROW(store_.commit(update), PersistenceException);
}

TEST_F(InMemoryTradingStoreTest, UpdatePosition_MissingPosition_False) {
    store_.createAccount(makeAccount("acc-1"));
    Position p;
    p.accountId = "acc-1";
    p.symbol = "AAPL";

    EXPECT_FALSE(store_.updatePosition(p));
}
