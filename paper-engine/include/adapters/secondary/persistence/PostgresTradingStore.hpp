#pragma once

#include "ports/output/ITradingStore.hpp"
#include <pqxx/pqxx>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

namespace paper::adapters::secondary {

/**
 * @brief PostgreSQL реализация хранилища движка
 *
 * Одно соединение, доступ сериализован мьютексом.
 * Каждый commit() - одна транзакция pqxx::work: ордер переводится
 * условным UPDATE ... WHERE status = 'PENDING', и если строка не
 * обновилась, транзакция откатывается целиком.
 *
 * Ошибки libpqxx логируются и пробрасываются как PersistenceException.
 */
class PostgresTradingStore : public ports::output::ITradingStore {
public:
    explicit PostgresTradingStore(const std::string& connectionString) {
        std::cout << "[PostgresTradingStore] Connecting to PostgreSQL..." << std::endl;
        try {
            connection_ = std::make_unique<pqxx::connection>(connectionString);
            std::cout << "[PostgresTradingStore] Connected successfully" << std::endl;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTradingStore] Connection failed: " << e.what() << std::endl;
            throw domain::PersistenceException(std::string("Connection failed: ") + e.what());
        }
        initSchema();
    }

    ~PostgresTradingStore() override = default;

    // ---- Accounts ----

    void createAccount(const domain::Account& account) override {
        execute("createAccount", [&](pqxx::work& txn) {
            txn.exec_params(
                R"(
                    INSERT INTO paper_accounts (
                        id, owner_id, name, initial_balance, available_cash,
                        total_value, total_pnl, total_pnl_percent, is_active,
                        created_at, updated_at
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)
                )",
                account.id,
                account.ownerId,
                account.name,
                account.initialBalance,
                account.availableCash,
                account.totalValue,
                account.totalPnL,
                account.totalPnLPercent,
                account.active,
                account.createdAt.toUnixMillis(),
                account.updatedAt.toUnixMillis()
            );
            txn.commit();
            return true;
        });
    }

    std::optional<domain::Account> findAccount(const std::string& accountId) override {
        return execute("findAccount", [&](pqxx::work& txn) -> std::optional<domain::Account> {
            auto result = txn.exec_params(
                std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM paper_accounts WHERE id = $1",
                accountId
            );
            txn.commit();
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToAccount(result[0]);
        });
    }

    std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) override {
        return execute("findAccountsByOwner", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM paper_accounts "
                "WHERE owner_id = $1 ORDER BY created_at DESC",
                ownerId
            );
            txn.commit();

            std::vector<domain::Account> accounts;
            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }
            return accounts;
        });
    }

    std::vector<domain::Account> findAllAccounts() override {
        return execute("findAllAccounts", [&](pqxx::work& txn) {
            auto result = txn.exec(std::string("SELECT ") + ACCOUNT_COLUMNS + " FROM paper_accounts ORDER BY created_at");
            txn.commit();

            std::vector<domain::Account> accounts;
            for (const auto& row : result) {
                accounts.push_back(rowToAccount(row));
            }
            return accounts;
        });
    }

    bool deleteAccount(const std::string& accountId) override {
        return execute("deleteAccount", [&](pqxx::work& txn) {
            // позиции, ордера и транзакции удаляются ON DELETE CASCADE
            auto result = txn.exec_params("DELETE FROM paper_accounts WHERE id = $1", accountId);
            txn.commit();
            return result.affected_rows() > 0;
        });
    }

    // ---- Positions ----

    std::vector<domain::Position> findPositions(const std::string& accountId) override {
        return execute("findPositions", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                std::string("SELECT ") + POSITION_COLUMNS + " FROM paper_positions "
                "WHERE account_id = $1 ORDER BY symbol",
                accountId
            );
            txn.commit();

            std::vector<domain::Position> positions;
            for (const auto& row : result) {
                positions.push_back(rowToPosition(row));
            }
            return positions;
        });
    }

    std::optional<domain::Position> findPosition(
        const std::string& accountId, const std::string& symbol) override
    {
        return execute("findPosition", [&](pqxx::work& txn) -> std::optional<domain::Position> {
            auto result = txn.exec_params(
                std::string("SELECT ") + POSITION_COLUMNS + " FROM paper_positions "
                "WHERE account_id = $1 AND symbol = $2",
                accountId,
                symbol
            );
            txn.commit();
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToPosition(result[0]);
        });
    }

    bool updatePosition(const domain::Position& position) override {
        return execute("updatePosition", [&](pqxx::work& txn) {
            auto result = upsertPosition(txn, position, false);
            txn.commit();
            return result;
        });
    }

    // ---- Orders ----

    void saveOrder(const domain::Order& order) override {
        execute("saveOrder", [&](pqxx::work& txn) {
            txn.exec_params(
                R"(
                    INSERT INTO paper_orders (
                        id, account_id, symbol, order_type, side, quantity,
                        price, stop_price, status, filled_quantity, average_price,
                        commission, notes, created_at, updated_at
                    )
                    VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14, $15)
                )",
                order.id,
                order.accountId,
                order.symbol,
                domain::toString(order.type),
                domain::toString(order.side),
                order.quantity,
                order.price,
                order.stopPrice,
                domain::toString(order.status),
                order.filledQuantity,
                order.averagePrice,
                order.commission,
                order.notes,
                order.createdAt.toUnixMillis(),
                order.updatedAt.toUnixMillis()
            );
            txn.commit();
            return true;
        });
    }

    std::optional<domain::Order> findOrder(const std::string& orderId) override {
        return execute("findOrder", [&](pqxx::work& txn) -> std::optional<domain::Order> {
            auto result = txn.exec_params(
                std::string("SELECT ") + ORDER_COLUMNS + " FROM paper_orders WHERE id = $1",
                orderId
            );
            txn.commit();
            if (result.empty()) {
                return std::nullopt;
            }
            return rowToOrder(result[0]);
        });
    }

    std::vector<domain::Order> findOrders(const std::string& accountId) override {
        return execute("findOrders", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                std::string("SELECT ") + ORDER_COLUMNS + " FROM paper_orders "
                "WHERE account_id = $1 ORDER BY seq DESC",
                accountId
            );
            txn.commit();

            std::vector<domain::Order> orders;
            for (const auto& row : result) {
                orders.push_back(rowToOrder(row));
            }
            return orders;
        });
    }

    std::vector<domain::Order> findPendingOrders() override {
        return execute("findPendingOrders", [&](pqxx::work& txn) {
            auto result = txn.exec(
                std::string("SELECT ") + ORDER_COLUMNS + " FROM paper_orders "
                "WHERE status = 'PENDING' ORDER BY seq ASC"
            );
            txn.commit();

            std::vector<domain::Order> orders;
            for (const auto& row : result) {
                orders.push_back(rowToOrder(row));
            }
            return orders;
        });
    }

    bool transitionOrder(const domain::Order& order) override {
        return execute("transitionOrder", [&](pqxx::work& txn) {
            bool updated = updatePendingOrder(txn, order);
            txn.commit();
            return updated;
        });
    }

    // ---- Transactions ----

    std::vector<domain::Transaction> findTransactions(const std::string& accountId) override {
        return execute("findTransactions", [&](pqxx::work& txn) {
            auto result = txn.exec_params(
                R"(
                    SELECT id, account_id, order_id, symbol, type, quantity, price,
                           amount, commission, description, ts
                    FROM paper_transactions
                    WHERE account_id = $1
                    ORDER BY seq DESC
                )",
                accountId
            );
            txn.commit();

            std::vector<domain::Transaction> transactions;
            for (const auto& row : result) {
                transactions.push_back(rowToTransaction(row));
            }
            return transactions;
        });
    }

    // ---- Atomic commit ----

    bool commit(const domain::LedgerUpdate& update) override {
        return execute("commit", [&](pqxx::work& txn) {
            if (update.order && !updatePendingOrder(txn, *update.order)) {
                txn.abort();
                return false;
            }

            auto accountResult = txn.exec_params(
                R"(
                    UPDATE paper_accounts SET
                        available_cash = $2,
                        total_value = $3,
                        total_pnl = $4,
                        total_pnl_percent = $5,
                        is_active = $6,
                        updated_at = $7
                    WHERE id = $1
                )",
                update.account.id,
                update.account.availableCash,
                update.account.totalValue,
                update.account.totalPnL,
                update.account.totalPnLPercent,
                update.account.active,
                update.account.updatedAt.toUnixMillis()
            );
            if (accountResult.affected_rows() == 0) {
                throw domain::PersistenceException("Commit for unknown account: " + update.account.id);
            }

            for (const auto& symbol : update.removedSymbols) {
                txn.exec_params(
                    "DELETE FROM paper_positions WHERE account_id = $1 AND symbol = $2",
                    update.account.id,
                    symbol
                );
            }
            for (const auto& position : update.upserts) {
                upsertPosition(txn, position, true);
            }
            for (const auto& transaction : update.transactions) {
                insertTransaction(txn, transaction);
            }

            txn.commit();
            return true;
        });
    }

private:
    std::unique_ptr<pqxx::connection> connection_;
    std::mutex mutex_;

    static constexpr const char* ACCOUNT_COLUMNS =
        "id, owner_id, name, initial_balance, available_cash, total_value, "
        "total_pnl, total_pnl_percent, is_active, created_at, updated_at";

    static constexpr const char* POSITION_COLUMNS =
        "account_id, symbol, quantity, average_price, current_price, market_value, "
        "unrealized_pnl, unrealized_pnl_percent, entry_date, updated_at, "
        "stop_loss, take_profit, trailing_stop_percent, peak_price";

    static constexpr const char* ORDER_COLUMNS =
        "id, account_id, symbol, order_type, side, quantity, price, stop_price, status, "
        "filled_quantity, average_price, commission, notes, created_at, updated_at";

    /**
     * @brief Выполнить тело под мьютексом соединения
     *
     * Тело само вызывает txn.commit() или txn.abort().
     */
    template <typename Body>
    auto execute(const char* operation, Body&& body) -> decltype(body(std::declval<pqxx::work&>())) {
        std::lock_guard<std::mutex> lock(mutex_);
        try {
            pqxx::work txn(*connection_);
            return body(txn);
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[PostgresTradingStore] " << operation << "() failed: " << e.what() << std::endl;
            throw;
        } catch (const std::exception& e) {
            std::cerr << "[PostgresTradingStore] " << operation << "() failed: " << e.what() << std::endl;
            throw domain::PersistenceException(std::string(operation) + " failed: " + e.what());
        }
    }

    void initSchema() {
        execute("initSchema", [](pqxx::work& txn) {
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS paper_accounts (
                    id                TEXT PRIMARY KEY,
                    owner_id          TEXT NOT NULL,
                    name              TEXT NOT NULL,
                    initial_balance   DOUBLE PRECISION NOT NULL,
                    available_cash    DOUBLE PRECISION NOT NULL,
                    total_value       DOUBLE PRECISION NOT NULL,
                    total_pnl         DOUBLE PRECISION NOT NULL DEFAULT 0,
                    total_pnl_percent DOUBLE PRECISION NOT NULL DEFAULT 0,
                    is_active         BOOLEAN NOT NULL DEFAULT TRUE,
                    created_at        BIGINT NOT NULL,
                    updated_at        BIGINT NOT NULL
                )
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS paper_positions (
                    account_id             TEXT NOT NULL REFERENCES paper_accounts(id) ON DELETE CASCADE,
                    symbol                 TEXT NOT NULL,
                    quantity               BIGINT NOT NULL CHECK (quantity > 0),
                    average_price          DOUBLE PRECISION NOT NULL,
                    current_price          DOUBLE PRECISION NOT NULL,
                    market_value           DOUBLE PRECISION NOT NULL,
                    unrealized_pnl         DOUBLE PRECISION NOT NULL,
                    unrealized_pnl_percent DOUBLE PRECISION NOT NULL,
                    entry_date             BIGINT NOT NULL,
                    updated_at             BIGINT NOT NULL,
                    stop_loss              DOUBLE PRECISION,
                    take_profit            DOUBLE PRECISION,
                    trailing_stop_percent  DOUBLE PRECISION,
                    peak_price             DOUBLE PRECISION,
                    PRIMARY KEY (account_id, symbol)
                )
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS paper_orders (
                    seq             BIGSERIAL,
                    id              TEXT PRIMARY KEY,
                    account_id      TEXT NOT NULL REFERENCES paper_accounts(id) ON DELETE CASCADE,
                    symbol          TEXT NOT NULL,
                    order_type      TEXT NOT NULL,
                    side            TEXT NOT NULL,
                    quantity        BIGINT NOT NULL,
                    price           DOUBLE PRECISION,
                    stop_price      DOUBLE PRECISION,
                    status          TEXT NOT NULL,
                    filled_quantity BIGINT NOT NULL DEFAULT 0,
                    average_price   DOUBLE PRECISION NOT NULL DEFAULT 0,
                    commission      DOUBLE PRECISION NOT NULL DEFAULT 0,
                    notes           TEXT NOT NULL DEFAULT '',
                    created_at      BIGINT NOT NULL,
                    updated_at      BIGINT NOT NULL
                )
            )");
            txn.exec(R"(
                CREATE TABLE IF NOT EXISTS paper_transactions (
                    seq         BIGSERIAL,
                    id          TEXT PRIMARY KEY,
                    account_id  TEXT NOT NULL REFERENCES paper_accounts(id) ON DELETE CASCADE,
                    order_id    TEXT,
                    symbol      TEXT NOT NULL,
                    type        TEXT NOT NULL,
                    quantity    BIGINT NOT NULL,
                    price       DOUBLE PRECISION NOT NULL,
                    amount      DOUBLE PRECISION NOT NULL,
                    commission  DOUBLE PRECISION NOT NULL,
                    description TEXT NOT NULL,
                    ts          BIGINT NOT NULL
                )
            )");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_paper_accounts_owner ON paper_accounts(owner_id)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_paper_orders_status ON paper_orders(status)");
            txn.exec("CREATE INDEX IF NOT EXISTS idx_paper_transactions_account ON paper_transactions(account_id)");
            txn.commit();
            return true;
        });
        std::cout << "[PostgresTradingStore] Schema ready" << std::endl;
    }

    bool updatePendingOrder(pqxx::work& txn, const domain::Order& order) {
        auto result = txn.exec_params(
            R"(
                UPDATE paper_orders SET
                    status = $2,
                    filled_quantity = $3,
                    average_price = $4,
                    commission = $5,
                    notes = $6,
                    updated_at = $7
                WHERE id = $1 AND status = 'PENDING'
            )",
            order.id,
            domain::toString(order.status),
            order.filledQuantity,
            order.averagePrice,
            order.commission,
            order.notes,
            order.updatedAt.toUnixMillis()
        );
        return result.affected_rows() > 0;
    }

    /**
     * @param insertIfMissing false - только обновление существующей строки
     */
    bool upsertPosition(pqxx::work& txn, const domain::Position& position, bool insertIfMissing) {
        std::optional<double> stopLoss;
        std::optional<double> takeProfit;
        std::optional<double> trailing;
        std::optional<double> peak;
        if (position.risk) {
            stopLoss = position.risk->stopLoss;
            takeProfit = position.risk->takeProfit;
            trailing = position.risk->trailingStopPercent;
            peak = position.risk->peakPriceSinceEntry;
        }

        const char* sql = insertIfMissing
            ? R"(
                INSERT INTO paper_positions (
                    account_id, symbol, quantity, average_price, current_price, market_value,
                    unrealized_pnl, unrealized_pnl_percent, entry_date, updated_at,
                    stop_loss, take_profit, trailing_stop_percent, peak_price
                )
                VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11, $12, $13, $14)
                ON CONFLICT (account_id, symbol) DO UPDATE SET
                    quantity = EXCLUDED.quantity,
                    average_price = EXCLUDED.average_price,
                    current_price = EXCLUDED.current_price,
                    market_value = EXCLUDED.market_value,
                    unrealized_pnl = EXCLUDED.unrealized_pnl,
                    unrealized_pnl_percent = EXCLUDED.unrealized_pnl_percent,
                    updated_at = EXCLUDED.updated_at,
                    stop_loss = EXCLUDED.stop_loss,
                    take_profit = EXCLUDED.take_profit,
                    trailing_stop_percent = EXCLUDED.trailing_stop_percent,
                    peak_price = EXCLUDED.peak_price
            )"
            : R"(
                UPDATE paper_positions SET
                    quantity = $3,
                    average_price = $4,
                    current_price = $5,
                    market_value = $6,
                    unrealized_pnl = $7,
                    unrealized_pnl_percent = $8,
                    entry_date = $9,
                    updated_at = $10,
                    stop_loss = $11,
                    take_profit = $12,
                    trailing_stop_percent = $13,
                    peak_price = $14
                WHERE account_id = $1 AND symbol = $2
            )";

        auto result = txn.exec_params(
            sql,
            position.accountId,
            position.symbol,
            position.quantity,
            position.averagePrice,
            position.currentPrice,
            position.marketValue,
            position.unrealizedPnL,
            position.unrealizedPnLPercent,
            position.entryDate.toUnixMillis(),
            position.updatedAt.toUnixMillis(),
            stopLoss,
            takeProfit,
            trailing,
            peak
        );
        return result.affected_rows() > 0;
    }

    void insertTransaction(pqxx::work& txn, const domain::Transaction& transaction) {
        txn.exec_params(
            R"(
                INSERT INTO paper_transactions (
                    id, account_id, order_id, symbol, type, quantity, price,
                    amount, commission, description, ts
                )
                VALUES ($1, $2, $3, $4, $5, $6, $7, $8, $9, $10, $11)
            )",
            transaction.id,
            transaction.accountId,
            transaction.orderId,
            transaction.symbol,
            domain::toString(transaction.type),
            transaction.quantity,
            transaction.price,
            transaction.amount,
            transaction.commission,
            transaction.description,
            transaction.timestamp.toUnixMillis()
        );
    }

    static std::optional<double> optionalDouble(const pqxx::field& field) {
        if (field.is_null()) return std::nullopt;
        return field.as<double>();
    }

    static domain::Account rowToAccount(const pqxx::row& row) {
        domain::Account account;
        account.id = row["id"].as<std::string>();
        account.ownerId = row["owner_id"].as<std::string>();
        account.name = row["name"].as<std::string>();
        account.initialBalance = row["initial_balance"].as<double>();
        account.availableCash = row["available_cash"].as<double>();
        account.totalValue = row["total_value"].as<double>();
        account.totalPnL = row["total_pnl"].as<double>();
        account.totalPnLPercent = row["total_pnl_percent"].as<double>();
        account.active = row["is_active"].as<bool>();
        account.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
        account.updatedAt = domain::Timestamp::fromUnixMillis(row["updated_at"].as<int64_t>());
        return account;
    }

    static domain::Position rowToPosition(const pqxx::row& row) {
        domain::Position position;
        position.accountId = row["account_id"].as<std::string>();
        position.symbol = row["symbol"].as<std::string>();
        position.quantity = row["quantity"].as<int64_t>();
        position.averagePrice = row["average_price"].as<double>();
        position.currentPrice = row["current_price"].as<double>();
        position.marketValue = row["market_value"].as<double>();
        position.unrealizedPnL = row["unrealized_pnl"].as<double>();
        position.unrealizedPnLPercent = row["unrealized_pnl_percent"].as<double>();
        position.entryDate = domain::Timestamp::fromUnixMillis(row["entry_date"].as<int64_t>());
        position.updatedAt = domain::Timestamp::fromUnixMillis(row["updated_at"].as<int64_t>());

        domain::RiskParams risk;
        risk.stopLoss = optionalDouble(row["stop_loss"]);
        risk.takeProfit = optionalDouble(row["take_profit"]);
        risk.trailingStopPercent = optionalDouble(row["trailing_stop_percent"]);
        risk.peakPriceSinceEntry = optionalDouble(row["peak_price"]).value_or(0.0);
        if (risk.hasAnyRule()) {
            position.risk = risk;
        }
        return position;
    }

    static domain::Order rowToOrder(const pqxx::row& row) {
        domain::Order order;
        order.id = row["id"].as<std::string>();
        order.accountId = row["account_id"].as<std::string>();
        order.symbol = row["symbol"].as<std::string>();
        order.type = domain::orderTypeFromString(row["order_type"].as<std::string>());
        order.side = domain::orderSideFromString(row["side"].as<std::string>());
        order.quantity = row["quantity"].as<int64_t>();
        order.price = optionalDouble(row["price"]);
        order.stopPrice = optionalDouble(row["stop_price"]);
        order.status = domain::orderStatusFromString(row["status"].as<std::string>());
        order.filledQuantity = row["filled_quantity"].as<int64_t>();
        order.averagePrice = row["average_price"].as<double>();
        order.commission = row["commission"].as<double>();
        order.notes = row["notes"].as<std::string>();
        order.createdAt = domain::Timestamp::fromUnixMillis(row["created_at"].as<int64_t>());
        order.updatedAt = domain::Timestamp::fromUnixMillis(row["updated_at"].as<int64_t>());
        return order;
    }

    static domain::Transaction rowToTransaction(const pqxx::row& row) {
        domain::Transaction transaction;
        transaction.id = row["id"].as<std::string>();
        transaction.accountId = row["account_id"].as<std::string>();
        if (!row["order_id"].is_null()) {
            transaction.orderId = row["order_id"].as<std::string>();
        }
        transaction.symbol = row["symbol"].as<std::string>();
        transaction.type = domain::orderSideFromString(row["type"].as<std::string>());
        transaction.quantity = row["quantity"].as<int64_t>();
        transaction.price = row["price"].as<double>();
        transaction.amount = row["amount"].as<double>();
        transaction.commission = row["commission"].as<double>();
        transaction.description = row["description"].as<std::string>();
        transaction.timestamp = domain::Timestamp::fromUnixMillis(row["ts"].as<int64_t>());
        return transaction;
    }
};

} // namespace paper::adapters::secondary
