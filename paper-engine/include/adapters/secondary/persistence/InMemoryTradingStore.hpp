#pragma once

#include "ports/output/ITradingStore.hpp"
#include <algorithm>
#include <map>
#include <mutex>
#include <unordered_map>
#include <vector>

namespace paper::adapters::secondary {

/**
 * @brief In-memory хранилище движка
 *
 * Один мьютекс на всё хранилище, поэтому commit() атомарен.
 * Используется по умолчанию и в тестах.
 */
class InMemoryTradingStore : public ports::output::ITradingStore {
public:
    // ---- Accounts ----

    void createAccount(const domain::Account& account) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accounts_.count(account.id)) {
            throw domain::PersistenceException("Account already exists: " + account.id);
        }
        accounts_[account.id] = account;
    }

    std::optional<domain::Account> findAccount(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = accounts_.find(accountId);
        if (it == accounts_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Account> result;
        for (const auto& [id, account] : accounts_) {
            if (account.ownerId == ownerId) {
                result.push_back(account);
            }
        }
        std::sort(result.begin(), result.end(),
                  [](const auto& a, const auto& b) { return a.createdAt > b.createdAt; });
        return result;
    }

    std::vector<domain::Account> findAllAccounts() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Account> result;
        result.reserve(accounts_.size());
        for (const auto& [id, account] : accounts_) {
            result.push_back(account);
        }
        return result;
    }

    bool deleteAccount(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (accounts_.erase(accountId) == 0) {
            return false;
        }

        positions_.erase(accountId);
        transactions_.erase(accountId);
        for (auto it = orders_.begin(); it != orders_.end();) {
            if (it->second.accountId == accountId) {
                orderSequence_.erase(it->first);
                it = orders_.erase(it);
            } else {
                ++it;
            }
        }
        return true;
    }

    // ---- Positions ----

    std::vector<domain::Position> findPositions(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Position> result;
        auto it = positions_.find(accountId);
        if (it != positions_.end()) {
            for (const auto& [symbol, position] : it->second) {
                result.push_back(position);
            }
        }
        return result;
    }

    std::optional<domain::Position> findPosition(
        const std::string& accountId, const std::string& symbol) override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(accountId);
        if (it == positions_.end()) {
            return std::nullopt;
        }
        auto pit = it->second.find(symbol);
        if (pit == it->second.end()) {
            return std::nullopt;
        }
        return pit->second;
    }

    bool updatePosition(const domain::Position& position) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = positions_.find(position.accountId);
        if (it == positions_.end() || !it->second.count(position.symbol)) {
            return false;
        }
        it->second[position.symbol] = position;
        return true;
    }

    // ---- Orders ----

    void saveOrder(const domain::Order& order) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!accounts_.count(order.accountId)) {
            throw domain::PersistenceException("Order references unknown account: " + order.accountId);
        }
        orders_[order.id] = order;
        orderSequence_[order.id] = nextSequence_++;
    }

    std::optional<domain::Order> findOrder(const std::string& orderId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(orderId);
        if (it == orders_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    std::vector<domain::Order> findOrders(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Order> result;
        for (const auto& [id, order] : orders_) {
            if (order.accountId == accountId) {
                result.push_back(order);
            }
        }
        sortBySequence(result, true);
        return result;
    }

    std::vector<domain::Order> findPendingOrders() override {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<domain::Order> result;
        for (const auto& [id, order] : orders_) {
            if (order.isPending()) {
                result.push_back(order);
            }
        }
        sortBySequence(result, false);
        return result;
    }

    bool transitionOrder(const domain::Order& order) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = orders_.find(order.id);
        if (it == orders_.end() || !it->second.isPending()) {
            return false;
        }
        it->second = order;
        return true;
    }

    // ---- Transactions ----

    std::vector<domain::Transaction> findTransactions(const std::string& accountId) override {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = transactions_.find(accountId);
        if (it == transactions_.end()) {
            return {};
        }
        // хранятся в порядке добавления, отдаём от новых к старым
        return std::vector<domain::Transaction>(it->second.rbegin(), it->second.rend());
    }

    // ---- Atomic commit ----

    bool commit(const domain::LedgerUpdate& update) override {
        std::lock_guard<std::mutex> lock(mutex_);

        // Все проверки до первой записи
        if (!accounts_.count(update.account.id)) {
            throw domain::PersistenceException("Commit for unknown account: " + update.account.id);
        }
        if (update.order) {
            auto it = orders_.find(update.order->id);
            if (it == orders_.end() || !it->second.isPending()) {
                return false;
            }
        }

        accounts_[update.account.id] = update.account;

        auto& positions = positions_[update.account.id];
        for (const auto& symbol : update.removedSymbols) {
            positions.erase(symbol);
        }
        for (const auto& position : update.upserts) {
            positions[position.symbol] = position;
        }

        if (update.order) {
            orders_[update.order->id] = *update.order;
        }

        auto& transactions = transactions_[update.account.id];
        transactions.insert(transactions.end(), update.transactions.begin(), update.transactions.end());
        return true;
    }

private:
    std::mutex mutex_;
    std::unordered_map<std::string, domain::Account> accounts_;
    std::unordered_map<std::string, std::map<std::string, domain::Position>> positions_;
    std::unordered_map<std::string, domain::Order> orders_;
    std::unordered_map<std::string, uint64_t> orderSequence_;
    std::unordered_map<std::string, std::vector<domain::Transaction>> transactions_;
    uint64_t nextSequence_ = 0;

    /**
     * @brief Порядок вставки надёжнее createdAt при одинаковых метках времени
     */
    void sortBySequence(std::vector<domain::Order>& orders, bool newestFirst) const {
        std::sort(orders.begin(), orders.end(), [this, newestFirst](const auto& a, const auto& b) {
            auto sa = orderSequence_.at(a.id);
            auto sb = orderSequence_.at(b.id);
            return newestFirst ? sa > sb : sa < sb;
        });
    }
};

} // namespace paper::adapters::secondary
