#pragma once

#include "ports/input/IAccountService.hpp"
#include "ports/output/ITradingStore.hpp"
#include "application/AccountLocks.hpp"
#include "application/RiskMetricsCalculator.hpp"
#include "application/TradingStatsCalculator.hpp"
#include "domain/TradingRules.hpp"
#include "utils/IdGenerator.hpp"
#include <algorithm>
#include <iostream>
#include <memory>

namespace paper::application {

/**
 * @brief Сервис счетов: создание, чтение, удаление, отчёты
 */
class AccountService : public ports::input::IAccountService {
public:
    AccountService(
        std::shared_ptr<ports::output::ITradingStore> store,
        std::shared_ptr<AccountLocks> locks)
        : store_(std::move(store))
        , locks_(std::move(locks))
    {
        std::cout << "[AccountService] Created" << std::endl;
    }

    /**
     * @brief Создать счёт с начальным балансом в [$1,000, $10,000,000]
     */
    domain::AccountResult createAccount(
        const std::string& ownerId,
        const std::string& name,
        double initialBalance) override
    {
        if (ownerId.empty()) {
            return domain::AccountResult::fail(domain::ErrorKind::VALIDATION_ERROR, "ownerId is required");
        }
        if (name.empty()) {
            return domain::AccountResult::fail(domain::ErrorKind::VALIDATION_ERROR, "Account name is required");
        }
        if (initialBalance < domain::rules::MIN_INITIAL_BALANCE ||
            initialBalance > domain::rules::MAX_INITIAL_BALANCE) {
            return domain::AccountResult::fail(domain::ErrorKind::VALIDATION_ERROR,
                                               "Initial balance must be between $1,000 and $10,000,000");
        }

        auto now = domain::Timestamp::now();
        domain::Account account;
        account.id = utils::IdGenerator::accountId();
        account.ownerId = ownerId;
        account.name = name;
        account.initialBalance = initialBalance;
        account.availableCash = initialBalance;
        account.totalValue = initialBalance;
        account.active = true;
        account.createdAt = now;
        account.updatedAt = now;

        try {
            store_->createAccount(account);
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[AccountService] createAccount failed: " << e.what() << std::endl;
            return domain::AccountResult::fail(domain::ErrorKind::PERSISTENCE_ERROR, e.what());
        }

        std::cout << "[AccountService] Created account " << account.id << " for " << ownerId << std::endl;

        domain::AccountSnapshot snapshot;
        snapshot.account = account;
        return domain::AccountResult::ok(snapshot);
    }

    domain::AccountResult getAccount(const std::string& accountId) override {
        try {
            auto account = store_->findAccount(accountId);
            if (!account) {
                return domain::AccountResult::fail(domain::ErrorKind::ACCOUNT_NOT_FOUND,
                                                   "Account not found: " + accountId);
            }

            domain::AccountSnapshot snapshot;
            snapshot.account = *account;
            snapshot.positions = store_->findPositions(accountId);
            snapshot.orders = store_->findOrders(accountId);
            snapshot.transactions = store_->findTransactions(accountId);
            return domain::AccountResult::ok(snapshot);
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[AccountService] getAccount failed: " << e.what() << std::endl;
            return domain::AccountResult::fail(domain::ErrorKind::PERSISTENCE_ERROR, e.what());
        }
    }

    std::vector<domain::Account> getAccounts(const std::string& ownerId) override {
        try {
            return store_->findAccountsByOwner(ownerId);
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[AccountService] getAccounts failed: " << e.what() << std::endl;
            return {};
        }
    }

    /**
     * @brief Удалить счёт
     *
     * Запрещено при открытых позициях или PENDING ордерах.
     * Удаление каскадное.
     */
    domain::OperationResult deleteAccount(const std::string& accountId) override {
        try {
            auto guard = locks_->acquire(accountId);

            if (!store_->findAccount(accountId)) {
                locks_->forget(accountId);
                return domain::OperationResult::fail(domain::ErrorKind::ACCOUNT_NOT_FOUND,
                                                     "Account not found: " + accountId);
            }
            if (!store_->findPositions(accountId).empty()) {
                return domain::OperationResult::fail(domain::ErrorKind::ACCOUNT_NOT_EMPTY,
                                                     "Close all positions before deleting the account");
            }

            auto orders = store_->findOrders(accountId);
            bool hasPending = std::any_of(orders.begin(), orders.end(),
                                          [](const auto& o) { return o.isPending(); });
            if (hasPending) {
                return domain::OperationResult::fail(domain::ErrorKind::ACCOUNT_NOT_EMPTY,
                                                     "Cancel pending orders before deleting the account");
            }

            if (!store_->deleteAccount(accountId)) {
                return domain::OperationResult::fail(domain::ErrorKind::ACCOUNT_NOT_FOUND,
                                                     "Account not found: " + accountId);
            }
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[AccountService] deleteAccount failed: " << e.what() << std::endl;
            return domain::OperationResult::fail(domain::ErrorKind::PERSISTENCE_ERROR, e.what());
        }

        locks_->forget(accountId);
        std::cout << "[AccountService] Deleted account " << accountId << std::endl;
        return domain::OperationResult::ok("Account deleted");
    }

    std::optional<domain::TradingStats> getTradingStats(const std::string& accountId) override {
        try {
            auto account = store_->findAccount(accountId);
            if (!account) {
                return std::nullopt;
            }
            return TradingStatsCalculator::compute(
                *account, store_->findPositions(accountId), store_->findTransactions(accountId));
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[AccountService] getTradingStats failed: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

    std::optional<domain::RiskMetrics> getRiskMetrics(const std::string& accountId) override {
        try {
            auto account = store_->findAccount(accountId);
            if (!account) {
                return std::nullopt;
            }
            return RiskMetricsCalculator::compute(*account, store_->findPositions(accountId));
        } catch (const domain::PersistenceException& e) {
            std::cerr << "[AccountService] getRiskMetrics failed: " << e.what() << std::endl;
            return std::nullopt;
        }
    }

private:
    std::shared_ptr<ports::output::ITradingStore> store_;
    std::shared_ptr<AccountLocks> locks_;
};

} // namespace paper::application
