#pragma once

#include "domain/Account.hpp"
#include "domain/LedgerUpdate.hpp"
#include "domain/Order.hpp"
#include "domain/Position.hpp"
#include "domain/Transaction.hpp"
#include "domain/PersistenceException.hpp"
#include <optional>
#include <string>
#include <vector>

namespace paper::ports::output {

/**
 * @brief Хранилище счетов, позиций, ордеров и транзакций
 *
 * Output Port. Все методы при сбое хранилища бросают
 * domain::PersistenceException.
 *
 * Списки ордеров и транзакций возвращаются от новых к старым,
 * pending-ордера - от старых к новым (порядок обработки).
 *
 * Реализации:
 * - InMemoryTradingStore - в памяти процесса
 * - PostgresTradingStore - PostgreSQL (libpqxx)
 */
class ITradingStore {
public:
    virtual ~ITradingStore() = default;

    // ---- Accounts ----

    virtual void createAccount(const domain::Account& account) = 0;

    virtual std::optional<domain::Account> findAccount(const std::string& accountId) = 0;

    /**
     * @brief Счета владельца, от новых к старым
     */
    virtual std::vector<domain::Account> findAccountsByOwner(const std::string& ownerId) = 0;

    virtual std::vector<domain::Account> findAllAccounts() = 0;

    /**
     * @brief Удалить счёт каскадно (позиции, ордера, транзакции)
     * @return false если счёт не найден
     */
    virtual bool deleteAccount(const std::string& accountId) = 0;

    // ---- Positions ----

    virtual std::vector<domain::Position> findPositions(const std::string& accountId) = 0;

    virtual std::optional<domain::Position> findPosition(
        const std::string& accountId, const std::string& symbol) = 0;

    /**
     * @brief Обновить позицию без изменения счёта (например, правила риска)
     * @return false если позиции нет
     */
    virtual bool updatePosition(const domain::Position& position) = 0;

    // ---- Orders ----

    /**
     * @brief Сохранить новый ордер
     */
    virtual void saveOrder(const domain::Order& order) = 0;

    virtual std::optional<domain::Order> findOrder(const std::string& orderId) = 0;

    virtual std::vector<domain::Order> findOrders(const std::string& accountId) = 0;

    /**
     * @brief Все PENDING ордера всех счетов, от старых к новым
     */
    virtual std::vector<domain::Order> findPendingOrders() = 0;

    /**
     * @brief Перевести ордер из PENDING в конечный статус без движения денег
     *
     * Используется для cancel / reject.
     * @return false если ордер не найден или уже не PENDING
     */
    virtual bool transitionOrder(const domain::Order& order) = 0;

    // ---- Transactions ----

    virtual std::vector<domain::Transaction> findTransactions(const std::string& accountId) = 0;

    // ---- Atomic commit ----

    /**
     * @brief Применить набор изменений одного счёта атомарно
     *
     * @return false если update.order задан, а сохранённый ордер уже не PENDING;
     *         в этом случае ничего не записано
     */
    virtual bool commit(const domain::LedgerUpdate& update) = 0;
};

} // namespace paper::ports::output
