#pragma once

#include <ThreadSafeMap.hpp>
#include <memory>
#include <mutex>
#include <string>

namespace paper::application {

/**
 * @brief Захваченный мьютекс счёта
 *
 * Держит shared_ptr на мьютекс, поэтому forget() во время захвата безопасен.
 */
class AccountGuard {
public:
    explicit AccountGuard(std::shared_ptr<std::mutex> mutex)
        : mutex_(std::move(mutex))
        , lock_(*mutex_)
    {}

    AccountGuard(AccountGuard&&) = default;
    AccountGuard& operator=(AccountGuard&&) = default;

private:
    std::shared_ptr<std::mutex> mutex_;
    std::unique_lock<std::mutex> lock_;
};

/**
 * @brief Мьютекс на каждый счёт
 *
 * Все изменения кэша, позиций и ордеров одного счёта выполняются
 * под его мьютексом. Разные счета не блокируют друг друга.
 */
class AccountLocks {
public:
    AccountGuard acquire(const std::string& accountId) {
        auto mutex = locks_.findOrInsert(accountId, []() {
            return std::make_shared<std::mutex>();
        });
        return AccountGuard(std::move(mutex));
    }

    /**
     * @brief Забыть мьютекс удалённого счёта
     */
    void forget(const std::string& accountId) {
        locks_.erase(accountId);
    }

    size_t size() const {
        return locks_.size();
    }

private:
    ThreadSafeMap<std::string, std::mutex> locks_;
};

} // namespace paper::application
