#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <functional>
#include <memory>
#include <mutex>

/**
 * @brief Потокобезопасный словарь shared_ptr-значений
 *
 * Чтение под shared_lock, запись под unique_lock.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    /**
     * @brief Найти значение или атомарно создать его фабрикой
     *
     * Два потока, одновременно запросившие отсутствующий ключ,
     * получат один и тот же объект.
     */
    std::shared_ptr<V> findOrInsert(const K &key, const std::function<std::shared_ptr<V>()> &factory)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end())
            {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end())
        {
            return it->second;
        }
        auto value = factory();
        map_[key] = value;
        return value;
    }

    bool erase(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.erase(key) > 0;
    }

    size_t size() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.size();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
