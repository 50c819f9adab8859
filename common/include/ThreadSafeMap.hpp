#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасный словарь key -> shared_ptr<V>
 *
 * Чтение под shared_lock, запись под unique_lock.
 * Используется реестром circuit breaker'ов: один экземпляр на имя зависимости.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    /**
     * @brief Вернуть значение по ключу, создав его фабрикой при отсутствии
     *
     * Два конкурентных вызова с одним ключом получают один и тот же объект:
     * фабрика вызывается не более одного раза на ключ.
     */
    std::shared_ptr<V> getOrCreate(const K &key, const std::function<std::shared_ptr<V>()> &factory)
    {
        // Fast path: ключ уже есть
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end())
                return it->second;
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        // Double-check после получения exclusive lock
        auto it = map_.find(key);
        if (it != map_.end())
            return it->second;

        auto value = factory();
        map_[key] = value;
        return value;
    }

    std::vector<K> keys() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<K> result;
        result.reserve(map_.size());
        for (const auto &[key, value] : map_)
            result.push_back(key);
        return result;
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, std::shared_ptr<V>> map_;
};
