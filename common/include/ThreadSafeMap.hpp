#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @brief Потокобезопасная map с разделяемым чтением
 *
 * Значения хранятся как std::shared_ptr<V>: читатель получает снимок,
 * который остаётся валидным даже если ключ перезаписан другим потоком.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    ThreadSafeMap() = default;

    void insert(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_[key] = value;
    }

    /**
     * @brief Вставить только если ключа ещё нет
     * @return true если значение вставлено, false если ключ уже занят
     */
    bool insertIfAbsent(const K &key, const std::shared_ptr<V> &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        return map_.emplace(key, value).second;
    }

    std::shared_ptr<V> find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Снимок всех значений (порядок не определён)
     */
    std::vector<std::shared_ptr<V>> values() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::shared_ptr<V>> result;
        result.reserve(map_.size());
        for (const auto &[key, value] : map_) {
            result.push_back(value);
        }
        return result;
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
