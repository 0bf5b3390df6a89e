#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>
#include <functional>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасная map с хранением значений через shared_ptr
 *
 * Чтение под shared_lock, запись под unique_lock.
 * Значения отдаются наружу как shared_ptr: запись в map не инвалидирует
 * уже выданные указатели.
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
     * @brief Найти значение или атомарно создать его фабрикой
     *
     * Фабрика вызывается не более одного раза на ключ, даже если
     * несколько потоков одновременно запрашивают отсутствующий ключ.
     */
    std::shared_ptr<V> getOrCreate(const K &key, const std::function<std::shared_ptr<V>()> &factory)
    {
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            auto it = map_.find(key);
            if (it != map_.end()) {
                return it->second;
            }
        }

        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it != map_.end()) {
            return it->second; // другой поток успел создать
        }
        auto created = factory();
        map_[key] = created;
        return created;
    }

    /**
     * @brief Снимок всех значений (порядок не определён)
     */
    std::vector<std::shared_ptr<V>> getAll() const
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
