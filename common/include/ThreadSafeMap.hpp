#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <functional>
#include <memory>
#include <mutex>
#include <vector>

/**
 * @file ThreadSafeMap.hpp
 * @brief Потокобезопасная хеш-таблица с атомарными операциями над ключом
 * @details
 * Чтение под shared_lock, запись под unique_lock.
 * Составные операции (insertIfAbsent, compute, computeIfPresent, removeIf)
 * выполняются целиком под одной блокировкой, поэтому линеаризуемы
 * относительно любых других операций над тем же ключом.
 *
 * Функции, переданные в compute*, вызываются под блокировкой записи:
 * они не должны обращаться к этой же карте.
 */
template <typename K, typename V>
class ThreadSafeMap
{
public:
    using ValuePtr = std::shared_ptr<V>;
    using Remapper = std::function<ValuePtr(const ValuePtr &)>;

    ThreadSafeMap() = default;

    void insert(const K &key, const ValuePtr &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_); // ← UNIQUE_LOCK для WRITE!
        map_[key] = value;
    }

    ValuePtr find(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        auto it = map_.find(key);
        return (it != map_.end()) ? it->second : nullptr;
    }

    bool contains(const K &key) const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_); // ← shared_lock для READ
        return map_.find(key) != map_.end();
    }

    /**
     * @brief Вставить значение, только если ключ отсутствует
     * @return nullptr если вставка выполнена, иначе уже существующее значение
     */
    ValuePtr insertIfAbsent(const K &key, const ValuePtr &value)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto [it, inserted] = map_.emplace(key, value);
        return inserted ? nullptr : it->second;
    }

    /**
     * @brief Атомарно пересчитать значение существующего ключа
     *
     * Если remapper вернул nullptr, ключ удаляется.
     *
     * @return Новое значение или nullptr (ключа не было / удалён)
     */
    ValuePtr computeIfPresent(const K &key, const Remapper &remapper)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return nullptr;
        }

        auto updated = remapper(it->second);
        if (!updated) {
            map_.erase(it);
            return nullptr;
        }
        it->second = updated;
        return updated;
    }

    /**
     * @brief Атомарно вычислить значение ключа (существующее или nullptr)
     *
     * Если remapper вернул nullptr, ключ удаляется (или не создаётся).
     */
    ValuePtr compute(const K &key, const Remapper &remapper)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        ValuePtr current = (it != map_.end()) ? it->second : nullptr;

        auto updated = remapper(current);
        if (!updated) {
            if (it != map_.end()) {
                map_.erase(it);
            }
            return nullptr;
        }
        map_[key] = updated;
        return updated;
    }

    /**
     * @brief Удалить ключ
     * @return Удалённое значение или nullptr
     */
    ValuePtr remove(const K &key)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end()) {
            return nullptr;
        }
        auto removed = it->second;
        map_.erase(it);
        return removed;
    }

    /**
     * @brief Удалить ключ, только если текущее значение удовлетворяет условию
     * @return true если удалён
     */
    bool removeIf(const K &key, const std::function<bool(const V &)> &predicate)
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = map_.find(key);
        if (it == map_.end() || !predicate(*it->second)) {
            return false;
        }
        map_.erase(it);
        return true;
    }

    /**
     * @brief Снимок всех значений (порядок не определён)
     */
    std::vector<ValuePtr> getAll() const
    {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<ValuePtr> result;
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

    void clear()
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        map_.clear();
    }

private:
    mutable std::shared_mutex mutex_;
    std::unordered_map<K, ValuePtr> map_;
};
