#pragma once

#include <unordered_map>
#include <shared_mutex>
#include <memory>
#include <mutex>
#include <vector>
#include <functional>

namespace cpq::common
{

    /**
     * @brief Потокобезопасная map с shared_ptr-значениями
     *
     * Чтение под shared_lock, запись под unique_lock.
     * Возвращаемые shared_ptr указывают на неизменяемые копии: чтобы обновить
     * значение, вставьте новый объект.
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

        /// @return false, если ключ уже занят (значение не меняется)
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

        bool remove(const K &key)
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            return map_.erase(key) > 0;
        }

        /// Значения, удовлетворяющие предикату (порядок не определён)
        std::vector<std::shared_ptr<V>> values(const std::function<bool(const V &)> &predicate = nullptr) const
        {
            std::shared_lock<std::shared_mutex> lock(mutex_);
            std::vector<std::shared_ptr<V>> out;
            out.reserve(map_.size());
            for (const auto &entry : map_)
            {
                if (!predicate || predicate(*entry.second))
                    out.push_back(entry.second);
            }
            return out;
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
        std::unordered_map<K, std::shared_ptr<V>> map_;
    };

} // namespace cpq::common
