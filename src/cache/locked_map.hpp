#ifndef WTTP_GATEWAY_LOCKED_MAP_HPP
#define WTTP_GATEWAY_LOCKED_MAP_HPP

#pragma once

#include <cstddef>
#include <mutex>
#include <optional>
#include <unordered_map>
#include <utility>

namespace wttp::cache {

    // Mutex-guarded map for process-wide lookups. Entries are immutable once inserted; readers get
    // copies so no reference escapes the lock.
    template <typename K, typename V>
    class LockedMap {
       public:
        [[nodiscard]] std::optional<V> get(const K& key) const {
            std::lock_guard<std::mutex> lock(mutex_);

            auto it = entries_.find(key);
            if (it == entries_.end()) {
                return std::nullopt;
            }

            return it->second;
        }

        // Returns the value that ended up stored: the existing one if another writer got there first.
        V insert_if_absent(const K& key, V value) {
            std::lock_guard<std::mutex> lock(mutex_);

            auto [it, inserted] = entries_.try_emplace(key, std::move(value));
            return it->second;
        }

        void put(const K& key, V value) {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.insert_or_assign(key, std::move(value));
        }

        [[nodiscard]] bool contains(const K& key) const {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_.find(key) != entries_.end();
        }

        [[nodiscard]] std::size_t size() const {
            std::lock_guard<std::mutex> lock(mutex_);
            return entries_.size();
        }

        void clear() {
            std::lock_guard<std::mutex> lock(mutex_);
            entries_.clear();
        }

       private:
        mutable std::mutex mutex_;
        std::unordered_map<K, V> entries_;
    };
}  // namespace wttp::cache

#endif
