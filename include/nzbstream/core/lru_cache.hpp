// Copyright (c) 2026 changcheng967. All rights reserved.

#pragma once

#include <cstddef>
#include <cstdint>
#include <list>
#include <optional>
#include <unordered_map>
#include <utility>

namespace nzbstream::core {

struct CacheStats {
    std::size_t entries{0};
    std::size_t capacity{0};
    std::uint64_t hits{0};
    std::uint64_t misses{0};
    std::uint64_t evictions{0};
};

// Bounded least-recently-used map. Not synchronized; owners lock around it.
template<typename Key, typename Value, typename Hash = std::hash<Key>>
class LruCache {
public:
    explicit LruCache(std::size_t capacity) noexcept
        : capacity_(capacity > 0 ? capacity : 1) {}

    // Lookup and mark as most recently used
    [[nodiscard]] std::optional<Value> get(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) {
            ++misses_;
            return std::nullopt;
        }
        ++hits_;
        order_.splice(order_.begin(), order_, it->second);
        return it->second->second;
    }

    // Lookup without touching recency or counters
    [[nodiscard]] bool contains(const Key& key) const {
        return index_.contains(key);
    }

    // Insert or overwrite; evicts the LRU entry when full
    void put(const Key& key, Value value) {
        auto it = index_.find(key);
        if (it != index_.end()) {
            it->second->second = std::move(value);
            order_.splice(order_.begin(), order_, it->second);
            return;
        }

        if (order_.size() >= capacity_) {
            index_.erase(order_.back().first);
            order_.pop_back();
            ++evictions_;
        }

        order_.emplace_front(key, std::move(value));
        index_.emplace(key, order_.begin());
    }

    bool erase(const Key& key) {
        auto it = index_.find(key);
        if (it == index_.end()) return false;
        order_.erase(it->second);
        index_.erase(it);
        return true;
    }

    // Remove all entries whose key matches the predicate
    template<typename Pred>
    std::size_t erase_if(Pred pred) {
        std::size_t removed = 0;
        for (auto it = order_.begin(); it != order_.end();) {
            if (pred(it->first)) {
                index_.erase(it->first);
                it = order_.erase(it);
                ++removed;
            } else {
                ++it;
            }
        }
        return removed;
    }

    void clear() noexcept {
        order_.clear();
        index_.clear();
    }

    [[nodiscard]] std::size_t size() const noexcept { return order_.size(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] bool empty() const noexcept { return order_.empty(); }

    [[nodiscard]] CacheStats stats() const noexcept {
        return {order_.size(), capacity_, hits_, misses_, evictions_};
    }

private:
    using Entry = std::pair<Key, Value>;
    using List = std::list<Entry>;   // MRU at front

    std::size_t capacity_;
    List order_;
    std::unordered_map<Key, typename List::iterator, Hash> index_;

    std::uint64_t hits_{0};
    std::uint64_t misses_{0};
    std::uint64_t evictions_{0};
};

} // namespace nzbstream::core
