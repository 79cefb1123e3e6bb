// Copyright (c) 2021-2023, Francesco Fusco. All rights reserved.
// SPDX-License-Identifier: GPL-3.0-or-later

#ifndef CACHE_HPP
#define CACHE_HPP

#include <chrono>
#include <compare>
#include <map>
#include <mutex>
#include <optional>
#include <lumen/monitor.hpp>

namespace lumen {

enum class cache_op {
    enumerate,  // one channel's monitor list
    merge,      // merged list for a channel constraint
    brightness  // last read of one monitor
};

struct cache_key {
    cache_op op;
    std::optional<lumen::channel> channel;
    size_t index;
    auto operator<=>(const cache_key &) const = default;
};

// Key-value store with optional per-entry expiry.
// A missing or expired key is a miss, not an error.
template <class Key, class Value>
class expiring_cache {
public:
    using clock    = std::chrono::steady_clock;
    using duration = clock::duration;
    static constexpr duration never = duration::max();

    std::optional<Value> get(const Key &key) {
        std::lock_guard lock(mutex_);
        const auto it = entries_.find(key);
        if (it == entries_.end())
            return std::nullopt;
        if (clock::now() >= it->second.deadline) {
            entries_.erase(it);
            return std::nullopt;
        }
        return it->second.value;
    }

    void store(const Key &key, Value value, duration expires = never) {
        const auto now = clock::now();
        const auto deadline = (expires >= clock::time_point::max() - now) ? clock::time_point::max() : now + expires;
        std::lock_guard lock(mutex_);
        entries_.insert_or_assign(key, entry{std::move(value), deadline});
    }

    void erase(const Key &key) {
        std::lock_guard lock(mutex_);
        entries_.erase(key);
    }

    void clear() {
        std::lock_guard lock(mutex_);
        entries_.clear();
    }

private:
    struct entry {
        Value value;
        clock::time_point deadline;
    };

    std::map<Key, entry> entries_;
    std::mutex mutex_;
};

}

#endif // CACHE_HPP
