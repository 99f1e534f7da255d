// Copyright 2025 Siddhant Biradar
//
// Licensed under the Apache License, Version 2.0 (the "License");
// you may not use this file except in compliance with the License.
// You may obtain a copy of the License at
//
//     http://www.apache.org/licenses/LICENSE-2.0
//
// Unless required by applicable law or agreed to in writing, software
// distributed under the License is distributed on an "AS IS" BASIS,
// WITHOUT WARRANTIES OR CONDITIONS OF ANY KIND, either express or implied.
// See the License for the specific language governing permissions and
// limitations under the License.

#pragma once

#include <array>
#include <functional>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace relocator {

// ============================================================================
// Sharded string-keyed map - insert-only, safe for concurrent writers
// ============================================================================
//
// Keys hash to one of SHARDS buckets, each with its own shared_mutex, so two
// inserts only contend when their keys land in the same shard. Values are
// never mutated after insertion; lookups return copies.
template <typename T, size_t SHARDS = 16>
class ConcurrentMap {
public:
    // Insert if absent. Returns false (and keeps the first value) on duplicate key.
    bool try_add(const std::string &key, T value) {
        Shard &shard = shard_for(key);
        std::unique_lock<std::shared_mutex> lock(shard.mutex);
        return shard.items.emplace(key, std::move(value)).second;
    }

    std::optional<T> find(const std::string &key) const {
        const Shard &shard = shard_for(key);
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        auto it = shard.items.find(key);
        if (it == shard.items.end())
            return std::nullopt;
        return it->second;
    }

    bool contains(const std::string &key) const {
        const Shard &shard = shard_for(key);
        std::shared_lock<std::shared_mutex> lock(shard.mutex);
        return shard.items.find(key) != shard.items.end();
    }

    size_t size() const {
        size_t total = 0;
        for (const auto &shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            total += shard.items.size();
        }
        return total;
    }

    // Visit every value, shard by shard. Entries inserted concurrently may or
    // may not be seen.
    void for_each(const std::function<void(const T &)> &visitor) const {
        for (const auto &shard : shards_) {
            std::shared_lock<std::shared_mutex> lock(shard.mutex);
            for (const auto &[key, value] : shard.items) {
                visitor(value);
            }
        }
    }

    // Snapshot of all values
    std::vector<T> values() const {
        std::vector<T> out;
        for_each([&](const T &value) { out.push_back(value); });
        return out;
    }

private:
    struct Shard {
        mutable std::shared_mutex mutex;
        std::unordered_map<std::string, T> items;
    };

    std::array<Shard, SHARDS> shards_;

    Shard &shard_for(const std::string &key) {
        return shards_[std::hash<std::string>{}(key) % SHARDS];
    }

    const Shard &shard_for(const std::string &key) const {
        return shards_[std::hash<std::string>{}(key) % SHARDS];
    }
};

} // namespace relocator
