/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lucenia project is free software: you can redistribute it
 * and/or modify it under the terms of the GNU Affero General
 * Public License as published by the Free Software Foundation,
 * either version 3 of the License, or (at your option) any later
 * version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the
 * GNU Affero General Public License for more details.
 *
 * You should have received a copy of the GNU Affero General Public
 * License along with this program. If not, see:
 * https://www.gnu.org/licenses/agpl-3.0.html
 */


#pragma once
#include <atomic>
#include <list>
#include <memory>
#include <mutex>
#include <unordered_map>
#include <vector>
#include "table_index.h"
#include "../store_config.h"

namespace chunkstore {
namespace table {

/**
 * Process-wide cache of parsed table indexes, keyed by table address.
 *
 * Sharded by address prefix; each shard has its own mutex and LRU list, so
 * operations on different shards never contend. The memory budget is split
 * evenly across shards and enforced per shard after every put. Concurrent
 * puts of the same key are last-write-wins.
 *
 * Entries are handed out as shared_ptr<const TableIndex>: eviction drops
 * the cache's reference only, never a reader's.
 */
class IndexCache {
public:
    using IndexPtr = std::shared_ptr<const TableIndex>;

    struct Stats {
        uint64_t hits = 0;
        uint64_t misses = 0;
        uint64_t evictions = 0;
        size_t entries = 0;
        size_t memory = 0;
        size_t capacity = 0;
    };

    // capacity_bytes == 0 disables eviction
    explicit IndexCache(size_t capacity_bytes = index_cache::kDefaultCapacityBytes,
                        size_t num_shards = index_cache::kDefaultShards);
    explicit IndexCache(const StoreConfig& cfg)
        : IndexCache(cfg.index_cache_bytes, cfg.index_cache_shards) {}

    IndexCache(const IndexCache&) = delete;
    IndexCache& operator=(const IndexCache&) = delete;

    // Null on miss
    IndexPtr get(const Address& table) const;

    void put(const Address& table, IndexPtr index);
    void put(const Address& table, TableIndex index) {
        put(table, std::make_shared<const TableIndex>(std::move(index)));
    }

    bool erase(const Address& table);
    void clear();

    size_t size() const;
    size_t memory_usage() const;
    size_t capacity() const { return capacity_; }
    size_t shard_count() const { return shards_.size(); }
    Stats stats() const;

private:
    struct Shard {
        using LruList = std::list<std::pair<Address, IndexPtr>>;

        mutable std::mutex mutex;
        mutable LruList lru;        // front = most recently used
        std::unordered_map<Address, LruList::iterator, AddressHash> map;
        size_t memory = 0;
    };

    Shard& shard_for(const Address& a) const {
        return *shards_[a.prefix() & shard_mask_];
    }

    // Caller holds s.mutex
    void evict_locked(Shard& s);

    size_t capacity_;
    size_t shard_budget_;
    size_t shard_mask_;
    std::vector<std::unique_ptr<Shard>> shards_;

    mutable std::atomic<uint64_t> hits_{0};
    mutable std::atomic<uint64_t> misses_{0};
    std::atomic<uint64_t> evictions_{0};
};

} // namespace table
} // namespace chunkstore
