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


#include "index_cache.h"
#include <algorithm>
#include <stdexcept>
#include "../util/log.h"
#include "../util/metrics.h"

namespace chunkstore {
namespace table {

IndexCache::IndexCache(size_t capacity_bytes, size_t num_shards)
    : capacity_(capacity_bytes) {
    if (num_shards == 0) {
        throw std::invalid_argument("IndexCache: shard count must be at least 1");
    }

    // Power of 2 for a mask instead of a modulo
    size_t power_of_2 = 1;
    while (power_of_2 < num_shards) power_of_2 <<= 1;
    shard_mask_ = power_of_2 - 1;

    shards_.reserve(power_of_2);
    for (size_t i = 0; i < power_of_2; ++i) {
        shards_.emplace_back(std::make_unique<Shard>());
    }

    shard_budget_ = capacity_ == 0 ? 0 : std::max<size_t>(1, capacity_ / power_of_2);
}

IndexCache::IndexPtr IndexCache::get(const Address& table) const {
    Shard& s = shard_for(table);
    std::lock_guard<std::mutex> lock(s.mutex);

    auto it = s.map.find(table);
    if (it == s.map.end()) {
        misses_.fetch_add(1, std::memory_order_relaxed);
        METRIC_COUNTER_INC(index_cache_misses);
        return nullptr;
    }

    s.lru.splice(s.lru.begin(), s.lru, it->second);
    hits_.fetch_add(1, std::memory_order_relaxed);
    METRIC_COUNTER_INC(index_cache_hits);
    return it->second->second;
}

void IndexCache::put(const Address& table, IndexPtr index) {
    if (!index) {
        throw std::invalid_argument("IndexCache: cannot cache a null index");
    }

    Shard& s = shard_for(table);
    std::lock_guard<std::mutex> lock(s.mutex);

    size_t size = index->memory_usage();
    auto it = s.map.find(table);
    if (it != s.map.end()) {
        s.memory -= it->second->second->memory_usage();
        it->second->second = std::move(index);
        s.lru.splice(s.lru.begin(), s.lru, it->second);
    } else {
        s.lru.emplace_front(table, std::move(index));
        s.map.emplace(table, s.lru.begin());
    }
    s.memory += size;

    evict_locked(s);
}

void IndexCache::evict_locked(Shard& s) {
    if (shard_budget_ == 0) return;

    // The entry just inserted sits at the front and is kept even if it alone
    // exceeds the shard budget
    while (s.memory > shard_budget_ && s.lru.size() > 1) {
        auto& victim = s.lru.back();
        s.memory -= victim.second->memory_usage();
        debug() << "index cache: evicting " << victim.first.to_string();
        s.map.erase(victim.first);
        s.lru.pop_back();
        evictions_.fetch_add(1, std::memory_order_relaxed);
        METRIC_COUNTER_INC(index_cache_evictions);
    }
}

bool IndexCache::erase(const Address& table) {
    Shard& s = shard_for(table);
    std::lock_guard<std::mutex> lock(s.mutex);

    auto it = s.map.find(table);
    if (it == s.map.end()) {
        return false;
    }
    s.memory -= it->second->second->memory_usage();
    s.lru.erase(it->second);
    s.map.erase(it);
    return true;
}

void IndexCache::clear() {
    for (auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        shard->map.clear();
        shard->lru.clear();
        shard->memory = 0;
    }
}

size_t IndexCache::size() const {
    size_t n = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        n += shard->map.size();
    }
    return n;
}

size_t IndexCache::memory_usage() const {
    size_t n = 0;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        n += shard->memory;
    }
    return n;
}

IndexCache::Stats IndexCache::stats() const {
    Stats st;
    st.hits = hits_.load(std::memory_order_relaxed);
    st.misses = misses_.load(std::memory_order_relaxed);
    st.evictions = evictions_.load(std::memory_order_relaxed);
    st.capacity = capacity_;
    for (const auto& shard : shards_) {
        std::lock_guard<std::mutex> lock(shard->mutex);
        st.entries += shard->map.size();
        st.memory += shard->memory;
    }
    return st;
}

} // namespace table
} // namespace chunkstore
