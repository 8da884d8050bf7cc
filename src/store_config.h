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
#include <cstdint>
#include <cstdlib>
#include <string>
#include "config.h"  // For defaults
#include "util/log.h"

namespace chunkstore {

/**
 * Runtime configuration for the chunk store.
 * One instance per independently configured store; nothing here is global.
 */
struct StoreConfig {
    // Reads
    size_t read_concurrency    = remote::kDefaultReadConcurrency;  // rate-limit gate capacity
    uint64_t block_size        = remote::kBlockSize;               // coalescing window

    // Retry on connection reset
    uint64_t backoff_min_us    = remote::kBackoffMinMicros;
    uint64_t backoff_max_us    = remote::kBackoffMaxMicros;
    double backoff_factor      = remote::kBackoffFactor;
    bool backoff_jitter        = true;

    // Index cache
    size_t index_cache_bytes   = index_cache::kDefaultCapacityBytes;  // 0 = unlimited
    size_t index_cache_shards  = index_cache::kDefaultShards;

    // Writes
    size_t part_size           = remote::kDefaultPartSize;

    /**
     * Create config with defaults, optionally reading from environment
     */
    static StoreConfig defaults() {
        StoreConfig cfg;

        if (const char* env = std::getenv("CHUNKSTORE_READ_CONCURRENCY")) {
            cfg.read_concurrency = std::stoull(env);
        }

        if (const char* env = std::getenv("CHUNKSTORE_BLOCK_SIZE")) {
            cfg.block_size = std::stoull(env);
        }

        if (const char* env = std::getenv("CHUNKSTORE_INDEX_CACHE_BYTES")) {
            cfg.index_cache_bytes = std::stoull(env);
        }

        if (const char* env = std::getenv("CHUNKSTORE_INDEX_CACHE_SHARDS")) {
            cfg.index_cache_shards = std::stoull(env);
        }

        if (const char* env = std::getenv("CHUNKSTORE_BACKOFF_MIN_US")) {
            cfg.backoff_min_us = std::stoull(env);
        }

        if (const char* env = std::getenv("CHUNKSTORE_BACKOFF_MAX_MS")) {
            cfg.backoff_max_us = std::stoull(env) * 1000;
        }

        if (const char* env = std::getenv("CHUNKSTORE_PART_SIZE")) {
            cfg.part_size = std::stoull(env);
        }

        initLoggingFromEnv();

        return cfg;
    }

    /**
     * Create config for latency-sensitive readers: more parallel reads,
     * smaller coalescing window.
     */
    static StoreConfig low_latency() {
        StoreConfig cfg;
        cfg.read_concurrency = 128;
        cfg.block_size = 64 * 1024;
        return cfg;
    }

    /**
     * Create config for memory-constrained processes
     */
    static StoreConfig low_memory() {
        StoreConfig cfg;
        cfg.index_cache_bytes = 16 * 1024 * 1024;   // 16MB of indexes
        cfg.read_concurrency = 8;
        cfg.part_size = remote::kMinPartSize;
        return cfg;
    }

    /**
     * Validate configuration
     */
    bool validate() const {
        if (read_concurrency < 1) {
            return false;
        }
        if (index_cache_shards < 1) {
            return false;
        }
        if (backoff_min_us < 1 || backoff_max_us < backoff_min_us) {
            return false;
        }
        if (backoff_factor < 1.0) {
            return false;
        }
        if (part_size < remote::kMinPartSize) {
            return false;
        }
        return true;
    }
};

} // namespace chunkstore
