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
#include <memory>
#include <string>
#include "backoff.h"
#include "object_store.h"
#include "rate_limit_gate.h"
#include "../table/index_cache.h"
#include "../table/table_reader.h"

namespace chunkstore {
namespace remote {

struct RemoteReaderOptions {
    uint64_t block_size = kBlockSize;
    BackoffPolicy backoff = BackoffPolicy::defaults();
    // Null means SystemSleeper
    std::shared_ptr<Sleeper> sleeper;
    // Null means a token private to the reader, cancelled by close()
    std::shared_ptr<CancellationToken> token;

    static RemoteReaderOptions from(const StoreConfig& cfg) {
        RemoteReaderOptions o;
        o.block_size = cfg.block_size;
        o.backoff = BackoffPolicy::from(cfg);
        return o;
    }
};

/**
 * Table file stored as one object in a bucket, keyed by the table address.
 *
 * Construction bootstraps the index from the cache or with one suffix-range
 * read of the object's tail, then checks that it describes exactly
 * chunk_count chunks. Every ranged read holds one gate slot for the
 * duration of the request, and connection resets are retried with
 * exponential backoff until they succeed or the token is cancelled.
 *
 * Safe for concurrent use.
 */
class RemoteTableReader : public table::ReadAtSource, public table::ChunkSource {
public:
    RemoteTableReader(std::shared_ptr<ObjectStore> store,
                      const std::string& bucket,
                      const table::Address& name,
                      uint32_t chunk_count,
                      table::IndexCache* cache = nullptr,
                      std::shared_ptr<RateLimitGate> gate = nullptr,
                      RemoteReaderOptions options = RemoteReaderOptions());

    RemoteTableReader(const RemoteTableReader&) = delete;
    RemoteTableReader& operator=(const RemoteTableReader&) = delete;

    // Range "bytes=<offset>-<offset+len-1>" against the table's object
    size_t read_at(uint8_t* buf, size_t len, uint64_t offset) const override;

    // Stops pending retries and gate waits of this reader
    void close();

    bool has(const table::Address& a) const override { return reader_->has(a); }
    bool has_many(const std::vector<table::Address>& a) const override { return reader_->has_many(a); }
    std::optional<table::Chunk> get(const table::Address& a) const override { return reader_->get(a); }
    std::vector<table::Address> get_many(const std::vector<table::Address>& a,
                                         const table::ChunkCallback& on_found) const override {
        return reader_->get_many(a, on_found);
    }
    size_t calc_reads(const std::vector<table::Address>& a) const override {
        return reader_->calc_reads(a);
    }
    void extract(const table::ChunkCallback& on_chunk) const override { reader_->extract(on_chunk); }
    uint32_t count() const override { return reader_->count(); }
    uint64_t uncompressed_len() const override { return reader_->uncompressed_len(); }
    const table::Address& hash() const override { return name_; }
    std::shared_ptr<const table::TableIndex> index() const override { return reader_->index(); }

    const std::string& bucket() const { return bucket_; }

private:
    std::shared_ptr<const table::TableIndex> bootstrap(uint32_t chunk_count, table::IndexCache* cache);

    // Ranged read with gate, verification and retry
    size_t read_range(uint8_t* buf, size_t len, const std::string& range) const;
    size_t read_once(uint8_t* buf, size_t len, const std::string& range) const;

    std::shared_ptr<ObjectStore> store_;
    std::string bucket_;
    table::Address name_;
    std::string key_;
    std::shared_ptr<RateLimitGate> gate_;
    RemoteReaderOptions options_;
    std::unique_ptr<table::TableReader> reader_;
};

} // namespace remote
} // namespace chunkstore
