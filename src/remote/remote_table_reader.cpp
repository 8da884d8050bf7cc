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


#include "remote_table_reader.h"
#include <stdexcept>

namespace chunkstore {
namespace remote {

RemoteTableReader::RemoteTableReader(std::shared_ptr<ObjectStore> store,
                                     const std::string& bucket,
                                     const table::Address& name,
                                     uint32_t chunk_count,
                                     table::IndexCache* cache,
                                     std::shared_ptr<RateLimitGate> gate,
                                     RemoteReaderOptions options)
    : store_(std::move(store)),
      bucket_(bucket),
      name_(name),
      key_(name.to_string()),
      gate_(std::move(gate)),
      options_(std::move(options)) {
    if (!store_) {
        throw std::invalid_argument("RemoteTableReader: object store is required");
    }
    if (!options_.sleeper) {
        options_.sleeper = std::make_shared<SystemSleeper>();
    }
    if (!options_.token) {
        options_.token = std::make_shared<CancellationToken>();
    }

    auto index = bootstrap(chunk_count, cache);
    reader_ = std::make_unique<table::TableReader>(name_, std::move(index), *this,
                                                   options_.block_size);
}

std::shared_ptr<const table::TableIndex> RemoteTableReader::bootstrap(uint32_t chunk_count,
                                                                      table::IndexCache* cache) {
    std::shared_ptr<const table::TableIndex> index;
    if (cache) {
        index = cache->get(name_);
    }

    if (!index) {
        uint64_t size = table::table_tail_size(chunk_count);
        std::vector<uint8_t> buf(size);

        size_t n = read_range(buf.data(), buf.size(), format_suffix_range(size));
        if (n != size) {
            throw ShortReadError("short read of table index " + key_, size, n);
        }

        METRIC_COUNTER_INC(index_bootstraps);
        index = std::make_shared<const table::TableIndex>(table::TableIndex::parse(buf));
        if (cache) {
            cache->put(name_, index);
        }
    }

    if (index->count() != chunk_count) {
        error() << "table " << key_ << ": index has " << index->count()
                << " chunks, expected " << chunk_count;
        throw IntegrityMismatchError("table " + key_ + " has " + std::to_string(index->count()) +
                                     " chunks, expected " + std::to_string(chunk_count));
    }
    return index;
}

size_t RemoteTableReader::read_at(uint8_t* buf, size_t len, uint64_t offset) const {
    if (len == 0) return 0;
    return read_range(buf, len, format_range(offset, len));
}

void RemoteTableReader::close() {
    options_.token->cancel();
}

size_t RemoteTableReader::read_range(uint8_t* buf, size_t len, const std::string& range) const {
    try {
        return retry_on_connection_reset(
            [&] { return read_once(buf, len, range); },
            options_.backoff, *options_.sleeper, options_.token.get(),
            "read of " + bucket_ + "/" + key_ + " " + range);
    } catch (const CancelledError&) {
        throw;
    } catch (const StoreError& e) {
        METRIC_COUNTER_INC(remote_read_errors);
        error() << "Failed ranged read of " << bucket_ << "/" << key_ << " " << range
                << " (" << to_string(e.kind()) << "): " << e.what();
        throw;
    }
}

size_t RemoteTableReader::read_once(uint8_t* buf, size_t len, const std::string& range) const {
    RateLimitGate::Slot slot;
    if (gate_) {
        slot = gate_->acquire(options_.token.get());
    }

    METRIC_GAUGE_INC(remote_reads_in_flight);
    struct InFlight {
        ~InFlight() { METRIC_GAUGE_DEC(remote_reads_in_flight); }
    } in_flight;
    METRIC_SCOPED_TIMER(remote_read_latency_us);
    METRIC_COUNTER_INC(remote_ranged_reads);

    GetObjectResponse resp = store_->get_object(GetObjectRequest{bucket_, key_, range});
    if (resp.content_length != static_cast<int64_t>(len)) {
        throw IntegrityMismatchError("ranged read " + range + " of " + key_ + " returned " +
                                     std::to_string(resp.content_length) + " bytes, expected " +
                                     std::to_string(len));
    }
    if (!resp.body) {
        throw ObjectStoreError("response for " + key_ + " has no body");
    }

    size_t n = read_full(*resp.body, buf, len);
    METRIC_COUNTER_ADD(remote_bytes_read, n);
    if (n < len) {
        throw ShortReadError("body of " + key_ + " ended early", len, n);
    }
    return n;
}

} // namespace remote
} // namespace chunkstore
