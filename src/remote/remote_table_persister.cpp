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


#include "remote_table_persister.h"
#include <algorithm>
#include <stdexcept>

namespace chunkstore {
namespace remote {

RemoteTablePersister::RemoteTablePersister(std::shared_ptr<ObjectStore> store,
                                           const std::string& bucket,
                                           table::IndexCache* cache,
                                           size_t part_size,
                                           std::shared_ptr<RateLimitGate> gate,
                                           RemoteReaderOptions reader_options)
    : store_(std::move(store)),
      bucket_(bucket),
      cache_(cache),
      part_size_(part_size),
      gate_(std::move(gate)),
      reader_options_(std::move(reader_options)) {
    if (!store_) {
        throw std::invalid_argument("RemoteTablePersister: object store is required");
    }
    if (part_size_ == 0) {
        throw std::invalid_argument("RemoteTablePersister: part size must be positive");
    }
}

table::Address RemoteTablePersister::persist(const table::BuiltTable& table) {
    const std::string key = table.name.to_string();

    // Parse before upload so a malformed table never reaches the bucket
    uint64_t tail = table::table_tail_size(table.chunk_count);
    if (tail > table.bytes.size()) {
        throw CorruptIndexError("table " + key + " is too short for " +
                                std::to_string(table.chunk_count) + " chunks");
    }
    auto index = std::make_shared<const table::TableIndex>(
        table::TableIndex::parse(table.bytes.data() + table.bytes.size() - tail, tail));

    if (table.bytes.size() < part_size_) {
        store_->put_object(bucket_, key, table.bytes.data(), table.bytes.size());
    } else {
        upload_multipart(key, table.bytes);
    }

    if (cache_) {
        cache_->put(table.name, index);
    }

    METRIC_COUNTER_INC(tables_persisted);
    METRIC_COUNTER_ADD(bytes_persisted, table.bytes.size());
    info() << "persisted table " << key << " to " << bucket_ << " (" << table.chunk_count
           << " chunks, " << table.bytes.size() << " bytes)";
    return table.name;
}

void RemoteTablePersister::upload_multipart(const std::string& key,
                                            const std::vector<uint8_t>& bytes) {
    std::string upload_id = store_->create_multipart_upload(bucket_, key);

    try {
        std::vector<CompletedPart> parts;
        int part_number = 1;
        for (size_t off = 0; off < bytes.size(); off += part_size_, part_number++) {
            size_t len = std::min(part_size_, bytes.size() - off);
            std::string etag = store_->upload_part(bucket_, key, upload_id, part_number,
                                                   bytes.data() + off, len);
            parts.push_back(CompletedPart{part_number, etag});
        }
        store_->complete_multipart_upload(bucket_, key, upload_id, parts);
        debug() << "multipart upload " << upload_id << " of " << key << " completed in "
                << parts.size() << " parts";
    } catch (const std::exception& e) {
        error() << "multipart upload of " << key << " failed, aborting: " << e.what();
        try {
            store_->abort_multipart_upload(bucket_, key, upload_id);
        } catch (const std::exception& abort_error) {
            warning() << "abort of upload " << upload_id << " failed: " << abort_error.what();
        }
        throw;
    }
}

std::unique_ptr<RemoteTableReader> RemoteTablePersister::open(const table::Address& name,
                                                              uint32_t chunk_count) const {
    return std::make_unique<RemoteTableReader>(store_, bucket_, name, chunk_count, cache_,
                                               gate_, reader_options_);
}

} // namespace remote
} // namespace chunkstore
