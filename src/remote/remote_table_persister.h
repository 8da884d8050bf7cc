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
#include "remote_table_reader.h"
#include "../table/table_writer.h"

namespace chunkstore {
namespace remote {

/**
 * Write path for remote tables: uploads a built table under its address
 * and seeds the index cache so the first open needs no bootstrap read.
 *
 * Tables smaller than part_size go up in a single put; larger ones use a
 * multipart upload with parts sent in order. A failed multipart upload is
 * aborted before the error propagates.
 */
class RemoteTablePersister {
public:
    RemoteTablePersister(std::shared_ptr<ObjectStore> store,
                         const std::string& bucket,
                         table::IndexCache* cache = nullptr,
                         size_t part_size = kDefaultPartSize,
                         std::shared_ptr<RateLimitGate> gate = nullptr,
                         RemoteReaderOptions reader_options = RemoteReaderOptions());

    table::Address persist(const table::BuiltTable& table);

    std::unique_ptr<RemoteTableReader> open(const table::Address& name, uint32_t chunk_count) const;

    size_t part_size() const { return part_size_; }
    const std::string& bucket() const { return bucket_; }

private:
    void upload_multipart(const std::string& key, const std::vector<uint8_t>& bytes);

    std::shared_ptr<ObjectStore> store_;
    std::string bucket_;
    table::IndexCache* cache_;
    size_t part_size_;
    std::shared_ptr<RateLimitGate> gate_;
    RemoteReaderOptions reader_options_;
};

} // namespace remote
} // namespace chunkstore
