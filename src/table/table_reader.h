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
#include "byte_source.h"
#include "chunk_source.h"
#include "../config.h"

namespace chunkstore {
namespace table {

/**
 * Resolves chunk addresses to byte ranges through a TableIndex and reads
 * them from a ReadAtSource.
 *
 * Batch reads sort the requested entries by file offset and merge an entry
 * into the current read when the gap to the read's end is at most
 * block_size, trading a little wasted transfer for fewer round trips.
 * Every payload is checked against the CRC32C recorded in the index.
 *
 * All operations are const and safe to call concurrently. The source must
 * outlive the reader.
 */
class TableReader : public ChunkSource {
public:
    TableReader(const Address& name,
                std::shared_ptr<const TableIndex> index,
                const ReadAtSource& source,
                uint64_t block_size = remote::kBlockSize);

    bool has(const Address& address) const override;
    bool has_many(const std::vector<Address>& addresses) const override;
    std::optional<Chunk> get(const Address& address) const override;
    std::vector<Address> get_many(const std::vector<Address>& addresses,
                                  const ChunkCallback& on_found) const override;
    size_t calc_reads(const std::vector<Address>& addresses) const override;
    void extract(const ChunkCallback& on_chunk) const override;

    uint32_t count() const override { return index_->count(); }
    uint64_t uncompressed_len() const override { return index_->total_uncompressed(); }
    const Address& hash() const override { return name_; }
    std::shared_ptr<const TableIndex> index() const override { return index_; }

    uint64_t block_size() const { return block_size_; }

private:
    // A contiguous byte range covering one or more entries
    struct Batch {
        uint64_t offset;
        uint64_t end;
        std::vector<IndexEntry> entries;
    };

    // Found entries sorted by offset, duplicates removed; misses go to missing
    std::vector<IndexEntry> resolve(const std::vector<Address>& addresses,
                                    std::vector<Address>* missing) const;
    std::vector<Batch> plan_reads(const std::vector<IndexEntry>& sorted) const;
    void read_batch(const Batch& batch, const ChunkCallback& on_chunk) const;
    void read_exact(uint8_t* buf, size_t len, uint64_t offset) const;
    void verify(const IndexEntry& entry, const uint8_t* data) const;

    Address name_;
    std::shared_ptr<const TableIndex> index_;
    const ReadAtSource& source_;
    uint64_t block_size_;
};

} // namespace table
} // namespace chunkstore
