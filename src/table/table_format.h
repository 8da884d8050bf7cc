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
#include <cstddef>
#include "address.h"
#include "../config.h"
#include "../errors.h"
#include "../util/endian.hpp"

namespace chunkstore {
namespace table {

/**
 * One index record: where a chunk's payload lives inside a table file.
 *
 * On disk (36 bytes, little-endian):
 *   0   address[20]
 *   20  offset:u64     from the start of the file
 *   28  length:u32
 *   32  crc32c:u32     of the payload
 */
struct IndexEntry {
    Address address;
    uint64_t offset = 0;
    uint32_t length = 0;
    uint32_t checksum = 0;

    uint64_t end() const { return offset + length; }

    bool operator==(const IndexEntry& o) const {
        return address == o.address && offset == o.offset &&
               length == o.length && checksum == o.checksum;
    }
    bool operator!=(const IndexEntry& o) const { return !(*this == o); }

    void encode(uint8_t* buf) const {
        std::memcpy(buf, address.data(), Address::kSize);
        util::store_le64(buf + 20, offset);
        util::store_le32(buf + 28, length);
        util::store_le32(buf + 32, checksum);
    }

    static IndexEntry decode(const uint8_t* buf) {
        IndexEntry e;
        e.address = Address::from_bytes(buf);
        e.offset = util::load_le64(buf + 20);
        e.length = util::load_le32(buf + 28);
        e.checksum = util::load_le32(buf + 32);
        return e;
    }
};

/**
 * Trailer of every table file (36 bytes, little-endian):
 *   0   chunk_count:u32
 *   4   index_size:u64
 *   12  total_uncompressed:u64
 *   20  version:u32
 *   24  index_crc32c:u32
 *   28  magic:u64
 */
struct TableFooter {
    uint32_t chunk_count = 0;
    uint64_t index_size = 0;
    uint64_t total_uncompressed = 0;
    uint32_t version = table_format::kFormatVersion;
    uint32_t index_checksum = 0;
    uint64_t magic = table_format::kMagic;

    void encode(uint8_t* buf) const {
        util::store_le32(buf + 0, chunk_count);
        util::store_le64(buf + 4, index_size);
        util::store_le64(buf + 12, total_uncompressed);
        util::store_le32(buf + 20, version);
        util::store_le32(buf + 24, index_checksum);
        util::store_le64(buf + 28, magic);
    }

    // Decodes and checks magic and version; buf holds kFooterSize bytes
    static TableFooter parse(const uint8_t* buf) {
        TableFooter f;
        f.chunk_count = util::load_le32(buf + 0);
        f.index_size = util::load_le64(buf + 4);
        f.total_uncompressed = util::load_le64(buf + 12);
        f.version = util::load_le32(buf + 20);
        f.index_checksum = util::load_le32(buf + 24);
        f.magic = util::load_le64(buf + 28);

        if (f.magic != table_format::kMagic) {
            throw CorruptIndexError("table footer: bad magic");
        }
        if (f.version != table_format::kFormatVersion) {
            throw CorruptIndexError("table footer: unsupported version " +
                                    std::to_string(f.version));
        }
        return f;
    }
};

static_assert(table_format::kIndexEntrySize == 36, "index entry size must be stable");
static_assert(table_format::kFooterSize == 36, "footer size must be stable");

inline uint64_t index_size(uint32_t chunk_count) {
    return static_cast<uint64_t>(chunk_count) * table_format::kIndexEntrySize;
}

// Bytes needed from the end of a table file to bootstrap its index
inline uint64_t table_tail_size(uint32_t chunk_count) {
    return index_size(chunk_count) + table_format::kFooterSize;
}

} // namespace table
} // namespace chunkstore
