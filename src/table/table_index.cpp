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


#include "table_index.h"
#include <algorithm>
#include <limits>
#include "../util/checksums.h"

namespace chunkstore {
namespace table {

TableIndex TableIndex::parse(const uint8_t* buf, size_t len) {
    if (len < table_format::kFooterSize) {
        throw CorruptIndexError("table tail of " + std::to_string(len) +
                                " bytes is shorter than the footer");
    }

    TableIndex idx;
    idx.footer_ = TableFooter::parse(buf + len - table_format::kFooterSize);
    const TableFooter& f = idx.footer_;

    if (f.index_size != index_size(f.chunk_count)) {
        throw CorruptIndexError("table footer: index size " + std::to_string(f.index_size) +
                                " does not match " + std::to_string(f.chunk_count) + " chunks");
    }
    if (len != f.index_size + table_format::kFooterSize) {
        throw CorruptIndexError("table tail is " + std::to_string(len) + " bytes, expected " +
                                std::to_string(f.index_size + table_format::kFooterSize));
    }
    if (util::crc32c(buf, f.index_size) != f.index_checksum) {
        throw CorruptIndexError("table index checksum mismatch");
    }

    idx.entries_.reserve(f.chunk_count);
    uint64_t total = 0;
    const uint8_t* p = buf;
    for (uint32_t i = 0; i < f.chunk_count; i++, p += table_format::kIndexEntrySize) {
        IndexEntry e = IndexEntry::decode(p);
        if (!idx.entries_.empty() && !(idx.entries_.back().address < e.address)) {
            throw CorruptIndexError("table index not strictly ascending at entry " +
                                    std::to_string(i));
        }
        if (e.offset > std::numeric_limits<uint64_t>::max() - e.length) {
            throw CorruptIndexError("table index entry " + std::to_string(i) +
                                    " overflows the file");
        }
        total += e.length;
        idx.entries_.push_back(e);
    }

    if (total != f.total_uncompressed) {
        throw CorruptIndexError("table index lengths sum to " + std::to_string(total) +
                                ", footer says " + std::to_string(f.total_uncompressed));
    }

    return idx;
}

std::optional<IndexEntry> TableIndex::lookup(const Address& address) const {
    auto it = std::lower_bound(entries_.begin(), entries_.end(), address,
        [](const IndexEntry& e, const Address& a) { return e.address < a; });
    if (it == entries_.end() || it->address != address) {
        return std::nullopt;
    }
    return *it;
}

} // namespace table
} // namespace chunkstore
