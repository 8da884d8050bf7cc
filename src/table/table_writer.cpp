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


#include "table_writer.h"
#include <algorithm>
#include <limits>
#include <stdexcept>
#include "../util/checksums.h"

namespace chunkstore {
namespace table {

Address TableWriter::add(const void* data, size_t len) {
    Address a = Address::of(data, len);
    add(a, data, len);
    return a;
}

bool TableWriter::add(const Address& address, const void* data, size_t len) {
    if (len > table_format::kMaxChunkLength) {
        throw std::invalid_argument("chunk of " + std::to_string(len) +
                                    " bytes exceeds the maximum chunk length");
    }
    if (entries_.size() >= std::numeric_limits<uint32_t>::max()) {
        throw std::length_error("table is full");
    }
    if (!seen_.insert(address).second) {
        return false;
    }

    IndexEntry e;
    e.address = address;
    e.offset = data_.size();
    e.length = static_cast<uint32_t>(len);
    e.checksum = util::crc32c(data, len);

    const uint8_t* p = static_cast<const uint8_t*>(data);
    data_.insert(data_.end(), p, p + len);
    entries_.push_back(e);
    return true;
}

BuiltTable TableWriter::finish() const {
    std::vector<IndexEntry> sorted = entries_;
    std::sort(sorted.begin(), sorted.end(),
              [](const IndexEntry& a, const IndexEntry& b) { return a.address < b.address; });

    TableFooter footer;
    footer.chunk_count = static_cast<uint32_t>(sorted.size());
    footer.index_size = index_size(footer.chunk_count);
    for (const auto& e : sorted) {
        footer.total_uncompressed += e.length;
    }

    BuiltTable out;
    out.chunk_count = footer.chunk_count;
    out.bytes.resize(data_.size() + footer.index_size + table_format::kFooterSize);

    std::copy(data_.begin(), data_.end(), out.bytes.begin());
    uint8_t* index = out.bytes.data() + data_.size();
    for (size_t i = 0; i < sorted.size(); i++) {
        sorted[i].encode(index + i * table_format::kIndexEntrySize);
    }
    footer.index_checksum = util::crc32c(index, footer.index_size);
    footer.encode(index + footer.index_size);

    out.name = Address::of(out.bytes);
    return out;
}

} // namespace table
} // namespace chunkstore
