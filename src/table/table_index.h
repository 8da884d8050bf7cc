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
#include <optional>
#include <vector>
#include "table_format.h"

namespace chunkstore {
namespace table {

/**
 * Parsed index of one table file. Immutable once built; shared between
 * readers and the index cache through shared_ptr<const TableIndex>.
 */
class TableIndex {
public:
    TableIndex() = default;

    /**
     * Parses the tail of a table file (index region followed by footer).
     * len must be exactly index_size + footer size. Throws CorruptIndexError
     * when any structural check fails.
     */
    static TableIndex parse(const uint8_t* buf, size_t len);
    static TableIndex parse(const std::vector<uint8_t>& tail) {
        return parse(tail.data(), tail.size());
    }

    // Binary search by address; absence is a normal result
    std::optional<IndexEntry> lookup(const Address& address) const;
    bool contains(const Address& address) const { return lookup(address).has_value(); }

    uint32_t count() const { return footer_.chunk_count; }
    uint64_t total_uncompressed() const { return footer_.total_uncompressed; }
    const TableFooter& footer() const { return footer_; }
    const std::vector<IndexEntry>& entries() const { return entries_; }

    // Approximate heap footprint, used for cache budgeting
    size_t memory_usage() const {
        return sizeof(TableIndex) + entries_.capacity() * sizeof(IndexEntry);
    }

    bool operator==(const TableIndex& o) const {
        return footer_.chunk_count == o.footer_.chunk_count &&
               footer_.total_uncompressed == o.footer_.total_uncompressed &&
               entries_ == o.entries_;
    }
    bool operator!=(const TableIndex& o) const { return !(*this == o); }

private:
    TableFooter footer_;
    std::vector<IndexEntry> entries_;   // strictly ascending by address
};

} // namespace table
} // namespace chunkstore
