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
#include <unordered_set>
#include <vector>
#include "table_format.h"

namespace chunkstore {
namespace table {

// A serialized table file and the address it is stored under
struct BuiltTable {
    Address name;
    std::vector<uint8_t> bytes;
    uint32_t chunk_count = 0;
};

/**
 * Accumulates chunks in insertion order and serializes them as a
 * version 1 table file. Not thread safe.
 */
class TableWriter {
public:
    TableWriter() = default;

    // Adds data under its own content address
    Address add(const void* data, size_t len);
    Address add(const std::vector<uint8_t>& data) { return add(data.data(), data.size()); }
    Address add(const std::string& data) { return add(data.data(), data.size()); }

    // Adds data under a caller supplied address; false if already present
    bool add(const Address& address, const void* data, size_t len);
    bool add(const Address& address, const std::vector<uint8_t>& data) {
        return add(address, data.data(), data.size());
    }

    uint32_t chunk_count() const { return static_cast<uint32_t>(entries_.size()); }
    uint64_t data_size() const { return data_.size(); }

    // Serializes everything added so far; the writer stays usable
    BuiltTable finish() const;

private:
    std::vector<uint8_t> data_;
    std::vector<IndexEntry> entries_;     // insertion order
    std::unordered_set<Address, AddressHash> seen_;
};

} // namespace table
} // namespace chunkstore
