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
#include <functional>
#include <memory>
#include <optional>
#include <vector>
#include "address.h"
#include "table_index.h"

namespace chunkstore {
namespace table {

using Chunk = std::vector<uint8_t>;

// Receives each chunk found by a batch read, in file order
using ChunkCallback = std::function<void(const Address&, Chunk&&)>;

/**
 * Read side of one table file, independent of where its bytes live.
 */
class ChunkSource {
public:
    virtual ~ChunkSource() = default;

    virtual bool has(const Address& address) const = 0;

    // True only if every address is present
    virtual bool has_many(const std::vector<Address>& addresses) const = 0;

    virtual std::optional<Chunk> get(const Address& address) const = 0;

    // Reports found chunks through on_found; returns the addresses not in this table
    virtual std::vector<Address> get_many(const std::vector<Address>& addresses,
                                          const ChunkCallback& on_found) const = 0;

    // Number of ranged reads get_many would issue
    virtual size_t calc_reads(const std::vector<Address>& addresses) const = 0;

    // Every chunk, in data region order
    virtual void extract(const ChunkCallback& on_chunk) const = 0;

    virtual uint32_t count() const = 0;
    virtual uint64_t uncompressed_len() const = 0;

    // Address of the table file
    virtual const Address& hash() const = 0;

    virtual std::shared_ptr<const TableIndex> index() const = 0;
};

} // namespace table
} // namespace chunkstore
