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


#include "table_reader.h"
#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include "../errors.h"
#include "../util/checksums.h"
#include "../util/log.h"

namespace chunkstore {
namespace table {

TableReader::TableReader(const Address& name,
                         std::shared_ptr<const TableIndex> index,
                         const ReadAtSource& source,
                         uint64_t block_size)
    : name_(name), index_(std::move(index)), source_(source), block_size_(block_size) {
    if (!index_) {
        throw std::invalid_argument("TableReader: index is required");
    }
}

bool TableReader::has(const Address& address) const {
    return index_->contains(address);
}

bool TableReader::has_many(const std::vector<Address>& addresses) const {
    for (const auto& a : addresses) {
        if (!index_->contains(a)) return false;
    }
    return true;
}

std::optional<Chunk> TableReader::get(const Address& address) const {
    auto entry = index_->lookup(address);
    if (!entry) {
        return std::nullopt;
    }

    Chunk data(entry->length);
    read_exact(data.data(), data.size(), entry->offset);
    verify(*entry, data.data());
    return data;
}

std::vector<Address> TableReader::get_many(const std::vector<Address>& addresses,
                                           const ChunkCallback& on_found) const {
    std::vector<Address> missing;
    std::vector<IndexEntry> found = resolve(addresses, &missing);
    for (const auto& batch : plan_reads(found)) {
        read_batch(batch, on_found);
    }
    return missing;
}

size_t TableReader::calc_reads(const std::vector<Address>& addresses) const {
    return plan_reads(resolve(addresses, nullptr)).size();
}

void TableReader::extract(const ChunkCallback& on_chunk) const {
    std::vector<IndexEntry> sorted = index_->entries();
    std::sort(sorted.begin(), sorted.end(),
              [](const IndexEntry& a, const IndexEntry& b) { return a.offset < b.offset; });

    // Windows of at most block_size bytes; a larger chunk is read alone
    std::vector<Batch> batches;
    for (const auto& e : sorted) {
        if (!batches.empty()) {
            Batch& cur = batches.back();
            if (e.offset >= cur.end && e.end() - cur.offset <= block_size_) {
                cur.end = e.end();
                cur.entries.push_back(e);
                continue;
            }
        }
        batches.push_back(Batch{e.offset, e.end(), {e}});
    }

    for (const auto& batch : batches) {
        read_batch(batch, on_chunk);
    }
}

std::vector<IndexEntry> TableReader::resolve(const std::vector<Address>& addresses,
                                             std::vector<Address>* missing) const {
    std::vector<IndexEntry> found;
    found.reserve(addresses.size());
    std::unordered_set<Address, AddressHash> seen;

    for (const auto& a : addresses) {
        if (!seen.insert(a).second) {
            continue;
        }
        auto entry = index_->lookup(a);
        if (entry) {
            found.push_back(*entry);
        } else if (missing) {
            missing->push_back(a);
        }
    }

    std::sort(found.begin(), found.end(),
              [](const IndexEntry& a, const IndexEntry& b) { return a.offset < b.offset; });
    return found;
}

std::vector<TableReader::Batch> TableReader::plan_reads(const std::vector<IndexEntry>& sorted) const {
    std::vector<Batch> batches;
    for (const auto& e : sorted) {
        if (!batches.empty()) {
            Batch& cur = batches.back();
            if (e.offset >= cur.end && e.offset - cur.end <= block_size_) {
                cur.end = e.end();
                cur.entries.push_back(e);
                continue;
            }
        }
        batches.push_back(Batch{e.offset, e.end(), {e}});
    }
    return batches;
}

void TableReader::read_batch(const Batch& batch, const ChunkCallback& on_chunk) const {
    std::vector<uint8_t> buf(batch.end - batch.offset);
    read_exact(buf.data(), buf.size(), batch.offset);

    for (const auto& e : batch.entries) {
        const uint8_t* p = buf.data() + (e.offset - batch.offset);
        verify(e, p);
        on_chunk(e.address, Chunk(p, p + e.length));
    }
}

void TableReader::read_exact(uint8_t* buf, size_t len, uint64_t offset) const {
    if (len == 0) return;
    size_t n = source_.read_at(buf, len, offset);
    if (n < len) {
        error() << "table " << name_.to_string() << ": short read at offset " << offset
                << ", wanted " << len << " bytes, got " << n;
        throw ShortReadError("short read from table " + name_.to_string(), len, n);
    }
}

void TableReader::verify(const IndexEntry& entry, const uint8_t* data) const {
    uint32_t crc = util::crc32c(data, entry.length);
    if (crc != entry.checksum) {
        error() << "table " << name_.to_string() << ": checksum mismatch for chunk "
                << entry.address.to_string();
        throw IntegrityMismatchError("chunk " + entry.address.to_string() +
                                     " failed its checksum in table " + name_.to_string());
    }
}

} // namespace table
} // namespace chunkstore
