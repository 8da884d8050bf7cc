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
#include "index_cache.h"
#include "table_reader.h"
#include "table_writer.h"

namespace chunkstore {
namespace table {

/**
 * Table file on local disk. The file name is the table's address.
 *
 * On construction the index comes from the cache or, on a miss, from one
 * read of the file's tail; either way the index must describe exactly
 * expected_count chunks. I/O failures throw IoError.
 *
 * Reads may run concurrently; close() must not overlap with them.
 */
class FileTableReader : public ReadAtSource, public ChunkSource {
public:
    FileTableReader(const std::string& path, uint32_t expected_count,
                    IndexCache* cache = nullptr,
                    uint64_t block_size = remote::kBlockSize);
    ~FileTableReader() override;

    FileTableReader(const FileTableReader&) = delete;
    FileTableReader& operator=(const FileTableReader&) = delete;

    // pread(2), retried on EINTR; stops early only at end of file
    size_t read_at(uint8_t* buf, size_t len, uint64_t offset) const override;

    bool has(const Address& a) const override { return reader_->has(a); }
    bool has_many(const std::vector<Address>& a) const override { return reader_->has_many(a); }
    std::optional<Chunk> get(const Address& a) const override { return reader_->get(a); }
    std::vector<Address> get_many(const std::vector<Address>& a,
                                  const ChunkCallback& on_found) const override {
        return reader_->get_many(a, on_found);
    }
    size_t calc_reads(const std::vector<Address>& a) const override { return reader_->calc_reads(a); }
    void extract(const ChunkCallback& on_chunk) const override { reader_->extract(on_chunk); }
    uint32_t count() const override { return reader_->count(); }
    uint64_t uncompressed_len() const override { return reader_->uncompressed_len(); }
    const Address& hash() const override { return reader_->hash(); }
    std::shared_ptr<const TableIndex> index() const override { return reader_->index(); }

    const std::string& path() const { return path_; }
    uint64_t file_size() const { return file_size_; }

    // Releases the descriptor; later reads throw IoError. Not safe to call
    // while other threads are reading.
    void close();

private:
    std::shared_ptr<const TableIndex> bootstrap(uint32_t expected_count, IndexCache* cache);

    std::string path_;
    Address name_;
    int fd_ = -1;
    uint64_t file_size_ = 0;
    std::unique_ptr<TableReader> reader_;
};

/**
 * Writes table to <dir>/<address> through a temporary file, fsync and
 * rename, so readers never observe a partial table. Returns the final path.
 */
std::string write_table_file(const std::string& dir, const BuiltTable& table);

} // namespace table
} // namespace chunkstore
