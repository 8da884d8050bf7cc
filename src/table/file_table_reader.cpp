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


#include "file_table_reader.h"
#include <boost/filesystem.hpp>
#include <cerrno>
#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>
#include "../util/log.h"
#include "../util/metrics.h"

namespace chunkstore {
namespace table {

namespace fs = boost::filesystem;

FileTableReader::FileTableReader(const std::string& path, uint32_t expected_count,
                                 IndexCache* cache, uint64_t block_size)
    : path_(path) {
    auto name = Address::parse(fs::path(path).filename().string());
    if (!name) {
        throw std::invalid_argument("table file name is not an address: " + path);
    }
    name_ = *name;

    fd_ = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd_ < 0) {
        throw IoError("cannot open table file " + path + ": " + errnoWithDescription());
    }

    struct stat st;
    if (::fstat(fd_, &st) != 0) {
        int e = errno;
        close();
        throw IoError("cannot stat table file " + path + ": " + errnoWithDescription(e));
    }
    file_size_ = static_cast<uint64_t>(st.st_size);

    try {
        auto index = bootstrap(expected_count, cache);
        reader_ = std::make_unique<TableReader>(name_, std::move(index), *this, block_size);
    } catch (const std::exception&) {
        close();
        throw;
    }
}

FileTableReader::~FileTableReader() {
    close();
}

void FileTableReader::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

std::shared_ptr<const TableIndex> FileTableReader::bootstrap(uint32_t expected_count,
                                                             IndexCache* cache) {
    std::shared_ptr<const TableIndex> index;
    if (cache) {
        index = cache->get(name_);
    }

    if (!index) {
        uint64_t tail = table_tail_size(expected_count);
        if (tail > file_size_) {
            throw CorruptIndexError("table file " + path_ + " is " + std::to_string(file_size_) +
                                    " bytes, too short for " + std::to_string(expected_count) +
                                    " chunks");
        }

        std::vector<uint8_t> buf(tail);
        size_t n = read_at(buf.data(), buf.size(), file_size_ - tail);
        if (n != tail) {
            throw ShortReadError("short read of table index from " + path_, tail, n);
        }

        METRIC_COUNTER_INC(index_bootstraps);
        index = std::make_shared<const TableIndex>(TableIndex::parse(buf));
        if (cache) {
            cache->put(name_, index);
        }
    }

    if (index->count() != expected_count) {
        error() << "table " << name_.to_string() << ": index has " << index->count()
                << " chunks, expected " << expected_count;
        throw IntegrityMismatchError("table " + name_.to_string() + " has " +
                                     std::to_string(index->count()) + " chunks, expected " +
                                     std::to_string(expected_count));
    }
    return index;
}

size_t FileTableReader::read_at(uint8_t* buf, size_t len, uint64_t offset) const {
    if (fd_ < 0) {
        throw IoError("table file " + path_ + " is closed");
    }

    size_t done = 0;
    while (done < len) {
        ssize_t n = ::pread(fd_, buf + done, len - done, static_cast<off_t>(offset + done));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw IoError("read of " + path_ + " failed: " + errnoWithDescription());
        }
        if (n == 0) break;
        done += static_cast<size_t>(n);
    }
    return done;
}

std::string write_table_file(const std::string& dir, const BuiltTable& table) {
    fs::path final_path = fs::path(dir) / table.name.to_string();
    std::string temp = final_path.string() + files::kTempSuffix;

    int fd = ::open(temp.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw IoError("cannot create " + temp + ": " + errnoWithDescription());
    }

    auto fail = [&](const std::string& what) {
        int e = errno;
        ::close(fd);
        ::unlink(temp.c_str());
        throw IoError(what + " " + temp + ": " + errnoWithDescription(e));
    };

    size_t done = 0;
    const uint8_t* p = table.bytes.data();
    while (done < table.bytes.size()) {
        ssize_t n = ::write(fd, p + done, table.bytes.size() - done);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("write failed for");
        }
        done += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
        fail("fsync failed for");
    }
    if (::close(fd) != 0) {
        int e = errno;
        ::unlink(temp.c_str());
        throw IoError("close failed for " + temp + ": " + errnoWithDescription(e));
    }

    if (::rename(temp.c_str(), final_path.c_str()) != 0) {
        int e = errno;
        ::unlink(temp.c_str());
        throw IoError("cannot rename " + temp + ": " + errnoWithDescription(e));
    }

    int dfd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dfd < 0 || ::fsync(dfd) != 0) {
        warning() << "could not fsync directory " << dir << ": " << errnoWithDescription();
    }
    if (dfd >= 0) {
        ::close(dfd);
    }

    info() << "wrote table " << table.name.to_string() << " (" << table.chunk_count
           << " chunks, " << table.bytes.size() << " bytes)";
    return final_path.string();
}

} // namespace table
} // namespace chunkstore
