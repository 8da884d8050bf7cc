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


#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "table/file_table_reader.h"
#include "util/metrics.h"
#include "../test_helpers.h"

using namespace chunkstore;
using namespace chunkstore::table;
namespace fs = std::filesystem;

class FileTableReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = test::create_temp_dir("chunkstore_file_table");
        chunks_ = test::make_chunks(25, 300);
        table_ = test::build_table(chunks_, &addresses_);
    }

    void TearDown() override {
        fs::remove_all(dir_);
    }

    std::string dir_;
    std::vector<std::vector<uint8_t>> chunks_;
    std::vector<Address> addresses_;
    BuiltTable table_;
};

TEST_F(FileTableReaderTest, WriteThenRead) {
    std::string path = write_table_file(dir_, table_);
    EXPECT_EQ(fs::path(path).filename().string(), table_.name.to_string());
    EXPECT_FALSE(fs::exists(path + files::kTempSuffix));
    EXPECT_EQ(fs::file_size(path), table_.bytes.size());

    FileTableReader reader(path, table_.chunk_count);
    EXPECT_EQ(reader.hash(), table_.name);
    EXPECT_EQ(reader.count(), 25u);
    EXPECT_EQ(reader.file_size(), table_.bytes.size());
    EXPECT_EQ(reader.uncompressed_len(), 25u * 300);

    for (size_t i = 0; i < chunks_.size(); i++) {
        auto got = reader.get(addresses_[i]);
        ASSERT_TRUE(got.has_value());
        EXPECT_EQ(*got, chunks_[i]);
    }

    size_t n = 0;
    reader.extract([&](const Address& a, Chunk&& c) {
        EXPECT_EQ(c, chunks_[n]);
        EXPECT_EQ(a, addresses_[n]);
        n++;
    });
    EXPECT_EQ(n, chunks_.size());
}

TEST_F(FileTableReaderTest, ReadAtStopsAtEndOfFile) {
    std::string path = write_table_file(dir_, table_);
    FileTableReader reader(path, table_.chunk_count);

    std::vector<uint8_t> buf(100);
    EXPECT_EQ(reader.read_at(buf.data(), buf.size(), table_.bytes.size() - 40), 40u);
    EXPECT_EQ(reader.read_at(buf.data(), buf.size(), table_.bytes.size() + 10), 0u);

    reader.close();
    EXPECT_THROW(reader.read_at(buf.data(), buf.size(), 0), IoError);
}

TEST_F(FileTableReaderTest, IoFailuresAreStoreErrors) {
    std::string path = write_table_file(dir_, table_);
    FileTableReader reader(path, table_.chunk_count);
    reader.close();

    try {
        reader.get(addresses_[0]);
        FAIL() << "read of a closed table file succeeded";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }

    std::string missing = (fs::path(dir_) / Address::of(std::string("absent")).to_string()).string();
    try {
        FileTableReader other(missing, 1);
        FAIL() << "opened a missing table file";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }

    try {
        write_table_file((fs::path(dir_) / "no-such-dir").string(), table_);
        FAIL() << "wrote into a missing directory";
    } catch (const StoreError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Io);
    }
}

TEST_F(FileTableReaderTest, CacheIsSeededAndReused) {
    std::string path = write_table_file(dir_, table_);
    IndexCache cache;

    uint64_t before = util::metrics::index_bootstraps.value();
    {
        FileTableReader first(path, table_.chunk_count, &cache);
        EXPECT_EQ(first.count(), 25u);
    }
    EXPECT_EQ(util::metrics::index_bootstraps.value(), before + 1);
    ASSERT_NE(cache.get(table_.name), nullptr);

    FileTableReader second(path, table_.chunk_count, &cache);
    EXPECT_EQ(util::metrics::index_bootstraps.value(), before + 1);
    EXPECT_EQ(second.index(), cache.get(table_.name));
}

TEST_F(FileTableReaderTest, ChunkCountMismatch) {
    std::string path = write_table_file(dir_, table_);
    IndexCache cache;
    FileTableReader ok(path, table_.chunk_count, &cache);

    // Cached index with a different count
    EXPECT_THROW(FileTableReader(path, table_.chunk_count + 1, &cache), IntegrityMismatchError);
}

TEST_F(FileTableReaderTest, WrongCountWithoutCacheIsCorrupt) {
    std::string path = write_table_file(dir_, table_);
    // The tail is sized for the wrong count, so the footer check fails
    EXPECT_THROW(FileTableReader(path, table_.chunk_count - 1), CorruptIndexError);
}

TEST_F(FileTableReaderTest, FileNameMustBeAnAddress) {
    std::string path = (fs::path(dir_) / "not-a-table").string();
    std::ofstream(path) << "x";
    EXPECT_THROW(FileTableReader(path, 1), std::invalid_argument);
}

TEST_F(FileTableReaderTest, MissingFile) {
    std::string path = (fs::path(dir_) / table_.name.to_string()).string();
    EXPECT_THROW(FileTableReader(path, table_.chunk_count), IoError);
}

TEST_F(FileTableReaderTest, FileTooShortForIndex) {
    std::string path = (fs::path(dir_) / table_.name.to_string()).string();
    std::ofstream(path, std::ios::binary) << "short";
    EXPECT_THROW(FileTableReader(path, table_.chunk_count), CorruptIndexError);
}

TEST_F(FileTableReaderTest, CorruptPayloadFailsOnRead) {
    std::string path = write_table_file(dir_, table_);
    std::vector<uint8_t> damaged = table_.bytes;
    damaged[10] ^= 0x55;
    {
        std::ofstream out(path, std::ios::binary | std::ios::trunc);
        out.write(reinterpret_cast<const char*>(damaged.data()), damaged.size());
    }

    FileTableReader reader(path, table_.chunk_count);
    EXPECT_THROW(reader.get(addresses_[0]), IntegrityMismatchError);
    EXPECT_EQ(*reader.get(addresses_[1]), chunks_[1]);
}
