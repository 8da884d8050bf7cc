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
#include <gmock/gmock.h>
#include "remote/remote_table_persister.h"
#include "mock_object_store.h"
#include "../test_helpers.h"

using namespace chunkstore;
using namespace chunkstore::remote;
using chunkstore::table::Address;
using ::testing::_;
using ::testing::Invoke;
using ::testing::NiceMock;

class RemoteTablePersisterTest : public ::testing::Test {
protected:
    void SetUp() override {
        chunks_ = test::make_chunks(40, 500);
        table_ = test::build_table(chunks_, &addresses_);
        mock_ = std::make_shared<NiceMock<test::MockObjectStore>>();
        mock_->delegate_to(fake_);
    }

    RemoteReaderOptions options() {
        RemoteReaderOptions o;
        o.backoff.jitter = false;
        o.sleeper = std::make_shared<test::RecordingSleeper>();
        return o;
    }

    static constexpr const char* kBucket = "tables";

    std::vector<std::vector<uint8_t>> chunks_;
    std::vector<Address> addresses_;
    table::BuiltTable table_;
    MemoryObjectStore fake_;
    std::shared_ptr<NiceMock<test::MockObjectStore>> mock_;
};

TEST_F(RemoteTablePersisterTest, SmallTableUsesSinglePut) {
    RemoteTablePersister persister(mock_, kBucket, nullptr, table_.bytes.size() + 1);
    EXPECT_CALL(*mock_, put_object(kBucket, table_.name.to_string(), _, table_.bytes.size()));
    EXPECT_CALL(*mock_, create_multipart_upload(_, _)).Times(0);

    EXPECT_EQ(persister.persist(table_), table_.name);
    EXPECT_EQ(*fake_.object(kBucket, table_.name.to_string()), table_.bytes);
}

TEST_F(RemoteTablePersisterTest, LargeTableUsesOrderedParts) {
    const size_t part = 4096;
    RemoteTablePersister persister(mock_, kBucket, nullptr, part);
    size_t expected_parts = (table_.bytes.size() + part - 1) / part;

    std::vector<int> numbers;
    EXPECT_CALL(*mock_, upload_part(kBucket, table_.name.to_string(), _, _, _, _))
        .Times(static_cast<int>(expected_parts))
        .WillRepeatedly(Invoke([&](const std::string& b, const std::string& k,
                                   const std::string& id, int n,
                                   const uint8_t* data, size_t len) {
            numbers.push_back(n);
            if (static_cast<size_t>(n) < expected_parts) {
                EXPECT_EQ(len, part);
            }
            return fake_.upload_part(b, k, id, n, data, len);
        }));
    EXPECT_CALL(*mock_, put_object(_, _, _, _)).Times(0);

    persister.persist(table_);

    for (size_t i = 0; i < numbers.size(); i++) {
        EXPECT_EQ(numbers[i], static_cast<int>(i + 1));
    }
    EXPECT_EQ(*fake_.object(kBucket, table_.name.to_string()), table_.bytes);
    EXPECT_EQ(fake_.counters().multipart_completes, 1u);
    EXPECT_EQ(fake_.pending_uploads(), 0u);
}

TEST_F(RemoteTablePersisterTest, TableOfExactlyPartSizeIsMultipart) {
    RemoteTablePersister persister(mock_, kBucket, nullptr, table_.bytes.size());
    persister.persist(table_);
    EXPECT_EQ(fake_.counters().multipart_creates, 1u);
    EXPECT_EQ(fake_.counters().parts_uploaded, 1u);
    EXPECT_EQ(fake_.counters().puts, 0u);
}

TEST_F(RemoteTablePersisterTest, FailedPartAbortsUpload) {
    RemoteTablePersister persister(mock_, kBucket, nullptr, 4096);

    int calls = 0;
    EXPECT_CALL(*mock_, upload_part(_, _, _, _, _, _))
        .WillRepeatedly(Invoke([&](const std::string& b, const std::string& k,
                                   const std::string& id, int n,
                                   const uint8_t* data, size_t len) {
            if (++calls == 3) {
                throw ObjectStoreError("slow down", 503);
            }
            return fake_.upload_part(b, k, id, n, data, len);
        }));
    EXPECT_CALL(*mock_, abort_multipart_upload(kBucket, table_.name.to_string(), _));
    EXPECT_CALL(*mock_, complete_multipart_upload(_, _, _, _)).Times(0);

    EXPECT_THROW(persister.persist(table_), ObjectStoreError);
    EXPECT_FALSE(fake_.contains(kBucket, table_.name.to_string()));
    EXPECT_EQ(fake_.pending_uploads(), 0u);
}

TEST_F(RemoteTablePersisterTest, AbortFailureKeepsOriginalError) {
    RemoteTablePersister persister(mock_, kBucket, nullptr, 4096);

    EXPECT_CALL(*mock_, complete_multipart_upload(_, _, _, _))
        .WillOnce(Invoke([](const std::string&, const std::string&, const std::string&,
                            const std::vector<CompletedPart>&) {
            throw TransientNetworkError("connection reset");
        }));
    EXPECT_CALL(*mock_, abort_multipart_upload(_, _, _))
        .WillOnce(Invoke([](const std::string&, const std::string&, const std::string&) {
            throw ObjectStoreError("abort failed", 500);
        }));

    EXPECT_THROW(persister.persist(table_), TransientNetworkError);
}

TEST_F(RemoteTablePersisterTest, SeedsCacheSoOpenNeedsNoBootstrap) {
    table::IndexCache cache;
    RemoteTablePersister persister(mock_, kBucket, &cache, kDefaultPartSize, nullptr, options());
    uint64_t persisted = util::metrics::tables_persisted.value();

    persister.persist(table_);
    EXPECT_NE(cache.get(table_.name), nullptr);
    EXPECT_EQ(util::metrics::tables_persisted.value(), persisted + 1);

    auto reader = persister.open(table_.name, table_.chunk_count);
    EXPECT_EQ(fake_.counters().gets, 0u);

    auto got = reader->get(addresses_[17]);
    ASSERT_TRUE(got.has_value());
    EXPECT_EQ(*got, chunks_[17]);
    EXPECT_EQ(fake_.counters().gets, 1u);
}

TEST_F(RemoteTablePersisterTest, OpenWithoutCacheBootstraps) {
    RemoteTablePersister persister(mock_, kBucket, nullptr, kDefaultPartSize, nullptr, options());
    persister.persist(table_);

    auto reader = persister.open(table_.name, table_.chunk_count);
    EXPECT_EQ(fake_.counters().gets, 1u);
    EXPECT_EQ(reader->count(), table_.chunk_count);

    size_t n = 0;
    reader->extract([&](const Address&, table::Chunk&& c) {
        EXPECT_EQ(c, chunks_[n]);
        n++;
    });
    EXPECT_EQ(n, chunks_.size());
}

TEST_F(RemoteTablePersisterTest, MalformedTableNeverUploaded) {
    RemoteTablePersister persister(mock_, kBucket);
    EXPECT_CALL(*mock_, put_object(_, _, _, _)).Times(0);
    EXPECT_CALL(*mock_, create_multipart_upload(_, _)).Times(0);

    table::BuiltTable broken = table_;
    broken.bytes.back() ^= 0xFF;
    EXPECT_THROW(persister.persist(broken), CorruptIndexError);

    broken.bytes.resize(3);
    EXPECT_THROW(persister.persist(broken), CorruptIndexError);
}

TEST_F(RemoteTablePersisterTest, InvalidArguments) {
    EXPECT_THROW(RemoteTablePersister(nullptr, kBucket), std::invalid_argument);
    EXPECT_THROW(RemoteTablePersister(mock_, kBucket, nullptr, 0), std::invalid_argument);
}
