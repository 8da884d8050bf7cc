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
#include <thread>
#include "remote/memory_object_store.h"
#include "errors.h"
#include "../test_helpers.h"

using namespace chunkstore;
using namespace chunkstore::remote;

namespace {
    std::vector<uint8_t> read_all(GetObjectResponse& resp) {
        std::vector<uint8_t> out(resp.content_length > 0 ? resp.content_length : 0);
        size_t n = read_full(*resp.body, out.data(), out.size());
        out.resize(n);
        return out;
    }
}

TEST(RangeHeaderTest, Format) {
    EXPECT_EQ(format_range(0, 1), "bytes=0-0");
    EXPECT_EQ(format_range(100, 50), "bytes=100-149");
    EXPECT_EQ(format_suffix_range(72), "bytes=-72");
    EXPECT_THROW(format_range(10, 0), std::invalid_argument);
}

TEST(RangeHeaderTest, Parse) {
    using R = std::optional<std::pair<uint64_t, uint64_t>>;
    EXPECT_EQ(parse_range("bytes=0-9", 100), R(std::make_pair(0ull, 9ull)));
    EXPECT_EQ(parse_range("bytes=90-200", 100), R(std::make_pair(90ull, 99ull)));
    EXPECT_EQ(parse_range("bytes=10-", 100), R(std::make_pair(10ull, 99ull)));
    EXPECT_EQ(parse_range("bytes=-30", 100), R(std::make_pair(70ull, 99ull)));
    EXPECT_EQ(parse_range("bytes=-300", 100), R(std::make_pair(0ull, 99ull)));
}

TEST(RangeHeaderTest, ParseRejectsUnsatisfiable) {
    EXPECT_FALSE(parse_range("bytes=100-120", 100));
    EXPECT_FALSE(parse_range("bytes=-0", 100));
    EXPECT_FALSE(parse_range("bytes=-5", 0));
    EXPECT_FALSE(parse_range("bytes=9-3", 100));
    EXPECT_FALSE(parse_range("items=0-9", 100));
    EXPECT_FALSE(parse_range("bytes=a-9", 100));
    EXPECT_FALSE(parse_range("bytes=0-9,20-29", 100));
    EXPECT_FALSE(parse_range("bytes=99999999999999999999-", 100));
}

class MemoryObjectStoreTest : public ::testing::Test {
protected:
    MemoryObjectStore store_;
    std::vector<uint8_t> data_ = test::generate_test_data(1000, 7);
};

TEST_F(MemoryObjectStoreTest, PutAndGetWhole) {
    store_.put_object("b", "k", data_.data(), data_.size());
    EXPECT_TRUE(store_.contains("b", "k"));
    EXPECT_FALSE(store_.contains("other", "k"));

    auto resp = store_.get_object({"b", "k", ""});
    EXPECT_EQ(resp.content_length, 1000);
    EXPECT_EQ(read_all(resp), data_);
    EXPECT_EQ(store_.counters().gets, 1u);
    EXPECT_EQ(store_.counters().puts, 1u);
}

TEST_F(MemoryObjectStoreTest, RangedGet) {
    store_.put_object("b", "k", data_.data(), data_.size());

    auto resp = store_.get_object({"b", "k", format_range(100, 10)});
    EXPECT_EQ(resp.content_length, 10);
    auto got = read_all(resp);
    EXPECT_EQ(got, std::vector<uint8_t>(data_.begin() + 100, data_.begin() + 110));

    auto tail = store_.get_object({"b", "k", format_suffix_range(5)});
    EXPECT_EQ(read_all(tail), std::vector<uint8_t>(data_.end() - 5, data_.end()));

    ASSERT_EQ(store_.ranges().size(), 2u);
    EXPECT_EQ(store_.ranges()[0], "bytes=100-109");
}

TEST_F(MemoryObjectStoreTest, RangeLogIsBounded) {
    store_.put_object("b", "k", data_.data(), data_.size());
    size_t total = MemoryObjectStore::kMaxRecordedRanges + 10;
    for (size_t i = 0; i < total; i++) {
        store_.get_object({"b", "k", format_range(i % 100, 1)});
    }

    auto ranges = store_.ranges();
    ASSERT_EQ(ranges.size(), MemoryObjectStore::kMaxRecordedRanges);
    EXPECT_EQ(ranges.front(), format_range(10, 1));
    EXPECT_EQ(ranges.back(), format_range((total - 1) % 100, 1));
    EXPECT_EQ(store_.counters().gets, total);

    store_.clear_ranges();
    EXPECT_TRUE(store_.ranges().empty());
}

TEST_F(MemoryObjectStoreTest, Errors) {
    EXPECT_THROW(store_.get_object({"b", "missing", ""}), ObjectNotFoundError);

    store_.put_object("b", "k", data_.data(), data_.size());
    try {
        store_.get_object({"b", "k", "bytes=5000-5001"});
        FAIL() << "expected ObjectStoreError";
    } catch (const ObjectStoreError& e) {
        EXPECT_EQ(e.status(), 416);
    }
}

TEST_F(MemoryObjectStoreTest, BodySurvivesOverwrite) {
    store_.put_object("b", "k", data_.data(), data_.size());
    auto resp = store_.get_object({"b", "k", ""});

    std::vector<uint8_t> other(10, 0xEE);
    store_.put_object("b", "k", other.data(), other.size());
    EXPECT_EQ(read_all(resp), data_);
}

TEST_F(MemoryObjectStoreTest, MultipartUpload) {
    std::string id = store_.create_multipart_upload("b", "big");
    EXPECT_EQ(store_.pending_uploads(), 1u);

    std::vector<CompletedPart> parts;
    for (int i = 0; i < 4; i++) {
        std::string etag = store_.upload_part("b", "big", id, i + 1,
                                              data_.data() + i * 250, 250);
        EXPECT_FALSE(etag.empty());
        parts.push_back({i + 1, etag});
    }
    EXPECT_FALSE(store_.contains("b", "big"));

    store_.complete_multipart_upload("b", "big", id, parts);
    EXPECT_EQ(store_.pending_uploads(), 0u);
    EXPECT_EQ(*store_.object("b", "big"), data_);

    auto c = store_.counters();
    EXPECT_EQ(c.multipart_creates, 1u);
    EXPECT_EQ(c.parts_uploaded, 4u);
    EXPECT_EQ(c.multipart_completes, 1u);
}

TEST_F(MemoryObjectStoreTest, MultipartRejectsBadParts) {
    std::string id = store_.create_multipart_upload("b", "big");
    store_.upload_part("b", "big", id, 1, data_.data(), 10);
    store_.upload_part("b", "big", id, 2, data_.data(), 10);

    EXPECT_THROW(store_.upload_part("b", "big", id, 0, data_.data(), 10), ObjectStoreError);
    EXPECT_THROW(store_.upload_part("b", "big", "upload-999", 1, data_.data(), 10),
                 ObjectStoreError);
    EXPECT_THROW(store_.complete_multipart_upload("b", "big", id, {{2, ""}, {1, ""}}),
                 ObjectStoreError);
    EXPECT_THROW(store_.complete_multipart_upload("b", "big", id, {{1, ""}, {3, ""}}),
                 ObjectStoreError);
    EXPECT_EQ(store_.pending_uploads(), 1u);
}

TEST_F(MemoryObjectStoreTest, AbortDiscardsParts) {
    std::string id = store_.create_multipart_upload("b", "big");
    store_.upload_part("b", "big", id, 1, data_.data(), 10);
    store_.abort_multipart_upload("b", "big", id);

    EXPECT_EQ(store_.pending_uploads(), 0u);
    EXPECT_FALSE(store_.contains("b", "big"));
    EXPECT_EQ(store_.counters().multipart_aborts, 1u);
    EXPECT_THROW(store_.abort_multipart_upload("b", "big", id), ObjectStoreError);
}

TEST_F(MemoryObjectStoreTest, ConcurrentPutsAndGets) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 8; t++) {
        threads.emplace_back([this, t]() {
            std::string key = "k" + std::to_string(t);
            for (int i = 0; i < 100; i++) {
                store_.put_object("b", key, data_.data(), data_.size());
                auto resp = store_.get_object({"b", key, format_range(i, 1)});
                uint8_t byte = 0;
                EXPECT_EQ(read_full(*resp.body, &byte, 1), 1u);
                EXPECT_EQ(byte, data_[i]);
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }
    EXPECT_EQ(store_.object_count(), 8u);
    EXPECT_EQ(store_.counters().gets, 800u);
}
