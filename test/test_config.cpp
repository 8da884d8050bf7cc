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
#include <cstdlib>
#include "config.h"
#include "errors.h"
#include "store_config.h"

using namespace chunkstore;

class ConfigTest : public ::testing::Test {
protected:
    void TearDown() override {
        for (const char* var : {"CHUNKSTORE_READ_CONCURRENCY", "CHUNKSTORE_BLOCK_SIZE",
                                "CHUNKSTORE_INDEX_CACHE_BYTES", "CHUNKSTORE_INDEX_CACHE_SHARDS",
                                "CHUNKSTORE_BACKOFF_MIN_US", "CHUNKSTORE_BACKOFF_MAX_MS",
                                "CHUNKSTORE_PART_SIZE"}) {
            unsetenv(var);
        }
    }
};

TEST_F(ConfigTest, TableFormatConstants) {
    EXPECT_EQ(table_format::kAddressSize, 20u);
    EXPECT_EQ(table_format::kIndexEntrySize, 36u);
    EXPECT_EQ(table_format::kFooterSize, 36u);
    EXPECT_EQ(table_format::kMagic, 0x3153454C42415443ULL);

    // The magic reads "CTABLES1" as little-endian bytes
    const char expected[] = "CTABLES1";
    for (int i = 0; i < 8; i++) {
        EXPECT_EQ(static_cast<char>((table_format::kMagic >> (8 * i)) & 0xFF), expected[i]);
    }
}

TEST_F(ConfigTest, RemoteDefaults) {
    EXPECT_EQ(remote::kBlockSize, 512u * 1024);
    EXPECT_EQ(remote::kBackoffMinMicros, 128u);
    EXPECT_EQ(remote::kBackoffMaxMicros, 1024u * 1000);
    EXPECT_DOUBLE_EQ(remote::kBackoffFactor, 2.0);
    EXPECT_LT(remote::kMinPartSize, remote::kDefaultPartSize);
}

TEST_F(ConfigTest, DefaultsValidate) {
    StoreConfig cfg = StoreConfig::defaults();
    EXPECT_TRUE(cfg.validate());
    EXPECT_EQ(cfg.block_size, remote::kBlockSize);
    EXPECT_EQ(cfg.read_concurrency, remote::kDefaultReadConcurrency);

    EXPECT_TRUE(StoreConfig::low_latency().validate());
    EXPECT_TRUE(StoreConfig::low_memory().validate());
}

TEST_F(ConfigTest, EnvironmentOverrides) {
    setenv("CHUNKSTORE_READ_CONCURRENCY", "4", 1);
    setenv("CHUNKSTORE_BLOCK_SIZE", "65536", 1);
    setenv("CHUNKSTORE_BACKOFF_MAX_MS", "10", 1);
    setenv("CHUNKSTORE_INDEX_CACHE_SHARDS", "2", 1);

    StoreConfig cfg = StoreConfig::defaults();
    EXPECT_EQ(cfg.read_concurrency, 4u);
    EXPECT_EQ(cfg.block_size, 65536u);
    EXPECT_EQ(cfg.backoff_max_us, 10000u);
    EXPECT_EQ(cfg.index_cache_shards, 2u);
    EXPECT_TRUE(cfg.validate());
}

TEST_F(ConfigTest, ValidateRejectsBadValues) {
    StoreConfig cfg;
    cfg.read_concurrency = 0;
    EXPECT_FALSE(cfg.validate());

    cfg = StoreConfig();
    cfg.backoff_max_us = cfg.backoff_min_us - 1;
    EXPECT_FALSE(cfg.validate());

    cfg = StoreConfig();
    cfg.backoff_factor = 0.5;
    EXPECT_FALSE(cfg.validate());

    cfg = StoreConfig();
    cfg.part_size = 1024;
    EXPECT_FALSE(cfg.validate());
}

TEST_F(ConfigTest, ErrorKinds) {
    ShortReadError e("short", 10, 4);
    EXPECT_EQ(e.kind(), ErrorKind::ShortRead);
    EXPECT_EQ(e.expected(), 10u);
    EXPECT_EQ(e.actual(), 4u);
    EXPECT_STREQ(to_string(e.kind()), "ShortRead");

    ObjectNotFoundError nf("missing");
    EXPECT_EQ(nf.kind(), ErrorKind::Network);
    EXPECT_EQ(nf.status(), 404);

    try {
        throw TransientNetworkError("reset");
    } catch (const StoreError& se) {
        EXPECT_EQ(se.kind(), ErrorKind::TransientNetwork);
    }
}
