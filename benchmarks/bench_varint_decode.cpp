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


/*
 * Compares the canonical loop decoder with the unrolled decoder over
 * streams of mixed-length varints
 */

#include <gtest/gtest.h>
#include <chrono>
#include <iostream>
#include <random>
#include <vector>
#include "codec/varint.h"

using namespace chunkstore::codec;

class VarintDecodeBenchmark : public ::testing::Test {
protected:
    void SetUp() override {
        std::mt19937_64 rng(12345);
        // Mostly short values, like lengths and counts in real payloads
        std::uniform_int_distribution<int> width(0, 63);
        for (size_t i = 0; i < kValues; i++) {
            uint64_t v = rng() >> width(rng);
            uint8_t tmp[kMaxVarintLen64];
            size_t n = put_uvarint(tmp, v);
            stream_.insert(stream_.end(), tmp, tmp + n);
        }
        // Padding lets the unrolled decoder read ahead at the tail
        stream_.resize(stream_.size() + kMaxVarintLen64, 0);
    }

    static constexpr size_t kValues = 2000000;
    std::vector<uint8_t> stream_;
};

TEST_F(VarintDecodeBenchmark, CanonicalVersusUnrolled) {
    const int rounds = 5;
    uint64_t canonical_sum = 0;
    uint64_t unrolled_sum = 0;

    auto start = std::chrono::high_resolution_clock::now();
    for (int r = 0; r < rounds; r++) {
        size_t pos = 0;
        for (size_t i = 0; i < kValues; i++) {
            uint64_t v = 0;
            int n = decode_uvarint(stream_.data() + pos, stream_.size() - pos, v);
            ASSERT_GT(n, 0);
            pos += static_cast<size_t>(n);
            canonical_sum += v;
        }
    }
    auto canonical_time = std::chrono::high_resolution_clock::now() - start;

    start = std::chrono::high_resolution_clock::now();
    for (int r = 0; r < rounds; r++) {
        size_t pos = 0;
        for (size_t i = 0; i < kValues; i++) {
            auto res = unrolled_decode_uvarint(stream_.data() + pos);
            ASSERT_GT(res.second, 0);
            pos += static_cast<size_t>(res.second);
            unrolled_sum += res.first;
        }
    }
    auto unrolled_time = std::chrono::high_resolution_clock::now() - start;

    EXPECT_EQ(canonical_sum, unrolled_sum);

    auto canonical_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(canonical_time).count();
    auto unrolled_ns = std::chrono::duration_cast<std::chrono::nanoseconds>(unrolled_time).count();
    double total = static_cast<double>(kValues) * rounds;

    std::cout << "\nVarint decode (" << kValues << " values x " << rounds << " rounds, "
              << stream_.size() << " bytes):\n";
    std::cout << "  Canonical: " << canonical_ns / total << " ns/value\n";
    std::cout << "  Unrolled:  " << unrolled_ns / total << " ns/value\n";
    std::cout << "  Speedup:   " << static_cast<double>(canonical_ns) / unrolled_ns << "x\n";
}

TEST_F(VarintDecodeBenchmark, SignedDecode) {
    std::vector<uint8_t> buf;
    std::mt19937_64 rng(99);
    std::vector<int64_t> expected;
    for (int i = 0; i < 500000; i++) {
        int64_t v = static_cast<int64_t>(rng()) >> (rng() % 64);
        uint8_t tmp[kMaxVarintLen64];
        size_t n = put_varint(tmp, v);
        buf.insert(buf.end(), tmp, tmp + n);
        expected.push_back(v);
    }
    buf.resize(buf.size() + kMaxVarintLen64, 0);

    auto start = std::chrono::high_resolution_clock::now();
    size_t pos = 0;
    for (size_t i = 0; i < expected.size(); i++) {
        auto res = unrolled_decode_varint(buf.data() + pos);
        ASSERT_EQ(res.first, expected[i]);
        pos += static_cast<size_t>(res.second);
    }
    auto elapsed = std::chrono::high_resolution_clock::now() - start;

    std::cout << "\nSigned unrolled decode: "
              << std::chrono::duration_cast<std::chrono::microseconds>(elapsed).count()
              << " us for " << expected.size() << " values\n";
}
