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
#include <set>
#include <unordered_set>
#include "table/address.h"

using namespace chunkstore::table;

TEST(AddressTest, DigestIsTruncatedSha512) {
    // SHA-512("abc") = ddaf35a193617aba cc417349ae204131 12e6fa4e...
    Address a = Address::of(std::string("abc"));
    const uint8_t expected[8] = {0xdd, 0xaf, 0x35, 0xa1, 0x93, 0x61, 0x7a, 0xba};
    for (int i = 0; i < 8; i++) {
        EXPECT_EQ(a.data()[i], expected[i]);
    }
    EXPECT_EQ(a.prefix(), 0xddaf35a193617abaULL);
}

TEST(AddressTest, StringRoundTrip) {
    Address a = Address::of(std::string("hello"));
    std::string s = a.to_string();
    EXPECT_EQ(s.size(), 32u);
    for (char c : s) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'v')) << s;
    }

    auto parsed = Address::parse(s);
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, a);
}

TEST(AddressTest, EmptyAddressRendersAsZeros) {
    Address empty;
    EXPECT_TRUE(empty.is_empty());
    EXPECT_EQ(empty.to_string(), std::string(32, '0'));
    EXPECT_FALSE(Address::of(std::string("x")).is_empty());
}

TEST(AddressTest, ParseRejectsMalformed) {
    EXPECT_FALSE(Address::parse("").has_value());
    EXPECT_FALSE(Address::parse(std::string(31, '0')).has_value());
    EXPECT_FALSE(Address::parse(std::string(33, '0')).has_value());
    EXPECT_FALSE(Address::parse(std::string(31, '0') + "w").has_value());
    EXPECT_FALSE(Address::parse(std::string(31, '0') + "A").has_value());
}

TEST(AddressTest, OrderingMatchesBytesAndStrings) {
    std::vector<Address> addrs;
    for (int i = 0; i < 100; i++) {
        addrs.push_back(Address::of(std::to_string(i)));
    }
    std::set<Address> sorted(addrs.begin(), addrs.end());
    EXPECT_EQ(sorted.size(), addrs.size());

    // The base32 alphabet is in ASCII order, so string order follows byte order
    const Address* prev = nullptr;
    for (const auto& a : sorted) {
        if (prev) {
            EXPECT_LT(*prev, a);
            EXPECT_LT(prev->to_string(), a.to_string());
            EXPECT_LE(prev->prefix(), a.prefix());
        }
        prev = &a;
    }

    std::unordered_set<Address> hashed(addrs.begin(), addrs.end());
    EXPECT_EQ(hashed.size(), addrs.size());
}
