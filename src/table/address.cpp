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


#include "address.h"
#include <openssl/evp.h>
#include <stdexcept>
#include "../util/endian.hpp"

namespace chunkstore {
namespace table {

namespace {
    constexpr char kAlphabet[] = "0123456789abcdefghijklmnopqrstuv";

    int decode_char(char c) {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'v') return c - 'a' + 10;
        return -1;
    }
}

Address Address::of(const void* data, size_t len) {
    unsigned char md[EVP_MAX_MD_SIZE];
    unsigned int md_len = 0;
    if (EVP_Digest(data, len, md, &md_len, EVP_sha512(), nullptr) != 1 || md_len < kSize) {
        throw std::runtime_error("Address: SHA-512 digest failed");
    }
    return from_bytes(md);
}

// 160 bits map onto exactly 32 five-bit symbols, most significant bit first
std::string Address::to_string() const {
    std::string out;
    out.reserve(table_format::kAddressStringSize);
    uint32_t acc = 0;
    int bits = 0;
    for (uint8_t b : bytes_) {
        acc = (acc << 8) | b;
        bits += 8;
        while (bits >= 5) {
            bits -= 5;
            out.push_back(kAlphabet[(acc >> bits) & 0x1f]);
        }
    }
    return out;
}

std::optional<Address> Address::parse(const std::string& s) {
    if (s.size() != table_format::kAddressStringSize) {
        return std::nullopt;
    }
    Address a;
    uint32_t acc = 0;
    int bits = 0;
    size_t pos = 0;
    for (char c : s) {
        int v = decode_char(c);
        if (v < 0) {
            return std::nullopt;
        }
        acc = (acc << 5) | static_cast<uint32_t>(v);
        bits += 5;
        if (bits >= 8) {
            bits -= 8;
            a.bytes_[pos++] = static_cast<uint8_t>(acc >> bits);
        }
    }
    return a;
}

uint64_t Address::prefix() const {
    return util::load_be64(bytes_.data());
}

} // namespace table
} // namespace chunkstore
