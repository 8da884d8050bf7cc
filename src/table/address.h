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
#include <array>
#include <cstdint>
#include <cstring>
#include <functional>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "../config.h"

namespace chunkstore {
namespace table {

/**
 * Content address of a chunk or table file: the first 20 bytes of the
 * SHA-512 digest of the addressed bytes.
 *
 * Addresses order by unsigned lexicographic byte comparison; prefix()
 * preserves that order for the first 8 bytes.
 */
class Address {
public:
    static constexpr size_t kSize = table_format::kAddressSize;
    using Bytes = std::array<uint8_t, kSize>;

    Address() { bytes_.fill(0); }
    explicit Address(const Bytes& bytes) : bytes_(bytes) {}

    // Caller guarantees kSize readable bytes
    static Address from_bytes(const uint8_t* bytes) {
        Address a;
        std::memcpy(a.bytes_.data(), bytes, kSize);
        return a;
    }

    // Hash of data; throws std::runtime_error if the digest cannot be computed
    static Address of(const void* data, size_t len);
    static Address of(const std::vector<uint8_t>& data) {
        return of(data.data(), data.size());
    }
    static Address of(const std::string& data) {
        return of(data.data(), data.size());
    }

    // Inverse of to_string(); empty on wrong length or characters
    static std::optional<Address> parse(const std::string& s);

    std::string to_string() const;

    // First 8 bytes, big-endian
    uint64_t prefix() const;

    bool is_empty() const {
        for (uint8_t b : bytes_) {
            if (b != 0) return false;
        }
        return true;
    }

    const uint8_t* data() const { return bytes_.data(); }
    const Bytes& bytes() const { return bytes_; }

    bool operator==(const Address& o) const { return bytes_ == o.bytes_; }
    bool operator!=(const Address& o) const { return bytes_ != o.bytes_; }
    bool operator<(const Address& o) const {
        return std::memcmp(bytes_.data(), o.bytes_.data(), kSize) < 0;
    }
    bool operator>(const Address& o) const { return o < *this; }
    bool operator<=(const Address& o) const { return !(o < *this); }
    bool operator>=(const Address& o) const { return !(*this < o); }

private:
    Bytes bytes_;
};

inline std::ostream& operator<<(std::ostream& os, const Address& a) {
    return os << a.to_string();
}

struct AddressHash {
    size_t operator()(const Address& a) const noexcept {
        // Addresses are uniformly distributed; the prefix is already a good hash
        return static_cast<size_t>(a.prefix());
    }
};

} // namespace table
} // namespace chunkstore

namespace std {
template <>
struct hash<chunkstore::table::Address> {
    size_t operator()(const chunkstore::table::Address& a) const noexcept {
        return chunkstore::table::AddressHash()(a);
    }
};
} // namespace std
