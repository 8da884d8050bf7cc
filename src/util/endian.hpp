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

#include <cstddef>
#include <cstdint>
#include <type_traits>

namespace chunkstore {
namespace util {

/**
 * Byte order helpers for the table file format.
 *
 * Fixed-width fields in table files (index entries, footer) are always
 * little-endian. Address prefixes are read big-endian so that numeric
 * order matches the lexicographic byte order of addresses.
 */

template <typename T>
inline void store_le(uint8_t* buf, T val) {
    static_assert(std::is_unsigned<T>::value, "unsigned integers only");
    for (size_t i = 0; i < sizeof(T); i++) {
        buf[i] = static_cast<uint8_t>(val >> (8 * i));
    }
}

template <typename T>
inline T load_le(const uint8_t* buf) {
    static_assert(std::is_unsigned<T>::value, "unsigned integers only");
    T v = 0;
    for (size_t i = 0; i < sizeof(T); i++) {
        v |= static_cast<T>(buf[i]) << (8 * i);
    }
    return v;
}

template <typename T>
inline void store_be(uint8_t* buf, T val) {
    static_assert(std::is_unsigned<T>::value, "unsigned integers only");
    for (size_t i = 0; i < sizeof(T); i++) {
        buf[sizeof(T) - 1 - i] = static_cast<uint8_t>(val >> (8 * i));
    }
}

template <typename T>
inline T load_be(const uint8_t* buf) {
    static_assert(std::is_unsigned<T>::value, "unsigned integers only");
    T v = 0;
    for (size_t i = 0; i < sizeof(T); i++) {
        v = static_cast<T>(v << 8) | buf[i];
    }
    return v;
}

inline void store_le32(uint8_t* buf, uint32_t val) { store_le(buf, val); }
inline void store_le64(uint8_t* buf, uint64_t val) { store_le(buf, val); }
inline uint32_t load_le32(const uint8_t* buf) { return load_le<uint32_t>(buf); }
inline uint64_t load_le64(const uint8_t* buf) { return load_le<uint64_t>(buf); }

inline void store_be64(uint8_t* buf, uint64_t val) { store_be(buf, val); }
inline uint64_t load_be64(const uint8_t* buf) { return load_be<uint64_t>(buf); }

} // namespace util
} // namespace chunkstore
