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
#include <utility>

namespace chunkstore {
namespace codec {

/**
 * LEB128 variable-length integers.
 *
 * Each byte carries 7 payload bits, least significant group first; the high
 * bit is set on every byte but the last. Signed values are zig-zag mapped
 * (n >= 0 -> 2n, n < 0 -> -2n - 1) before encoding, so small magnitudes of
 * either sign stay short. Encodings produced here are always minimal.
 */

constexpr size_t kMaxVarintLen64 = 10;

inline uint64_t zigzag_encode(int64_t v) {
    uint64_t ux = static_cast<uint64_t>(v) << 1;
    if (v < 0) {
        ux = ~ux;
    }
    return ux;
}

inline int64_t zigzag_decode(uint64_t ux) {
    int64_t x = static_cast<int64_t>(ux >> 1);
    if (ux & 1) {
        x = ~x;
    }
    return x;
}

// buf must have room for kMaxVarintLen64 bytes
inline size_t put_uvarint(uint8_t* buf, uint64_t v) {
    size_t i = 0;
    while (v >= 0x80) {
        buf[i++] = static_cast<uint8_t>(v) | 0x80;
        v >>= 7;
    }
    buf[i++] = static_cast<uint8_t>(v);
    return i;
}

inline size_t put_varint(uint8_t* buf, int64_t v) {
    return put_uvarint(buf, zigzag_encode(v));
}

inline size_t uvarint_size(uint64_t v) {
    size_t n = 1;
    while (v >= 0x80) {
        v >>= 7;
        n++;
    }
    return n;
}

inline size_t varint_size(int64_t v) {
    return uvarint_size(zigzag_encode(v));
}

/**
 * Canonical byte-at-a-time decoder.
 * Returns the number of bytes consumed, 0 if buf ended before the last byte
 * of the value, or a negative count if the value overflows 64 bits.
 */
inline int decode_uvarint(const uint8_t* buf, size_t len, uint64_t& out) {
    uint64_t x = 0;
    unsigned s = 0;
    for (size_t i = 0; i < len; i++) {
        if (i == kMaxVarintLen64) {
            out = 0;
            return -static_cast<int>(i + 1);
        }
        uint8_t b = buf[i];
        if (b < 0x80) {
            if (i == kMaxVarintLen64 - 1 && b > 1) {
                out = 0;
                return -static_cast<int>(i + 1);
            }
            out = x | static_cast<uint64_t>(b) << s;
            return static_cast<int>(i + 1);
        }
        x |= static_cast<uint64_t>(b & 0x7f) << s;
        s += 7;
    }
    out = 0;
    return 0;
}

inline int decode_varint(const uint8_t* buf, size_t len, int64_t& out) {
    uint64_t ux = 0;
    int n = decode_uvarint(buf, len, ux);
    out = zigzag_decode(ux);
    return n;
}

/**
 * Unrolled decoder: one straight-line step per encoded length, no loop.
 *
 * The caller guarantees that buf holds either the value's final byte or
 * kMaxVarintLen64 readable bytes. Agrees with decode_uvarint on every valid
 * encoding and on the overflow count: {0, -10} when the tenth byte carries
 * more than one bit, {0, -11} when it still has the continuation bit set.
 */
inline std::pair<uint64_t, int> unrolled_decode_uvarint(const uint8_t* buf) {
    uint64_t b = buf[0];
    if (b < 0x80) {
        return {b, 1};
    }

    uint64_t x = b & 0x7f;
    b = buf[1];
    if (b < 0x80) {
        return {x | (b << 7), 2};
    }

    x |= (b & 0x7f) << 7;
    b = buf[2];
    if (b < 0x80) {
        return {x | (b << 14), 3};
    }

    x |= (b & 0x7f) << 14;
    b = buf[3];
    if (b < 0x80) {
        return {x | (b << 21), 4};
    }

    x |= (b & 0x7f) << 21;
    b = buf[4];
    if (b < 0x80) {
        return {x | (b << 28), 5};
    }

    x |= (b & 0x7f) << 28;
    b = buf[5];
    if (b < 0x80) {
        return {x | (b << 35), 6};
    }

    x |= (b & 0x7f) << 35;
    b = buf[6];
    if (b < 0x80) {
        return {x | (b << 42), 7};
    }

    x |= (b & 0x7f) << 42;
    b = buf[7];
    if (b < 0x80) {
        return {x | (b << 49), 8};
    }

    x |= (b & 0x7f) << 49;
    b = buf[8];
    if (b < 0x80) {
        return {x | (b << 56), 9};
    }

    x |= (b & 0x7f) << 56;
    b = buf[9];
    if (b < 0x02) {
        return {x | (b << 63), 10};
    }
    if (b < 0x80) {
        return {0, -static_cast<int>(kMaxVarintLen64)};
    }
    // Continuation past the tenth byte
    return {0, -static_cast<int>(kMaxVarintLen64 + 1)};
}

inline std::pair<int64_t, int> unrolled_decode_varint(const uint8_t* buf) {
    auto res = unrolled_decode_uvarint(buf);
    return {zigzag_decode(res.first), res.second};
}

} // namespace codec
} // namespace chunkstore
