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


#include "codec.h"
#include <cmath>
#include <cstring>
#include "../util/endian.hpp"

namespace chunkstore {
namespace codec {

std::pair<int64_t, int> float_to_int_exp(double f) {
    if (std::isnan(f) || std::isinf(f)) {
        throw CodecError("float encoding: NaN and infinities are not representable");
    }
    if (f == 0.0) {
        return {0, 0};
    }

    int exp = 0;
    double frac = std::frexp(f, &exp);

    // At most 53 doublings; the result fits in int64
    while (frac != std::trunc(frac)) {
        frac *= 2.0;
        exp--;
    }

    return {static_cast<int64_t>(frac), exp};
}

double int_exp_to_float(int64_t mantissa, int exponent) {
    return std::ldexp(static_cast<double>(mantissa), exponent);
}

size_t encode_float(std::vector<uint8_t>& out, double f) {
    auto me = float_to_int_exp(f);
    uint8_t buf[2 * kMaxVarintLen64];
    size_t n = put_varint(buf, me.first);
    n += put_varint(buf + n, me.second);
    out.insert(out.end(), buf, buf + n);
    return n;
}

double decode_float(const uint8_t* buf, size_t len, size_t& n) {
    int64_t mantissa = 0;
    int64_t exponent = 0;
    int a = decode_varint(buf, len, mantissa);
    if (a <= 0) {
        throw CodecError("float decoding: malformed mantissa");
    }
    int b = decode_varint(buf + a, len - a, exponent);
    if (b <= 0) {
        throw CodecError("float decoding: malformed exponent");
    }
    if (exponent < -2048 || exponent > 2048) {
        throw CodecError("float decoding: exponent out of range");
    }
    n = static_cast<size_t>(a + b);
    return int_exp_to_float(mantissa, static_cast<int>(exponent));
}

// BinaryWriter

void BinaryWriter::write_uint32(uint32_t v) {
    uint8_t tmp[4];
    util::store_le32(tmp, v);
    write_raw(tmp, sizeof(tmp));
}

void BinaryWriter::write_uint64(uint64_t v) {
    uint8_t tmp[8];
    util::store_le64(tmp, v);
    write_raw(tmp, sizeof(tmp));
}

void BinaryWriter::write_count(uint64_t v) {
    uint8_t tmp[kMaxVarintLen64];
    write_raw(tmp, put_uvarint(tmp, v));
}

void BinaryWriter::write_varint(int64_t v) {
    uint8_t tmp[kMaxVarintLen64];
    write_raw(tmp, put_varint(tmp, v));
}

void BinaryWriter::write_float(double v) {
    encode_float(buf_, v);
}

void BinaryWriter::write_raw(const void* data, size_t len) {
    const uint8_t* p = static_cast<const uint8_t*>(data);
    buf_.insert(buf_.end(), p, p + len);
}

void BinaryWriter::write_bytes(const void* data, size_t len) {
    write_count(len);
    write_raw(data, len);
}

// BinaryReader

void BinaryReader::require(size_t n) const {
    if (n > len_ - pos_) {
        throw CodecError("unexpected end of buffer: need " + std::to_string(n) +
                         " bytes at offset " + std::to_string(pos_) +
                         ", have " + std::to_string(len_ - pos_));
    }
}

uint8_t BinaryReader::read_uint8() {
    require(1);
    return data_[pos_++];
}

uint32_t BinaryReader::read_uint32() {
    require(4);
    uint32_t v = util::load_le32(data_ + pos_);
    pos_ += 4;
    return v;
}

uint64_t BinaryReader::read_uint64() {
    require(8);
    uint64_t v = util::load_le64(data_ + pos_);
    pos_ += 8;
    return v;
}

uint64_t BinaryReader::read_count() {
    const uint8_t* p = data_ + pos_;
    size_t left = len_ - pos_;

    if (left >= kMaxVarintLen64) {
        auto res = unrolled_decode_uvarint(p);
        if (res.second <= 0) {
            throw CodecError("varint overflows 64 bits at offset " + std::to_string(pos_));
        }
        pos_ += static_cast<size_t>(res.second);
        return res.first;
    }

    uint64_t v = 0;
    int n = decode_uvarint(p, left, v);
    if (n == 0) {
        throw CodecError("truncated varint at offset " + std::to_string(pos_));
    }
    if (n < 0) {
        throw CodecError("varint overflows 64 bits at offset " + std::to_string(pos_));
    }
    pos_ += static_cast<size_t>(n);
    return v;
}

int64_t BinaryReader::read_varint() {
    return zigzag_decode(read_count());
}

double BinaryReader::read_float() {
    int64_t mantissa = read_varint();
    int64_t exponent = read_varint();
    if (exponent < -2048 || exponent > 2048) {
        throw CodecError("float exponent out of range");
    }
    return int_exp_to_float(mantissa, static_cast<int>(exponent));
}

void BinaryReader::read_raw(void* out, size_t len) {
    require(len);
    std::memcpy(out, data_ + pos_, len);
    pos_ += len;
}

std::vector<uint8_t> BinaryReader::read_bytes() {
    uint64_t n = read_count();
    require(n);
    std::vector<uint8_t> out(data_ + pos_, data_ + pos_ + n);
    pos_ += n;
    return out;
}

std::string BinaryReader::read_string() {
    uint64_t n = read_count();
    require(n);
    std::string out(reinterpret_cast<const char*>(data_ + pos_), n);
    pos_ += n;
    return out;
}

table::Address BinaryReader::read_address() {
    require(table::Address::kSize);
    table::Address a = table::Address::from_bytes(data_ + pos_);
    pos_ += table::Address::kSize;
    return a;
}

void BinaryReader::skip(size_t len) {
    require(len);
    pos_ += len;
}

} // namespace codec
} // namespace chunkstore
