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
#include <cstdint>
#include <string>
#include <utility>
#include <vector>
#include "varint.h"
#include "../errors.h"
#include "../table/address.h"

namespace chunkstore {
namespace codec {

/**
 * Float encoding.
 *
 * A finite double f is split into (mantissa, exponent) with
 * f == mantissa * 2^exponent and mantissa the smallest odd integer that
 * satisfies it (zero encodes as (0, 0)). The pair is written as two signed
 * varints, mantissa first. Small integers and short binary fractions
 * therefore encode in two or three bytes.
 *
 * NaN and the infinities have no such representation and throw CodecError.
 * Negative zero is written as zero.
 */
std::pair<int64_t, int> float_to_int_exp(double f);
double int_exp_to_float(int64_t mantissa, int exponent);

// Appends the encoding of f to out; returns the number of bytes written
size_t encode_float(std::vector<uint8_t>& out, double f);

// Decodes one float from buf; n receives the bytes consumed
double decode_float(const uint8_t* buf, size_t len, size_t& n);

/**
 * Growable little-endian writer over the codec primitives.
 */
class BinaryWriter {
public:
    BinaryWriter() = default;
    explicit BinaryWriter(size_t reserve) { buf_.reserve(reserve); }

    void write_uint8(uint8_t v) { buf_.push_back(v); }
    void write_uint32(uint32_t v);
    void write_uint64(uint64_t v);
    void write_count(uint64_t v);
    void write_varint(int64_t v);
    void write_float(double v);
    void write_raw(const void* data, size_t len);
    void write_bytes(const void* data, size_t len);       // count-prefixed
    void write_string(const std::string& s) { write_bytes(s.data(), s.size()); }
    void write_address(const table::Address& a) { write_raw(a.data(), table::Address::kSize); }

    size_t size() const { return buf_.size(); }
    const std::vector<uint8_t>& data() const { return buf_; }
    std::vector<uint8_t> release() { return std::move(buf_); }

private:
    std::vector<uint8_t> buf_;
};

/**
 * Bounds-checked reader; every read past the end, and every malformed
 * varint, throws CodecError.
 */
class BinaryReader {
public:
    BinaryReader(const uint8_t* data, size_t len) : data_(data), len_(len) {}
    explicit BinaryReader(const std::vector<uint8_t>& buf)
        : data_(buf.data()), len_(buf.size()) {}

    uint8_t read_uint8();
    uint32_t read_uint32();
    uint64_t read_uint64();
    uint64_t read_count();
    int64_t read_varint();
    double read_float();
    void read_raw(void* out, size_t len);
    std::vector<uint8_t> read_bytes();
    std::string read_string();
    table::Address read_address();

    void skip(size_t len);

    size_t position() const { return pos_; }
    size_t remaining() const { return len_ - pos_; }
    bool at_end() const { return pos_ == len_; }

private:
    void require(size_t n) const;

    const uint8_t* data_;
    size_t len_;
    size_t pos_ = 0;
};

} // namespace codec
} // namespace chunkstore
