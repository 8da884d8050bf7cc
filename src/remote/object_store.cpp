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


#include "object_store.h"
#include <cctype>
#include <stdexcept>
#include "../config.h"

namespace chunkstore {
namespace remote {

size_t read_full(ObjectBody& body, uint8_t* buf, size_t len) {
    size_t done = 0;
    while (done < len) {
        size_t n = body.read(buf + done, len - done);
        if (n == 0) break;
        done += n;
    }
    return done;
}

std::string format_range(uint64_t offset, uint64_t len) {
    if (len == 0) {
        throw std::invalid_argument("format_range: empty range");
    }
    return std::string(kRangePrefix) + "=" + std::to_string(offset) + "-" +
           std::to_string(offset + len - 1);
}

std::string format_suffix_range(uint64_t n) {
    return std::string(kRangePrefix) + "=-" + std::to_string(n);
}

namespace {
    // Parses a run of digits at s[pos]; advances pos
    bool parse_number(const std::string& s, size_t& pos, uint64_t& out) {
        size_t start = pos;
        uint64_t v = 0;
        while (pos < s.size() && std::isdigit(static_cast<unsigned char>(s[pos]))) {
            uint64_t digit = static_cast<uint64_t>(s[pos] - '0');
            if (v > (UINT64_MAX - digit) / 10) return false;
            v = v * 10 + digit;
            pos++;
        }
        out = v;
        return pos > start;
    }
}

std::optional<std::pair<uint64_t, uint64_t>> parse_range(const std::string& header,
                                                         uint64_t object_size) {
    std::string prefix = std::string(kRangePrefix) + "=";
    if (header.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    size_t pos = prefix.size();

    if (pos < header.size() && header[pos] == '-') {
        pos++;
        uint64_t n = 0;
        if (!parse_number(header, pos, n) || pos != header.size()) return std::nullopt;
        if (n == 0 || object_size == 0) return std::nullopt;
        if (n > object_size) n = object_size;
        return std::make_pair(object_size - n, object_size - 1);
    }

    uint64_t first = 0;
    if (!parse_number(header, pos, first)) return std::nullopt;
    if (pos >= header.size() || header[pos] != '-') return std::nullopt;
    pos++;

    uint64_t last = object_size == 0 ? 0 : object_size - 1;
    if (pos < header.size()) {
        if (!parse_number(header, pos, last) || pos != header.size()) return std::nullopt;
        if (last < first) return std::nullopt;
    }
    if (first >= object_size) return std::nullopt;
    if (last >= object_size) last = object_size - 1;
    return std::make_pair(first, last);
}

} // namespace remote
} // namespace chunkstore
