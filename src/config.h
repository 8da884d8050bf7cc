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
#include <cstddef>

namespace chunkstore {

// Table file format (version 1)
//
//   [chunk payload]* [index entry]* [footer]
//
// Index entry:  address[20] offset:u64 length:u32 crc32c:u32
// Footer:       chunk_count:u32 index_size:u64 total_uncompressed:u64
//               version:u32 index_crc32c:u32 magic:u64
// All fixed-width integers are little-endian.
namespace table_format {
    constexpr size_t kAddressSize = 20;
    constexpr size_t kAddressPrefixSize = 8;
    constexpr size_t kAddressStringSize = 32;                 // base32, 5 bits per char

    constexpr size_t kOffsetSize = 8;
    constexpr size_t kLengthSize = 4;
    constexpr size_t kChecksumSize = 4;
    constexpr size_t kIndexEntrySize = kAddressSize + kOffsetSize + kLengthSize + kChecksumSize;  // 36

    constexpr size_t kFooterSize = 4 + 8 + 8 + 4 + 4 + 8;    // 36
    constexpr uint64_t kMagic = 0x3153454C42415443ULL;        // "CTABLES1"
    constexpr uint32_t kFormatVersion = 1;

    constexpr uint32_t kMaxChunkLength = 0xFFFFFFFFu;
}

// Object-store reads
namespace remote {
    constexpr const char* kRangePrefix = "bytes";
    constexpr uint64_t kBlockSize = 512 * 1024;               // coalescing window for adjacent chunks

    // Retry on connection reset
    constexpr uint64_t kBackoffMinMicros = 128;
    constexpr uint64_t kBackoffMaxMicros = 1024 * 1000;       // 1024ms
    constexpr double kBackoffFactor = 2.0;

    constexpr size_t kDefaultReadConcurrency = 32;            // rate-limit gate capacity

    // S3 requires every part but the last to be at least 5MiB
    constexpr size_t kMinPartSize = 5 * 1024 * 1024;
    constexpr size_t kDefaultPartSize = 8 * 1024 * 1024;
    constexpr long kConnectTimeoutSeconds = 10;
}

// Parsed table index cache
namespace index_cache {
    constexpr size_t kDefaultShards = 16;
    constexpr size_t kDefaultCapacityBytes = 256 * 1024 * 1024;  // 256MB of parsed indexes
}

// Local table files
namespace files {
    constexpr const char* kTempSuffix = ".tmp";
}

} // namespace chunkstore
