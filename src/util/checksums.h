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

namespace chunkstore {
namespace util {

/**
 * CRC32C (Castagnoli, reflected polynomial 0x82F63B78) for chunk payloads
 * and table indexes.
 *
 * A kernel extends a raw, pre-inverted register over data. crc32c_kernel()
 * picks the SSE4.2 or ARMv8 CRC instructions when the CPU has them and the
 * slicing-by-8 table kernel otherwise; the choice is made once per process.
 */
using Crc32cKernel = uint32_t (*)(uint32_t reg, const uint8_t* data, size_t len);

Crc32cKernel crc32c_kernel();
const char* crc32c_kernel_name();

// Table-driven kernel, available on every platform
uint32_t crc32c_portable(uint32_t reg, const uint8_t* data, size_t len);

// Continues a finished checksum crc over data
inline uint32_t crc32c_extend(uint32_t crc, const void* data, size_t len) {
    if (len == 0) return crc;
    return ~crc32c_kernel()(~crc, static_cast<const uint8_t*>(data), len);
}

inline uint32_t crc32c(const void* data, size_t len) {
    return crc32c_extend(0, data, len);
}

} // namespace util
} // namespace chunkstore
