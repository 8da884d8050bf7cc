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


#include "checksums.h"
#include <array>
#include <cstring>

#if defined(__x86_64__)
#include <nmmintrin.h>
#endif

#if defined(__aarch64__) && defined(__ARM_FEATURE_CRC32)
#include <arm_acle.h>
#endif

namespace chunkstore {
namespace util {

namespace {

    constexpr uint32_t kCastagnoli = 0x82F63B78u;

    using SliceTables = std::array<std::array<uint32_t, 256>, 8>;

    SliceTables build_tables() {
        SliceTables t{};
        for (uint32_t i = 0; i < 256; i++) {
            uint32_t r = i;
            for (int k = 0; k < 8; k++) {
                r = (r & 1) ? (r >> 1) ^ kCastagnoli : r >> 1;
            }
            t[0][i] = r;
        }
        for (size_t s = 1; s < 8; s++) {
            for (uint32_t i = 0; i < 256; i++) {
                t[s][i] = (t[s - 1][i] >> 8) ^ t[0][t[s - 1][i] & 0xFF];
            }
        }
        return t;
    }

    const SliceTables& tables() {
        static const SliceTables t = build_tables();
        return t;
    }

#if defined(__x86_64__)
    __attribute__((target("sse4.2")))
    uint32_t crc32c_sse42(uint32_t reg, const uint8_t* p, size_t len) {
        uint64_t r = reg;
        for (; len >= 8; p += 8, len -= 8) {
            uint64_t v;
            std::memcpy(&v, p, 8);
            r = _mm_crc32_u64(r, v);
        }
        reg = static_cast<uint32_t>(r);
        for (; len > 0; p++, len--) {
            reg = _mm_crc32_u8(reg, *p);
        }
        return reg;
    }
#endif

#if defined(__aarch64__) && defined(__ARM_FEATURE_CRC32)
    uint32_t crc32c_armv8(uint32_t reg, const uint8_t* p, size_t len) {
        for (; len >= 8; p += 8, len -= 8) {
            uint64_t v;
            std::memcpy(&v, p, 8);
            reg = __crc32cd(reg, v);
        }
        for (; len > 0; p++, len--) {
            reg = __crc32cb(reg, *p);
        }
        return reg;
    }
#endif

    struct KernelChoice {
        Crc32cKernel fn;
        const char* name;
    };

    KernelChoice choose_kernel() {
#if defined(__x86_64__)
        if (__builtin_cpu_supports("sse4.2")) {
            return {&crc32c_sse42, "sse4.2"};
        }
#elif defined(__aarch64__) && defined(__ARM_FEATURE_CRC32)
        return {&crc32c_armv8, "armv8-crc"};
#endif
        return {&crc32c_portable, "slicing-by-8"};
    }

    const KernelChoice& kernel_choice() {
        static const KernelChoice choice = choose_kernel();
        return choice;
    }

} // namespace

uint32_t crc32c_portable(uint32_t reg, const uint8_t* p, size_t len) {
    const SliceTables& t = tables();

    for (; len >= 8; p += 8, len -= 8) {
        uint32_t lo;
        uint32_t hi;
        std::memcpy(&lo, p, 4);
        std::memcpy(&hi, p + 4, 4);
        lo ^= reg;
        reg = t[7][lo & 0xFF] ^ t[6][(lo >> 8) & 0xFF] ^
              t[5][(lo >> 16) & 0xFF] ^ t[4][lo >> 24] ^
              t[3][hi & 0xFF] ^ t[2][(hi >> 8) & 0xFF] ^
              t[1][(hi >> 16) & 0xFF] ^ t[0][hi >> 24];
    }
    for (; len > 0; p++, len--) {
        reg = (reg >> 8) ^ t[0][(reg ^ *p) & 0xFF];
    }
    return reg;
}

Crc32cKernel crc32c_kernel() {
    return kernel_choice().fn;
}

const char* crc32c_kernel_name() {
    return kernel_choice().name;
}

} // namespace util
} // namespace chunkstore
