/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * The Lectern project is free software: you can redistribute it
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

namespace lectern {
namespace recovery {

namespace {

// Reflected Castagnoli polynomial
constexpr uint32_t kCastagnoli = 0x82F63B78u;

std::array<uint32_t, 256> make_crc_table() {
    std::array<uint32_t, 256> table{};
    for (uint32_t n = 0; n < table.size(); n++) {
        uint32_t c = n;
        for (int bit = 0; bit < 8; bit++) {
            c = (c & 1) ? (c >> 1) ^ kCastagnoli : c >> 1;
        }
        table[n] = c;
    }
    return table;
}

constexpr uint64_t kXXPrime1 = 0x9E3779B185EBCA87ULL;
constexpr uint64_t kXXPrime2 = 0xC2B2AE3D27D4EB4FULL;
constexpr uint64_t kXXPrime3 = 0x165667B19E3779F9ULL;
constexpr uint64_t kXXPrime4 = 0x85EBCA77C2B2AE63ULL;
constexpr uint64_t kXXPrime5 = 0x27D4EB2F165667C5ULL;

inline uint64_t rotl64(uint64_t x, int r) {
    return (x << r) | (x >> (64 - r));
}

// Lanes are read little-endian; every supported target is
inline uint64_t lane64(const unsigned char* p) {
    uint64_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

inline uint32_t lane32(const unsigned char* p) {
    uint32_t v;
    std::memcpy(&v, p, sizeof(v));
    return v;
}

inline uint64_t xx_round(uint64_t acc, uint64_t lane) {
    acc += lane * kXXPrime2;
    return rotl64(acc, 31) * kXXPrime1;
}

inline uint64_t xx_merge(uint64_t h, uint64_t acc) {
    h ^= xx_round(0, acc);
    return h * kXXPrime1 + kXXPrime4;
}

} // namespace

uint32_t crc32c_extend(uint32_t crc, const void* data, size_t len) {
    static const std::array<uint32_t, 256> table = make_crc_table();

    const unsigned char* p = static_cast<const unsigned char*>(data);
    uint32_t c = ~crc;
    for (size_t i = 0; i < len; i++) {
        c = table[(c ^ p[i]) & 0xFF] ^ (c >> 8);
    }
    return ~c;
}

uint64_t xxhash64(const void* data, size_t len, uint64_t seed) {
    const unsigned char* p = static_cast<const unsigned char*>(data);
    const unsigned char* const end = p + len;
    uint64_t h;

    if (len >= 32) {
        uint64_t acc[4] = {seed + kXXPrime1 + kXXPrime2, seed + kXXPrime2, seed, seed - kXXPrime1};
        while (end - p >= 32) {
            for (int lane = 0; lane < 4; lane++) {
                acc[lane] = xx_round(acc[lane], lane64(p + 8 * lane));
            }
            p += 32;
        }
        h = rotl64(acc[0], 1) + rotl64(acc[1], 7) + rotl64(acc[2], 12) + rotl64(acc[3], 18);
        for (uint64_t a : acc) {
            h = xx_merge(h, a);
        }
    } else {
        h = seed + kXXPrime5;
    }

    h += static_cast<uint64_t>(len);

    for (; end - p >= 8; p += 8) {
        h ^= xx_round(0, lane64(p));
        h = rotl64(h, 27) * kXXPrime1 + kXXPrime4;
    }
    if (end - p >= 4) {
        h ^= static_cast<uint64_t>(lane32(p)) * kXXPrime1;
        h = rotl64(h, 23) * kXXPrime2 + kXXPrime3;
        p += 4;
    }
    for (; p < end; p++) {
        h ^= static_cast<uint64_t>(*p) * kXXPrime5;
        h = rotl64(h, 11) * kXXPrime1;
    }

    h ^= h >> 33;
    h *= kXXPrime2;
    h ^= h >> 29;
    h *= kXXPrime3;
    h ^= h >> 32;
    return h;
}

} // namespace recovery
} // namespace lectern
