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


#pragma once
#include <cstdint>
#include <cstddef>
#include <string>

namespace lectern {
namespace recovery {

// CRC32C (Castagnoli) of a chunk payload, as recorded in the chunk index.
// crc32c_extend() continues a checksum across several buffers:
//   crc32c_extend(crc32c(a), b) == crc32c(a + b)
uint32_t crc32c_extend(uint32_t crc, const void* data, size_t len);

inline uint32_t crc32c(const void* data, size_t len) {
    return crc32c_extend(0, data, len);
}

inline uint32_t crc32c(const std::string& data) {
    return crc32c_extend(0, data.data(), data.size());
}

// XXH64 of a canonical path; the low bits of a recovery id
uint64_t xxhash64(const void* data, size_t len, uint64_t seed = 0);

inline uint64_t xxhash64(const std::string& data, uint64_t seed = 0) {
    return xxhash64(data.data(), data.size(), seed);
}

} // namespace recovery
} // namespace lectern
