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


#include "reconstruct.h"
#include "../util/log.h"

namespace lectern {
namespace recovery {

size_t expected_final_size(size_t original_size, const std::vector<RecoveryChunk>& chunks) {
    size_t size = original_size;
    for (const auto& chunk : chunks) {
        size = size + chunk.content.size() - chunk.original_len;
    }
    return size;
}

RecoveryStatus apply_chunks(const std::string& original, const ChunkedRecoveryData& data,
                            std::string* out) {
    if (original.size() != data.original_size) {
        return RecoveryStatus::integrity("original file size mismatch: expected " +
                                         std::to_string(data.original_size) + ", got " +
                                         std::to_string(original.size()));
    }

    std::string result;
    result.reserve(data.final_size);

    size_t cursor = 0;
    for (size_t i = 0; i < data.chunks.size(); i++) {
        const auto& chunk = data.chunks[i];

        if (chunk.offset < cursor) {
            return RecoveryStatus::integrity("chunk " + std::to_string(i) + " at offset " +
                                             std::to_string(chunk.offset) +
                                             " overlaps or precedes position " +
                                             std::to_string(cursor));
        }
        if (chunk.offset > original.size() ||
            chunk.original_len > original.size() - chunk.offset) {
            return RecoveryStatus::integrity("chunk " + std::to_string(i) + " [" +
                                             std::to_string(chunk.offset) + ", +" +
                                             std::to_string(chunk.original_len) +
                                             ") extends past the original (" +
                                             std::to_string(original.size()) + " bytes)");
        }

        // Unchanged span, then the edit
        result.append(original, cursor, chunk.offset - cursor);
        result.append(chunk.content);

        cursor = chunk.offset + chunk.original_len;
    }

    result.append(original, cursor, std::string::npos);

    if (result.size() != data.final_size) {
        return RecoveryStatus::integrity("reconstructed size " + std::to_string(result.size()) +
                                         " does not match final size " +
                                         std::to_string(data.final_size));
    }

    trace() << "reconstructed " << result.size() << " bytes from " << data.chunks.size()
            << " chunks over " << original.size() << " original bytes";
    out->swap(result);
    return RecoveryStatus::OK();
}

} // namespace recovery
} // namespace lectern
