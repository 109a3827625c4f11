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
#include <string>
#include "types.h"
#include "status.h"

namespace lectern {
namespace recovery {

/**
 * Rebuild a buffer by replaying a chunk set onto its original bytes.
 *
 * Walks the chunks in stored order with a cursor into original: the span
 * [cursor, offset) is copied unchanged, the chunk content is appended and the
 * cursor moves to offset + original_len. The tail after the last chunk is
 * copied at the end.
 *
 * Fails with Integrity, leaving *out untouched, when original.size() differs
 * from data.original_size, when a chunk starts before the cursor (unsorted or
 * overlapping), when a chunk reaches past the end of original, or when the
 * result is not data.final_size bytes long.
 */
RecoveryStatus apply_chunks(const std::string& original, const ChunkedRecoveryData& data,
                            std::string* out);

// Size the chunk set claims to produce: original_size + sum(content - original_len)
size_t expected_final_size(size_t original_size, const std::vector<RecoveryChunk>& chunks);

} // namespace recovery
} // namespace lectern
