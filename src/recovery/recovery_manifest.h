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
#include <optional>
#include <string>
#include "types.h"
#include "status.h"

namespace lectern {
namespace recovery {

class AtomicFileWriter;

/**
 * RecoveryManifest - the {id}.meta.json document
 *
 * Holds one buffer's RecoveryMetadata plus the embedded chunk index:
 *
 *   {
 *     "original_path": "/home/u/notes.txt",
 *     "buffer_name": null,
 *     "created_at": 1760870400,
 *     ...
 *     "chunked_index": {
 *       "original_size": 48, "final_size": 56,
 *       "chunks": [ { "offset": 0, "original_len": 0, "size": 8, "crc32c": "0x%08x" } ]
 *     }
 *   }
 *
 * Never contains chunk payload bytes. Written atomically via temp + rename.
 */
class RecoveryManifest {
public:
    RecoveryManifest() = default;
    RecoveryManifest(RecoveryMetadata metadata, ChunkedRecoveryIndex index)
        : metadata_(std::move(metadata)), index_(std::move(index)) {}

    // NotFound if the file is missing, Io on read errors, Integrity if the
    // document cannot be parsed
    RecoveryStatus load(const std::string& path);

    RecoveryStatus store(const std::string& path, const AtomicFileWriter& writer) const;

    const RecoveryMetadata& metadata() const { return metadata_; }
    RecoveryMetadata& metadata() { return metadata_; }

    const std::optional<ChunkedRecoveryIndex>& index() const { return index_; }
    void set_index(ChunkedRecoveryIndex index) { index_ = std::move(index); }

    std::string to_json() const;
    RecoveryStatus from_json(const std::string& json_str);

private:
    RecoveryMetadata metadata_;
    std::optional<ChunkedRecoveryIndex> index_;
};

} // namespace recovery
} // namespace lectern
