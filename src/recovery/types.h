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
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace lectern {
namespace recovery {

/**
 * RecoveryChunk - one splice against the buffer's last known-good content
 *
 * Replaces original_len bytes at offset with content. original_len == 0 is a
 * pure insertion, an empty content a pure deletion.
 */
struct RecoveryChunk {
    size_t offset = 0;
    size_t original_len = 0;
    std::string content;

    RecoveryChunk() = default;
    RecoveryChunk(size_t offset, size_t original_len, std::string content)
        : offset(offset), original_len(original_len), content(std::move(content)) {}

    size_t size() const { return content.size(); }
};

// Index entry for one chunk; the payload lives in its own file
struct ChunkMeta {
    size_t offset = 0;
    size_t original_len = 0;
    size_t size = 0;        // payload bytes
    uint32_t crc32c = 0;    // CRC32C of the payload
};

ChunkMeta to_meta(const RecoveryChunk& chunk);

// Content-free description of a chunk set, embedded in the metadata file
struct ChunkedRecoveryIndex {
    size_t original_size = 0;
    size_t final_size = 0;
    std::vector<ChunkMeta> chunks;
};

// Index plus payloads, materialized only when content is needed
struct ChunkedRecoveryData {
    size_t original_size = 0;
    size_t final_size = 0;
    std::vector<RecoveryChunk> chunks;   // expected ascending by offset

    ChunkedRecoveryData() = default;
    ChunkedRecoveryData(size_t original_size, size_t final_size, std::vector<RecoveryChunk> chunks)
        : original_size(original_size), final_size(final_size), chunks(std::move(chunks)) {}

    ChunkedRecoveryIndex to_index() const;
};

/**
 * RecoveryMetadata - per-buffer record stored in {id}.meta.json
 */
struct RecoveryMetadata {
    static constexpr uint32_t kFormatVersion = 2;

    std::optional<std::string> original_path;   // unset for unsaved buffers
    std::optional<std::string> buffer_name;     // "Untitled-1" etc.
    uint64_t created_at = 0;                    // unix seconds
    uint64_t updated_at = 0;
    uint64_t content_size = 0;                  // total chunk payload bytes
    std::optional<size_t> line_count;
    std::optional<uint64_t> original_mtime;     // detects external edits
    uint32_t format_version = kFormatVersion;
    size_t chunk_count = 0;
    size_t original_file_size = 0;              // 0 for new buffers

    static RecoveryMetadata create(std::optional<std::string> original_path,
                                   std::optional<std::string> buffer_name,
                                   uint64_t content_size,
                                   std::optional<size_t> line_count,
                                   std::optional<uint64_t> original_mtime,
                                   size_t chunk_count,
                                   size_t original_file_size);

    // Refresh updated_at and the per-save fields
    void update(uint64_t content_size, std::optional<size_t> line_count, size_t chunk_count);

    std::string display_name() const;
    std::string format_description() const;
};

struct RecoveryEntry {
    std::string id;
    RecoveryMetadata metadata;
    std::string content_path;
    std::string metadata_path;

    // True when the original file's mtime no longer matches the one recorded
    // at save time. Missing file or missing mtime reads as unmodified.
    bool original_file_modified() const;

    uint64_t age_seconds() const;
    std::string age_display() const;   // "42s ago", "5m ago", "3h ago", "2d ago"
};

struct SessionInfo {
    uint32_t pid = 0;
    uint64_t started_at = 0;     // heartbeat, unix seconds
    std::optional<std::string> working_dir;

    static SessionInfo current();

    bool is_running() const;
};

uint64_t unix_now();

// Stable id for a path-backed buffer: 16 hex digits of XXHash64(path)
std::string path_hash(const std::string& path);

// Fresh id for an unsaved buffer: "unsaved_<hex nanoseconds>"
std::string generate_buffer_id();

} // namespace recovery
} // namespace lectern
