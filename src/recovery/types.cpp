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


#include "types.h"
#include "checksums.h"
#include "platform_fs.h"
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <sstream>

namespace lectern {
namespace recovery {

namespace fs = std::filesystem;

uint64_t unix_now() {
    auto d = std::chrono::system_clock::now().time_since_epoch();
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(d).count());
}

ChunkMeta to_meta(const RecoveryChunk& chunk) {
    ChunkMeta meta;
    meta.offset = chunk.offset;
    meta.original_len = chunk.original_len;
    meta.size = chunk.content.size();
    meta.crc32c = crc32c(chunk.content);
    return meta;
}

ChunkedRecoveryIndex ChunkedRecoveryData::to_index() const {
    ChunkedRecoveryIndex index;
    index.original_size = original_size;
    index.final_size = final_size;
    index.chunks.reserve(chunks.size());
    for (const auto& chunk : chunks) {
        index.chunks.push_back(to_meta(chunk));
    }
    return index;
}

RecoveryMetadata RecoveryMetadata::create(std::optional<std::string> original_path,
                                          std::optional<std::string> buffer_name,
                                          uint64_t content_size,
                                          std::optional<size_t> line_count,
                                          std::optional<uint64_t> original_mtime,
                                          size_t chunk_count,
                                          size_t original_file_size) {
    RecoveryMetadata meta;
    uint64_t now = unix_now();
    meta.original_path = std::move(original_path);
    meta.buffer_name = std::move(buffer_name);
    meta.created_at = now;
    meta.updated_at = now;
    meta.content_size = content_size;
    meta.line_count = line_count;
    meta.original_mtime = original_mtime;
    meta.chunk_count = chunk_count;
    meta.original_file_size = original_file_size;
    return meta;
}

void RecoveryMetadata::update(uint64_t content_size, std::optional<size_t> line_count,
                              size_t chunk_count) {
    updated_at = unix_now();
    this->content_size = content_size;
    this->line_count = line_count;
    this->chunk_count = chunk_count;
}

std::string RecoveryMetadata::display_name() const {
    if (original_path) {
        return *original_path;
    }
    if (buffer_name) {
        return *buffer_name;
    }
    return "Unknown buffer";
}

std::string RecoveryMetadata::format_description() const {
    std::ostringstream oss;
    if (original_file_size > 0) {
        oss << chunk_count << " chunks, " << original_file_size << " bytes original";
    } else {
        oss << content_size << " bytes";
    }
    return oss.str();
}

bool RecoveryEntry::original_file_modified() const {
    if (!metadata.original_path || !metadata.original_mtime) {
        return false;
    }
    auto [res, mtime] = PlatformFS::file_mtime(*metadata.original_path);
    if (!res.ok) {
        return false;
    }
    return mtime != *metadata.original_mtime;
}

uint64_t RecoveryEntry::age_seconds() const {
    uint64_t now = unix_now();
    return now > metadata.updated_at ? now - metadata.updated_at : 0;
}

std::string RecoveryEntry::age_display() const {
    uint64_t secs = age_seconds();
    std::ostringstream oss;
    if (secs < 60) {
        oss << secs << "s ago";
    } else if (secs < 3600) {
        oss << secs / 60 << "m ago";
    } else if (secs < 86400) {
        oss << secs / 3600 << "h ago";
    } else {
        oss << secs / 86400 << "d ago";
    }
    return oss.str();
}

SessionInfo SessionInfo::current() {
    SessionInfo info;
    info.pid = PlatformFS::current_pid();
    info.started_at = unix_now();
    std::error_code ec;
    fs::path cwd = fs::current_path(ec);
    if (!ec) {
        info.working_dir = cwd.string();
    }
    return info;
}

bool SessionInfo::is_running() const {
    return PlatformFS::process_alive(pid);
}

std::string path_hash(const std::string& path) {
    std::error_code ec;
    fs::path canonical = fs::weakly_canonical(fs::path(path), ec);
    std::string key = ec ? path : canonical.string();

    char buf[17];
    snprintf(buf, sizeof(buf), "%016llx",
             static_cast<unsigned long long>(xxhash64(key)));
    return buf;
}

std::string generate_buffer_id() {
    static std::atomic<uint64_t> last{0};

    auto d = std::chrono::system_clock::now().time_since_epoch();
    uint64_t now = static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::nanoseconds>(d).count());

    // Two buffers created within the clock's resolution still get distinct ids
    uint64_t prev = last.load(std::memory_order_relaxed);
    uint64_t next;
    do {
        next = now > prev ? now : prev + 1;
    } while (!last.compare_exchange_weak(prev, next, std::memory_order_relaxed));

    char buf[32];
    snprintf(buf, sizeof(buf), "unsaved_%llx", static_cast<unsigned long long>(next));
    return buf;
}

} // namespace recovery
} // namespace lectern
