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
#include <functional>
#include <optional>
#include <string>
#include <vector>
#include "types.h"
#include "status.h"
#include "atomic_writer.h"
#include "session_lock.h"
#include "platform_fs.h"

namespace lectern {
namespace recovery {

// Per-save description of the buffer the chunks belong to
struct SaveRequest {
    std::optional<std::string> original_path;
    std::optional<std::string> buffer_name;
    std::optional<size_t> line_count;
    size_t original_file_size = 0;
    size_t final_size = 0;
};

/**
 * RecoveryStorage - on-disk store for crash-recovery state
 *
 * Directory layout:
 *
 *   session.lock        SessionInfo of the running editor
 *   {id}.meta.json      RecoveryMetadata with the embedded chunk index
 *   {id}.chunk.{N}      raw payload of chunk N, no framing
 *
 * Each save replaces an id's whole chunk set. The metadata file and its chunk
 * files are each written atomically but not as one unit; a crash between them
 * leaves an entry that fails verification on read or is collected by
 * cleanup_orphans(). Callers must not run two writers for the same id.
 */
class RecoveryStorage {
public:
    static constexpr const char* kMetaExt = ".meta.json";
    static constexpr const char* kContentExt = ".content";   // single-file format, read-only
    static constexpr const char* kChunkInfix = ".chunk.";

    explicit RecoveryStorage(std::string recovery_dir, bool sync_writes = false);

    const std::string& base_dir() const { return dir_; }
    RecoveryStatus ensure_dir() const;

    SessionLock& session_lock() { return session_lock_; }
    const SessionLock& session_lock() const { return session_lock_; }

    RecoveryStatus detect_crash(bool* crashed) const { return session_lock_.detect_crash(crashed); }

    // Path hash for path-backed buffers, a generated id otherwise
    std::string get_buffer_id(const std::optional<std::string>& path) const;

    // ---------------------------------------------------------------------
    // Chunk store
    // ---------------------------------------------------------------------

    RecoveryStatus save_recovery(const std::string& id,
                                 const std::vector<RecoveryChunk>& chunks,
                                 const SaveRequest& request,
                                 RecoveryMetadata* out = nullptr);

    // Index only; no payload I/O. Empty when there is no metadata file.
    RecoveryStatus read_chunked_index(const std::string& id,
                                      std::optional<ChunkedRecoveryIndex>* out) const;

    // Index plus every payload. A payload file the index names but the
    // directory lacks is NotFound; a size or checksum mismatch is Integrity.
    RecoveryStatus read_chunked_content(const std::string& id,
                                        std::optional<ChunkedRecoveryData>* out) const;

    RecoveryStatus read_metadata(const std::string& id,
                                 std::optional<RecoveryMetadata>* out) const;

    // ---------------------------------------------------------------------
    // Reconstruction
    // ---------------------------------------------------------------------

    RecoveryStatus reconstruct_from_chunks(const std::string& id,
                                           const std::string& original_file,
                                           std::string* out) const;

    // ---------------------------------------------------------------------
    // Catalog and garbage collection
    // ---------------------------------------------------------------------

    // Empty unless the metadata exists and at least one chunk file does
    RecoveryStatus load_entry(const std::string& id, std::optional<RecoveryEntry>* out) const;

    // Newest first; unreadable entries are skipped
    RecoveryStatus list_entries(std::vector<RecoveryEntry>* out) const;

    // Idempotent
    RecoveryStatus delete_recovery(const std::string& id) const;

    // Removes ids lacking metadata or chunk files; *removed counts ids
    RecoveryStatus cleanup_orphans(size_t* removed = nullptr) const;

    // Removes every file except the session lock; *removed counts files
    RecoveryStatus cleanup_all(size_t* removed = nullptr) const;

    // ---------------------------------------------------------------------
    // Paths
    // ---------------------------------------------------------------------

    std::string metadata_path(const std::string& id) const;
    std::string content_path(const std::string& id) const;
    std::string chunk_path(const std::string& id, size_t index) const;

    // Chunk files present for id, ordered by chunk number
    RecoveryStatus list_chunk_paths(const std::string& id, std::vector<std::string>* out) const;

    // Recovery id a directory entry belongs to; empty for foreign files and
    // the session lock
    static std::string id_from_file_name(const std::string& name);

    using RemoveFileFn = std::function<FSResult(const std::string&)>;

    // Swaps the unlink primitive so tests can make a removal fail
    void set_remove_file_for_tests(RemoveFileFn fn) { remove_file_ = std::move(fn); }

private:
    std::string dir_;
    AtomicFileWriter writer_;
    SessionLock session_lock_;
    RemoveFileFn remove_file_ = &PlatformFS::remove_file;

    RecoveryStatus delete_chunk_files(const std::string& id) const;
    std::string join(const std::string& name) const;
};

} // namespace recovery
} // namespace lectern
