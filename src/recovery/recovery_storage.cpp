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


#include "recovery_storage.h"
#include "recovery_manifest.h"
#include "reconstruct.h"
#include "checksums.h"
#include "platform_fs.h"
#include "../util/log.h"
#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <map>

namespace lectern {
namespace recovery {

namespace {

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

bool all_digits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// "{id}.chunk.{N}" -> (id, N); false for anything else, temp siblings included
bool parse_chunk_name(const std::string& name, std::string* id, size_t* index) {
    size_t pos = name.rfind(RecoveryStorage::kChunkInfix);
    if (pos == std::string::npos || pos == 0) {
        return false;
    }
    std::string digits = name.substr(pos + std::char_traits<char>::length(RecoveryStorage::kChunkInfix));
    if (!all_digits(digits)) {
        return false;
    }
    *id = name.substr(0, pos);
    *index = static_cast<size_t>(std::strtoull(digits.c_str(), nullptr, 10));
    return true;
}

// Directory listing where a missing directory reads as empty
FSResult list_dir(const std::string& dir, std::vector<std::string>* names) {
    FSResult res = PlatformFS::list_files(dir, names);
    if (!res.ok && res.err == ENOENT) {
        names->clear();
        return {true, 0};
    }
    return res;
}

} // namespace

RecoveryStorage::RecoveryStorage(std::string recovery_dir, bool sync_writes)
    : dir_(std::move(recovery_dir)), writer_(sync_writes), session_lock_(dir_, sync_writes) {}

std::string RecoveryStorage::join(const std::string& name) const {
    return (std::filesystem::path(dir_) / name).string();
}

std::string RecoveryStorage::metadata_path(const std::string& id) const {
    return join(id + kMetaExt);
}

std::string RecoveryStorage::content_path(const std::string& id) const {
    return join(id + kContentExt);
}

std::string RecoveryStorage::chunk_path(const std::string& id, size_t index) const {
    return join(id + kChunkInfix + std::to_string(index));
}

RecoveryStatus RecoveryStorage::ensure_dir() const {
    FSResult res = PlatformFS::ensure_directory(dir_);
    if (!res.ok) {
        return RecoveryStatus::io(res.err, "create directory " + dir_);
    }
    return RecoveryStatus::OK();
}

std::string RecoveryStorage::get_buffer_id(const std::optional<std::string>& path) const {
    return path ? path_hash(*path) : generate_buffer_id();
}

std::string RecoveryStorage::id_from_file_name(const std::string& name) {
    if (name == SessionLock::kFileName) {
        return "";
    }

    const std::string tmp = AtomicFileWriter::kTempSuffix;
    if (ends_with(name, tmp)) {
        return id_from_file_name(name.substr(0, name.size() - tmp.size()));
    }
    if (ends_with(name, kMetaExt)) {
        return name.substr(0, name.size() - std::char_traits<char>::length(kMetaExt));
    }
    if (ends_with(name, kContentExt)) {
        return name.substr(0, name.size() - std::char_traits<char>::length(kContentExt));
    }

    std::string id;
    size_t index = 0;
    if (parse_chunk_name(name, &id, &index)) {
        return id;
    }
    return "";
}

RecoveryStatus RecoveryStorage::list_chunk_paths(const std::string& id,
                                                 std::vector<std::string>* out) const {
    out->clear();

    std::vector<std::string> names;
    FSResult res = list_dir(dir_, &names);
    if (!res.ok) {
        return RecoveryStatus::io(res.err, "list " + dir_);
    }

    std::vector<std::pair<size_t, std::string>> found;
    for (const auto& name : names) {
        std::string chunk_id;
        size_t index = 0;
        if (parse_chunk_name(name, &chunk_id, &index) && chunk_id == id) {
            found.emplace_back(index, join(name));
        }
    }
    std::sort(found.begin(), found.end());

    out->reserve(found.size());
    for (auto& f : found) {
        out->push_back(std::move(f.second));
    }
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryStorage::delete_chunk_files(const std::string& id) const {
    std::vector<std::string> paths;
    RecoveryStatus st = list_chunk_paths(id, &paths);
    if (!st.ok()) {
        return st;
    }

    // Keep going after a failure; report the first one
    RecoveryStatus first_failure;
    for (const auto& p : paths) {
        FSResult res = remove_file_(p);
        if (!res.ok && first_failure.ok()) {
            first_failure = RecoveryStatus::io(res.err, "remove " + p);
        }
    }
    return first_failure;
}

RecoveryStatus RecoveryStorage::save_recovery(const std::string& id,
                                              const std::vector<RecoveryChunk>& chunks,
                                              const SaveRequest& request,
                                              RecoveryMetadata* out) {
    RecoveryStatus st = ensure_dir();
    if (!st.ok()) {
        return st;
    }

    // The new chunk set replaces the old one entirely
    st = delete_chunk_files(id);
    if (!st.ok()) {
        return st;
    }

    ChunkedRecoveryIndex index;
    index.original_size = request.original_file_size;
    index.final_size = request.final_size;
    index.chunks.reserve(chunks.size());

    uint64_t total_chunk_bytes = 0;
    for (size_t i = 0; i < chunks.size(); i++) {
        st = writer_.write(chunk_path(id, i), chunks[i].content);
        if (!st.ok()) {
            return st;
        }
        index.chunks.push_back(to_meta(chunks[i]));
        total_chunk_bytes += chunks[i].content.size();
    }

    std::optional<uint64_t> original_mtime;
    if (request.original_path) {
        auto [res, mtime] = PlatformFS::file_mtime(*request.original_path);
        if (res.ok) {
            original_mtime = mtime;
        }
    }

    std::string meta_path = metadata_path(id);

    RecoveryManifest manifest;
    st = manifest.load(meta_path);
    if (st.is_io()) {
        return st;
    }
    if (st.is_integrity()) {
        warning() << "replacing unreadable recovery metadata for " << id << ": " << st.message;
    }
    if (!st.ok()) {
        manifest = RecoveryManifest(RecoveryMetadata::create(request.original_path,
                                                             request.buffer_name,
                                                             total_chunk_bytes,
                                                             request.line_count,
                                                             original_mtime,
                                                             chunks.size(),
                                                             request.original_file_size),
                                    ChunkedRecoveryIndex());
    }

    RecoveryMetadata& metadata = manifest.metadata();
    metadata.original_file_size = request.original_file_size;
    metadata.update(total_chunk_bytes, request.line_count, chunks.size());
    manifest.set_index(std::move(index));

    st = manifest.store(meta_path, writer_);
    if (!st.ok()) {
        return st;
    }

    trace() << "saved recovery " << id << ": " << chunks.size() << " chunks, "
            << total_chunk_bytes << " bytes (original " << request.original_file_size
            << ", final " << request.final_size << ")";

    if (out) {
        *out = metadata;
    }
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryStorage::read_chunked_index(const std::string& id,
                                                   std::optional<ChunkedRecoveryIndex>* out) const {
    out->reset();

    RecoveryManifest manifest;
    RecoveryStatus st = manifest.load(metadata_path(id));
    if (st.is_not_found()) {
        return RecoveryStatus::OK();
    }
    if (!st.ok()) {
        return st;
    }

    *out = manifest.index();
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryStorage::read_chunked_content(const std::string& id,
                                                     std::optional<ChunkedRecoveryData>* out) const {
    out->reset();

    std::optional<ChunkedRecoveryIndex> index;
    RecoveryStatus st = read_chunked_index(id, &index);
    if (!st.ok() || !index) {
        return st;
    }

    std::vector<RecoveryChunk> chunks;
    chunks.reserve(index->chunks.size());
    for (size_t i = 0; i < index->chunks.size(); i++) {
        const ChunkMeta& meta = index->chunks[i];
        std::string path = chunk_path(id, i);

        std::string content;
        FSResult res = PlatformFS::read_file(path, &content);
        if (!res.ok) {
            if (res.err == ENOENT) {
                return RecoveryStatus::not_found("chunk file " + path + " not found");
            }
            return RecoveryStatus::io(res.err, "read " + path);
        }

        if (content.size() != meta.size) {
            return RecoveryStatus::integrity("chunk file " + path + " has " +
                                             std::to_string(content.size()) + " bytes, index says " +
                                             std::to_string(meta.size));
        }
        if (crc32c(content) != meta.crc32c) {
            return RecoveryStatus::integrity("chunk file " + path + " fails its checksum");
        }

        chunks.emplace_back(meta.offset, meta.original_len, std::move(content));
    }

    *out = ChunkedRecoveryData(index->original_size, index->final_size, std::move(chunks));
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryStorage::read_metadata(const std::string& id,
                                              std::optional<RecoveryMetadata>* out) const {
    out->reset();

    RecoveryManifest manifest;
    RecoveryStatus st = manifest.load(metadata_path(id));
    if (st.is_not_found()) {
        return RecoveryStatus::OK();
    }
    if (!st.ok()) {
        return st;
    }

    *out = manifest.metadata();
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryStorage::reconstruct_from_chunks(const std::string& id,
                                                        const std::string& original_file,
                                                        std::string* out) const {
    std::optional<ChunkedRecoveryData> data;
    RecoveryStatus st = read_chunked_content(id, &data);
    if (!st.ok()) {
        return st;
    }
    if (!data) {
        return RecoveryStatus::not_found("no chunked recovery data for " + id);
    }

    std::string original;
    FSResult res = PlatformFS::read_file(original_file, &original);
    if (!res.ok) {
        return RecoveryStatus::io(res.err, "read " + original_file);
    }

    debug() << "reconstruct " << id << ": original=" << original_file
            << " size_on_disk=" << original.size()
            << " expected_original_size=" << data->original_size;

    st = apply_chunks(original, *data, out);
    if (!st.ok()) {
        error() << "cannot reconstruct " << id << " from " << original_file << ": " << st.message;
    }
    return st;
}

RecoveryStatus RecoveryStorage::load_entry(const std::string& id,
                                           std::optional<RecoveryEntry>* out) const {
    out->reset();

    std::optional<RecoveryMetadata> metadata;
    RecoveryStatus st = read_metadata(id, &metadata);
    if (!st.ok() || !metadata) {
        return st;
    }

    std::vector<std::string> chunk_paths;
    st = list_chunk_paths(id, &chunk_paths);
    if (!st.ok()) {
        return st;
    }
    if (chunk_paths.empty()) {
        return RecoveryStatus::OK();
    }

    RecoveryEntry entry;
    entry.id = id;
    entry.metadata = std::move(*metadata);
    entry.content_path = content_path(id);
    entry.metadata_path = metadata_path(id);
    *out = std::move(entry);
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryStorage::list_entries(std::vector<RecoveryEntry>* out) const {
    out->clear();

    std::vector<std::string> names;
    FSResult res = list_dir(dir_, &names);
    if (!res.ok) {
        return RecoveryStatus::io(res.err, "list " + dir_);
    }

    for (const auto& name : names) {
        if (!ends_with(name, kMetaExt)) {
            continue;
        }
        std::string id = name.substr(0, name.size() - std::char_traits<char>::length(kMetaExt));

        std::optional<RecoveryEntry> entry;
        RecoveryStatus st = load_entry(id, &entry);
        if (!st.ok()) {
            warning() << "skipping recovery entry " << id << ": " << st.to_string();
            continue;
        }
        if (entry) {
            out->push_back(std::move(*entry));
        }
    }

    std::stable_sort(out->begin(), out->end(),
                     [](const RecoveryEntry& a, const RecoveryEntry& b) {
                         return a.metadata.updated_at > b.metadata.updated_at;
                     });
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryStorage::delete_recovery(const std::string& id) const {
    std::string content = content_path(id);
    FSResult res = remove_file_(content);
    if (!res.ok) {
        return RecoveryStatus::io(res.err, "remove " + content);
    }

    RecoveryStatus st = delete_chunk_files(id);
    if (!st.ok()) {
        return st;
    }

    std::string meta = metadata_path(id);
    res = remove_file_(meta);
    if (!res.ok) {
        return RecoveryStatus::io(res.err, "remove " + meta);
    }

    debug() << "deleted recovery " << id;
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryStorage::cleanup_orphans(size_t* removed) const {
    if (removed) {
        *removed = 0;
    }

    std::vector<std::string> names;
    FSResult res = list_dir(dir_, &names);
    if (!res.ok) {
        return RecoveryStatus::io(res.err, "list " + dir_);
    }

    std::map<std::string, std::vector<std::string>> files_by_id;
    for (const auto& name : names) {
        std::string id = id_from_file_name(name);
        if (!id.empty()) {
            files_by_id[id].push_back(name);
        }
    }

    size_t cleaned = 0;
    for (const auto& [id, files] : files_by_id) {
        bool has_meta = false;
        bool has_chunk = false;
        for (const auto& name : files) {
            std::string chunk_id;
            size_t index = 0;
            if (name == id + kMetaExt) {
                has_meta = true;
            } else if (parse_chunk_name(name, &chunk_id, &index)) {
                has_chunk = true;
            }
        }
        if (has_meta && has_chunk) {
            continue;
        }

        // Opportunistic: a file that cannot be removed now is retried next time
        for (const auto& name : files) {
            remove_file_(join(name));
        }
        debug() << "removed orphaned recovery files for " << id
                << (has_meta ? " (no chunks)" : " (no metadata)");
        cleaned++;
    }

    if (cleaned > 0) {
        info() << "cleaned up " << cleaned << " orphaned recovery entries";
    }
    if (removed) {
        *removed = cleaned;
    }
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryStorage::cleanup_all(size_t* removed) const {
    if (removed) {
        *removed = 0;
    }

    std::vector<std::string> names;
    FSResult res = list_dir(dir_, &names);
    if (!res.ok) {
        return RecoveryStatus::io(res.err, "list " + dir_);
    }

    size_t cleaned = 0;
    for (const auto& name : names) {
        if (name == SessionLock::kFileName) {
            continue;
        }
        if (remove_file_(join(name)).ok) {
            cleaned++;
        }
    }

    debug() << "removed " << cleaned << " recovery files";
    if (removed) {
        *removed = cleaned;
    }
    return RecoveryStatus::OK();
}

} // namespace recovery
} // namespace lectern
