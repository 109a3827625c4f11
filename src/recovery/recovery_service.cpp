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


#include "recovery_service.h"
#include "platform_fs.h"
#include "../util/log.h"
#include <stdexcept>

namespace lectern {
namespace recovery {

const char* load_outcome_name(LoadOutcome::Kind kind) {
    switch (kind) {
        case LoadOutcome::Kind::Recovered: return "Recovered";
        case LoadOutcome::Kind::RecoveredChunks: return "RecoveredChunks";
        case LoadOutcome::Kind::OriginalFileModified: return "OriginalFileModified";
        case LoadOutcome::Kind::Corrupted: return "Corrupted";
    }
    return "Unknown";
}

RecoveryService::RecoveryService(RecoveryConfig config)
    : config_(std::move(config)), storage_(config_.recovery_dir, config_.sync_writes) {
    if (config_.recovery_dir.empty()) {
        throw std::invalid_argument("RecoveryService: recovery directory not set");
    }
}

void RecoveryService::corrupted(const RecoveryEntry& entry, std::string reason, LoadOutcome* out) {
    warning() << "recovery entry " << entry.id << " is unusable: " << reason;
    *out = LoadOutcome();
    out->kind = LoadOutcome::Kind::Corrupted;
    out->id = entry.id;
    out->original_path = entry.metadata.original_path;
    out->reason = std::move(reason);
}

RecoveryStatus RecoveryService::should_offer_recovery(bool* offer) const {
    *offer = false;
    if (!config_.enabled) {
        return RecoveryStatus::OK();
    }

    bool crashed = false;
    RecoveryStatus st = storage_.detect_crash(&crashed);
    if (!st.ok() || !crashed) {
        return st;
    }

    std::vector<RecoveryEntry> entries;
    st = storage_.list_entries(&entries);
    if (!st.ok()) {
        return st;
    }

    *offer = !entries.empty();
    if (*offer) {
        info() << "previous session crashed; " << entries.size() << " buffers can be recovered";
    }
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryService::start_session() {
    if (!config_.enabled) {
        return RecoveryStatus::OK();
    }

    RecoveryStatus st = storage_.session_lock().create();
    if (!st.ok()) {
        return st;
    }
    session_started_ = true;
    info() << "recovery session started in " << storage_.base_dir();
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryService::end_session() {
    if (!config_.enabled || !session_started_) {
        return RecoveryStatus::OK();
    }

    size_t cleaned = 0;
    RecoveryStatus st = storage_.cleanup_all(&cleaned);
    if (!st.ok()) {
        return st;
    }
    info() << "cleaned up " << cleaned << " recovery files";

    st = storage_.session_lock().remove();
    if (!st.ok()) {
        return st;
    }
    session_started_ = false;
    last_save_times_.clear();
    info() << "recovery session ended";
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryService::heartbeat() {
    if (!config_.enabled || !session_started_) {
        return RecoveryStatus::OK();
    }
    return storage_.session_lock().update();
}

bool RecoveryService::needs_auto_save(const std::string& buffer_id, bool recovery_pending) const {
    if (!config_.enabled || !recovery_pending) {
        return false;
    }

    auto it = last_save_times_.find(buffer_id);
    if (it == last_save_times_.end()) {
        return true;
    }
    auto interval = std::chrono::seconds(config_.auto_save_interval_secs);
    return std::chrono::steady_clock::now() - it->second >= interval;
}

RecoveryStatus RecoveryService::save_buffer(const std::string& buffer_id,
                                            const std::vector<RecoveryChunk>& chunks,
                                            const SaveRequest& request) {
    if (!config_.enabled) {
        return RecoveryStatus::OK();
    }

    RecoveryStatus st = storage_.save_recovery(buffer_id, chunks, request);
    if (!st.ok()) {
        error() << "autosave of " << buffer_id << " failed: " << st.to_string();
        return st;
    }
    last_save_times_[buffer_id] = std::chrono::steady_clock::now();
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryService::delete_buffer_recovery(const std::string& buffer_id) {
    if (!config_.enabled) {
        return RecoveryStatus::OK();
    }

    RecoveryStatus st = storage_.delete_recovery(buffer_id);
    if (!st.ok()) {
        return st;
    }
    last_save_times_.erase(buffer_id);
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryService::list_recoverable(std::vector<RecoveryEntry>* out) const {
    return storage_.list_entries(out);
}

RecoveryStatus RecoveryService::load_recovery(const RecoveryEntry& entry, LoadOutcome* out) const {
    const RecoveryMetadata& meta = entry.metadata;

    if (meta.original_file_size > 0) {
        if (!meta.original_path) {
            corrupted(entry, "entry needs its original file but records no path", out);
            return RecoveryStatus::OK();
        }
        if (entry.original_file_modified()) {
            *out = LoadOutcome();
            out->kind = LoadOutcome::Kind::OriginalFileModified;
            out->id = entry.id;
            out->original_path = meta.original_path;
            return RecoveryStatus::OK();
        }
        if (!PlatformFS::exists(*meta.original_path)) {
            corrupted(entry, "original file not found: " + *meta.original_path, out);
            return RecoveryStatus::OK();
        }
    }

    std::optional<ChunkedRecoveryData> data;
    RecoveryStatus st = storage_.read_chunked_content(entry.id, &data);
    if (st.is_io()) {
        return st;
    }
    if (!st.ok()) {
        corrupted(entry, st.message, out);
        return RecoveryStatus::OK();
    }
    if (!data) {
        corrupted(entry, "chunk index missing", out);
        return RecoveryStatus::OK();
    }

    if (meta.original_file_size > 0) {
        *out = LoadOutcome();
        out->kind = LoadOutcome::Kind::RecoveredChunks;
        out->id = entry.id;
        out->original_path = meta.original_path;
        out->chunks = std::move(data->chunks);
        return RecoveryStatus::OK();
    }

    // A new buffer is stored whole as one chunk at offset 0
    if (data->chunks.size() != 1 || data->chunks[0].offset != 0) {
        corrupted(entry, "expected a single chunk at offset 0 for a new buffer, found " +
                             std::to_string(data->chunks.size()) + " chunks", out);
        return RecoveryStatus::OK();
    }

    *out = LoadOutcome();
    out->kind = LoadOutcome::Kind::Recovered;
    out->id = entry.id;
    out->original_path = meta.original_path;
    out->content = std::move(data->chunks[0].content);
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryService::load_recovery_with_original(const RecoveryEntry& entry,
                                                            const std::string& original_file,
                                                            LoadOutcome* out) const {
    std::string content;
    RecoveryStatus st = storage_.reconstruct_from_chunks(entry.id, original_file, &content);
    if (st.is_integrity()) {
        corrupted(entry, st.message, out);
        return RecoveryStatus::OK();
    }
    if (!st.ok()) {
        return st;
    }

    *out = LoadOutcome();
    out->kind = LoadOutcome::Kind::Recovered;
    out->id = entry.id;
    out->original_path = original_file;
    out->content = std::move(content);
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryService::accept_recovery(const RecoveryEntry& entry, LoadOutcome* out) {
    RecoveryStatus st = load_recovery(entry, out);
    if (!st.ok()) {
        return st;
    }
    if (out->recovered() && config_.enabled) {
        st = storage_.delete_recovery(entry.id);
        if (!st.ok()) {
            return st;
        }
        last_save_times_.erase(entry.id);
        debug() << "accepted recovery " << entry.id;
    }
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryService::discard_recovery(const RecoveryEntry& entry) {
    if (!config_.enabled) {
        return RecoveryStatus::OK();
    }
    RecoveryStatus st = storage_.delete_recovery(entry.id);
    if (st.ok()) {
        last_save_times_.erase(entry.id);
    }
    return st;
}

RecoveryStatus RecoveryService::discard_all_recovery(size_t* removed) {
    if (removed) {
        *removed = 0;
    }
    if (!config_.enabled) {
        return RecoveryStatus::OK();
    }
    RecoveryStatus st = storage_.cleanup_all(removed);
    if (st.ok()) {
        last_save_times_.clear();
    }
    return st;
}

RecoveryStatus RecoveryService::cleanup_old(size_t* removed) const {
    if (removed) {
        *removed = 0;
    }
    if (!config_.enabled) {
        return RecoveryStatus::OK();
    }

    std::vector<RecoveryEntry> entries;
    RecoveryStatus st = storage_.list_entries(&entries);
    if (!st.ok()) {
        return st;
    }

    size_t cleaned = 0;
    for (const auto& entry : entries) {
        if (entry.age_seconds() <= config_.max_recovery_age_secs) {
            continue;
        }
        st = storage_.delete_recovery(entry.id);
        if (st.ok()) {
            cleaned++;
        } else {
            warning() << "could not remove expired recovery " << entry.id << ": " << st.to_string();
        }
    }

    if (cleaned > 0) {
        info() << "cleaned up " << cleaned << " expired recovery entries";
    }
    if (removed) {
        *removed = cleaned;
    }
    return RecoveryStatus::OK();
}

RecoveryStatus RecoveryService::cleanup_orphans(size_t* removed) const {
    if (removed) {
        *removed = 0;
    }
    if (!config_.enabled) {
        return RecoveryStatus::OK();
    }
    return storage_.cleanup_orphans(removed);
}

} // namespace recovery
} // namespace lectern
