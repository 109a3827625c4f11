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
#include <chrono>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "recovery_config.h"
#include "recovery_storage.h"

namespace lectern {
namespace recovery {

/**
 * What loading a recovery entry produced.
 *
 *   Recovered             content holds the full buffer text
 *   RecoveredChunks       chunks are to be applied on top of original_path
 *   OriginalFileModified  the original changed on disk after the last save
 *   Corrupted             reason says why the entry cannot be used
 */
struct LoadOutcome {
    enum class Kind {
        Recovered,
        RecoveredChunks,
        OriginalFileModified,
        Corrupted
    };

    Kind kind = Kind::Corrupted;
    std::string id;
    std::optional<std::string> original_path;
    std::string content;
    std::vector<RecoveryChunk> chunks;
    std::string reason;

    bool recovered() const { return kind == Kind::Recovered; }
};

const char* load_outcome_name(LoadOutcome::Kind kind);

/**
 * Editor-facing coordinator for crash recovery.
 *
 * Owns the storage for one recovery directory and the per-buffer autosave
 * clock. With recovery disabled every mutating call succeeds without
 * touching the disk.
 */
class RecoveryService {
public:
    // Throws std::invalid_argument if config.recovery_dir is empty
    explicit RecoveryService(RecoveryConfig config);

    bool is_enabled() const { return config_.enabled; }
    const RecoveryConfig& config() const { return config_; }
    const RecoveryStorage& storage() const { return storage_; }
    bool session_started() const { return session_started_; }

    // Session management

    // Enabled, previous session crashed, and something is left to recover
    RecoveryStatus should_offer_recovery(bool* offer) const;

    RecoveryStatus start_session();

    // Clean shutdown: drop all recovery files, then the lock
    RecoveryStatus end_session();

    // Refresh the lock's timestamp; no-op before start_session
    RecoveryStatus heartbeat();

    // Buffer tracking

    bool needs_auto_save(const std::string& buffer_id, bool recovery_pending) const;

    std::string get_buffer_id(const std::optional<std::string>& path) const {
        return storage_.get_buffer_id(path);
    }

    // Recovery operations

    /**
     * Persist a buffer's edit set.
     *
     * New buffers pass a single chunk at offset 0 holding the whole text with
     * original_file_size 0. Path-backed buffers pass only the modified
     * regions with their offsets into the original file.
     */
    RecoveryStatus save_buffer(const std::string& buffer_id,
                               const std::vector<RecoveryChunk>& chunks,
                               const SaveRequest& request);

    // Call when the buffer is saved for real or closed
    RecoveryStatus delete_buffer_recovery(const std::string& buffer_id);

    RecoveryStatus list_recoverable(std::vector<RecoveryEntry>* out) const;

    RecoveryStatus load_recovery(const RecoveryEntry& entry, LoadOutcome* out) const;

    // Rebuild the full text against an explicitly chosen original file
    RecoveryStatus load_recovery_with_original(const RecoveryEntry& entry,
                                               const std::string& original_file,
                                               LoadOutcome* out) const;

    // Load, and delete the entry when the outcome is Recovered
    RecoveryStatus accept_recovery(const RecoveryEntry& entry, LoadOutcome* out);

    RecoveryStatus discard_recovery(const RecoveryEntry& entry);

    RecoveryStatus discard_all_recovery(size_t* removed = nullptr);

    // Maintenance

    // Delete entries older than max_recovery_age_secs
    RecoveryStatus cleanup_old(size_t* removed = nullptr) const;

    RecoveryStatus cleanup_orphans(size_t* removed = nullptr) const;

private:
    RecoveryConfig config_;
    RecoveryStorage storage_;
    std::unordered_map<std::string, std::chrono::steady_clock::time_point> last_save_times_;
    bool session_started_ = false;

    static void corrupted(const RecoveryEntry& entry, std::string reason, LoadOutcome* out);
};

} // namespace recovery
} // namespace lectern
