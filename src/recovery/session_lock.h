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
#include "atomic_writer.h"

namespace lectern {
namespace recovery {

/**
 * SessionLock - liveness witness for crash detection
 *
 * A single "session.lock" file in the recovery directory records the owning
 * process id and a heartbeat. It is created at startup, refreshed while the
 * editor runs and removed on clean shutdown. If the next launch finds the file
 * and the recorded process is gone, the previous run crashed.
 *
 * A pid reused by the OS after a crash makes the old session look alive and
 * hides the crash.
 */
class SessionLock {
public:
    static constexpr const char* kFileName = "session.lock";

    explicit SessionLock(std::string recovery_dir, bool sync_writes = false);

    // Write a fresh SessionInfo for this process
    RecoveryStatus create(SessionInfo* out = nullptr);

    // Rewrite with a new heartbeat; no-op when no lock exists
    RecoveryStatus update();

    // Delete the lock; absent is not an error
    RecoveryStatus remove();

    // Empty optional when there is no lock file
    RecoveryStatus read(std::optional<SessionInfo>* out) const;

    // True iff the lock exists and its process is not running
    RecoveryStatus detect_crash(bool* crashed) const;

    std::string path() const;

    static std::string to_json(const SessionInfo& info);
    static RecoveryStatus from_json(const std::string& json_str, SessionInfo* out);

private:
    std::string dir_;
    AtomicFileWriter writer_;
};

} // namespace recovery
} // namespace lectern
