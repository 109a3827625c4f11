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
#include <utility>

namespace lectern {
namespace recovery {

    enum class RecoveryErrc {
        Ok,
        Io,         // open/read/write/rename/remove failed; err holds errno
        NotFound,   // a required file or entry is absent
        Integrity   // on-disk state is inconsistent or unparseable
    };

    const char* errc_name(RecoveryErrc code);

    /**
     * Outcome of a fallible recovery operation.
     *
     * Values are handed back through out-parameters; the status only says
     * whether they are valid and, if not, which class of failure occurred.
     */
    struct RecoveryStatus {
        RecoveryErrc code = RecoveryErrc::Ok;
        int err = 0;
        std::string message;

        bool ok() const { return code == RecoveryErrc::Ok; }
        bool is_io() const { return code == RecoveryErrc::Io; }
        bool is_not_found() const { return code == RecoveryErrc::NotFound; }
        bool is_integrity() const { return code == RecoveryErrc::Integrity; }

        static RecoveryStatus OK() { return RecoveryStatus(); }

        static RecoveryStatus io(int err, std::string message) {
            return {RecoveryErrc::Io, err, std::move(message)};
        }
        static RecoveryStatus not_found(std::string message) {
            return {RecoveryErrc::NotFound, 0, std::move(message)};
        }
        static RecoveryStatus integrity(std::string message) {
            return {RecoveryErrc::Integrity, 0, std::move(message)};
        }

        // "Io(errno:2 No such file or directory): open foo.meta.json"
        std::string to_string() const;
    };

} // namespace recovery
} // namespace lectern
