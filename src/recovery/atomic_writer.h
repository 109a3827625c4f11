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
#include "status.h"

namespace lectern {
namespace recovery {

/**
 * AtomicFileWriter - temp + rename writes
 *
 * write() stores the bytes in "<path>.tmp" and renames it onto <path>, so a
 * reader sees either the previous file or the complete new one. A failure
 * before the rename leaves <path> untouched and removes the temp file.
 *
 * Without sync nothing is fsynced: an editor crash is safe because the page
 * cache survives it, a power loss during the temp write may lose that write.
 */
class AtomicFileWriter {
public:
    static constexpr const char* kTempSuffix = ".tmp";

    explicit AtomicFileWriter(bool sync = false) : sync_(sync) {}

    RecoveryStatus write(const std::string& path, const std::string& bytes) const;
    RecoveryStatus write(const std::string& path, const void* data, size_t len) const;

    static std::string temp_path_for(const std::string& path) {
        return path + kTempSuffix;
    }

    bool sync() const { return sync_; }

private:
    bool sync_;
};

} // namespace recovery
} // namespace lectern
