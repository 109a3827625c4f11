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


#include "atomic_writer.h"
#include "platform_fs.h"
#include "../util/log.h"

namespace lectern {
namespace recovery {

RecoveryStatus AtomicFileWriter::write(const std::string& path, const std::string& bytes) const {
    return write(path, bytes.data(), bytes.size());
}

RecoveryStatus AtomicFileWriter::write(const std::string& path, const void* data, size_t len) const {
    std::string temp_path = temp_path_for(path);

    FSResult wr = PlatformFS::write_file(temp_path, data, len, sync_);
    if (!wr.ok) {
        PlatformFS::remove_file(temp_path);
        return RecoveryStatus::io(wr.err, "write " + temp_path);
    }

    FSResult rr = PlatformFS::atomic_replace(temp_path, path, sync_);
    if (!rr.ok) {
        // The rename may have happened before a directory fsync failed
        PlatformFS::remove_file(temp_path);
        return RecoveryStatus::io(rr.err, "rename " + temp_path + " -> " + path);
    }

    trace() << "atomic write " << path << " (" << len << " bytes)";
    return RecoveryStatus::OK();
}

} // namespace recovery
} // namespace lectern
