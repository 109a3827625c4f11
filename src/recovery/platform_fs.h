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
#include <string>
#include <utility>
#include <vector>

namespace lectern {
    namespace recovery {

        struct FSResult {
            bool ok;
            int err;
        };

        // Thin wrapper over the POSIX file and process calls the recovery
        // store needs. Every call reports errno instead of throwing.
        class PlatformFS {
        public:
            static FSResult write_file(const std::string& path, const void* data, size_t len,
                                       bool sync);
            static FSResult read_file(const std::string& path, std::string* out);

            static FSResult flush_file(intptr_t file_handle);
            static FSResult fsync_directory(const std::string& dir_path);

            // rename(2) tmp onto final. With sync the parent directory is
            // fsynced afterwards so the new entry survives power loss.
            static FSResult atomic_replace(const std::string& tmp, const std::string& final,
                                           bool sync);

            // ENOENT is reported as success: the file is gone either way.
            static FSResult remove_file(const std::string& path);

            static bool exists(const std::string& path);
            static std::pair<FSResult, size_t> file_size(const std::string& path);
            static std::pair<FSResult, uint64_t> file_mtime(const std::string& path);
            static FSResult ensure_directory(const std::string& path);

            // Names (not paths) of the regular files in dir_path, sorted.
            static FSResult list_files(const std::string& dir_path, std::vector<std::string>* names);

            static uint32_t current_pid();

            // kill(pid, 0): alive if it succeeds or fails with EPERM.
            static bool process_alive(uint32_t pid);
        };

    }
} // namespace lectern::recovery
