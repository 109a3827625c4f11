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


#include "platform_fs.h"

#ifndef _WIN32
#include <unistd.h>
#include <fcntl.h>
#include <signal.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <dirent.h>
#include <cerrno>
#include <cstring>
#include <cstdint>
#include <algorithm>
#include <filesystem>

namespace lectern {
    namespace recovery {

        FSResult PlatformFS::write_file(const std::string& path, const void* data, size_t len,
                                        bool sync) {
            int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
            if (fd < 0) {
                return {false, errno};
            }

            const char* p = static_cast<const char*>(data);
            size_t remaining = len;
            while (remaining > 0) {
                ssize_t n = ::write(fd, p, remaining);
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int e = errno;
                    ::close(fd);
                    return {false, e};
                }
                p += n;
                remaining -= size_t(n);
            }

            if (sync) {
                FSResult fr = flush_file(fd);
                if (!fr.ok) {
                    ::close(fd);
                    return fr;
                }
            }

            if (::close(fd) != 0) {
                return {false, errno};
            }
            return {true, 0};
        }

        FSResult PlatformFS::read_file(const std::string& path, std::string* out) {
            int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
            if (fd < 0) {
                return {false, errno};
            }

            struct stat st{};
            if (::fstat(fd, &st) != 0) {
                int e = errno;
                ::close(fd);
                return {false, e};
            }

            std::string buf;
            buf.reserve(size_t(st.st_size));
            char chunk[64 * 1024];
            for (;;) {
                ssize_t n = ::read(fd, chunk, sizeof(chunk));
                if (n < 0) {
                    if (errno == EINTR) continue;
                    int e = errno;
                    ::close(fd);
                    return {false, e};
                }
                if (n == 0) break;
                buf.append(chunk, size_t(n));
            }

            ::close(fd);
            out->swap(buf);
            return {true, 0};
        }

        FSResult PlatformFS::flush_file(intptr_t file_handle) {
            int rc = ::fdatasync((int)file_handle);
            return { rc == 0, rc == 0 ? 0 : errno };
        }

        FSResult PlatformFS::fsync_directory(const std::string& dir_path) {
            int fd = ::open(dir_path.c_str(), O_RDONLY);
            if (fd < 0) {
                return {false, errno};
            }

            int rc = ::fsync(fd);
            int saved_errno = errno;
            ::close(fd);

            return {rc == 0, rc == 0 ? 0 : saved_errno};
        }

        FSResult PlatformFS::atomic_replace(const std::string& src, const std::string& dst,
                                            bool sync) {
            int rc = ::rename(src.c_str(), dst.c_str());
            if (rc != 0) {
                return {false, errno};
            }
            if (!sync) {
                return {true, 0};
            }

            std::filesystem::path dst_path(dst);
            std::string parent_dir = dst_path.parent_path().string();
            if (parent_dir.empty()) {
                parent_dir = ".";
            }

            return fsync_directory(parent_dir);
        }

        FSResult PlatformFS::remove_file(const std::string& path) {
            if (::unlink(path.c_str()) == 0 || errno == ENOENT) {
                return {true, 0};
            }
            return {false, errno};
        }

        bool PlatformFS::exists(const std::string& path) {
            struct stat st{};
            return ::stat(path.c_str(), &st) == 0;
        }

        std::pair<FSResult, size_t> PlatformFS::file_size(const std::string& path) {
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (size_t)st.st_size : 0 };
        }

        std::pair<FSResult, uint64_t> PlatformFS::file_mtime(const std::string& path) {
            struct stat st{};
            int rc = ::stat(path.c_str(), &st);
            return { { rc == 0, rc == 0 ? 0 : errno }, rc == 0 ? (uint64_t)st.st_mtime : 0 };
        }

        FSResult PlatformFS::ensure_directory(const std::string& path) {
            std::error_code ec;
            std::filesystem::create_directories(path, ec);
            if (ec) {
                if (std::filesystem::is_directory(path)) {
                    return {true, 0};
                }
                return {false, ec.value()};
            }
            return {true, 0};
        }

        FSResult PlatformFS::list_files(const std::string& dir_path, std::vector<std::string>* names) {
            DIR* dir = ::opendir(dir_path.c_str());
            if (!dir) {
                return {false, errno};
            }

            names->clear();
            errno = 0;
            while (struct dirent* ent = ::readdir(dir)) {
                std::string name(ent->d_name);
                if (name == "." || name == "..") {
                    continue;
                }
                struct stat st{};
                std::string full = dir_path + "/" + name;
                if (::stat(full.c_str(), &st) == 0 && S_ISREG(st.st_mode)) {
                    names->push_back(name);
                }
                errno = 0;
            }
            int e = errno;
            ::closedir(dir);
            if (e != 0) {
                return {false, e};
            }

            std::sort(names->begin(), names->end());
            return {true, 0};
        }

        uint32_t PlatformFS::current_pid() {
            return static_cast<uint32_t>(::getpid());
        }

        bool PlatformFS::process_alive(uint32_t pid) {
            // pid_t is signed; larger values would address a process group
            if (pid == 0 || pid > uint32_t(INT32_MAX)) {
                return false;
            }
            if (::kill(static_cast<pid_t>(pid), 0) == 0) {
                return true;
            }
            return errno == EPERM;
        }

    } // namespace recovery
} // namespace lectern
#endif
