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


#include <gtest/gtest.h>
#include <filesystem>
#include <string>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>
#include "../../src/recovery/session_lock.h"
#include "../../src/recovery/platform_fs.h"
#include "test_helpers.h"

using namespace lectern::recovery;
using namespace lectern::recovery::test;
namespace fs = std::filesystem;

class SessionLockTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = create_temp_dir("lectern_session_lock");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    // Pid of a child that has already exited and been reaped
    static uint32_t dead_pid() {
        pid_t child = fork();
        if (child == 0) {
            _exit(0);
        }
        int status = 0;
        waitpid(child, &status, 0);
        return static_cast<uint32_t>(child);
    }

    void write_lock(uint32_t pid) {
        SessionInfo info;
        info.pid = pid;
        info.started_at = unix_now();
        info.working_dir = std::string("/tmp");
        write_file((fs::path(test_dir) / SessionLock::kFileName).string(), SessionLock::to_json(info));
    }
};

TEST_F(SessionLockTest, CreateWritesCurrentProcess) {
    SessionLock lock(test_dir);
    SessionInfo created;
    ASSERT_TRUE(lock.create(&created).ok());

    EXPECT_EQ(created.pid, PlatformFS::current_pid());
    EXPECT_TRUE(fs::exists(lock.path()));
    EXPECT_FALSE(has_temp_files(test_dir));

    std::optional<SessionInfo> read_back;
    ASSERT_TRUE(lock.read(&read_back).ok());
    ASSERT_TRUE(read_back.has_value());
    EXPECT_EQ(read_back->pid, created.pid);
    EXPECT_EQ(read_back->started_at, created.started_at);
    EXPECT_EQ(read_back->working_dir, created.working_dir);
}

TEST_F(SessionLockTest, CreateMakesMissingDirectory) {
    std::string nested = (fs::path(test_dir) / "deep" / "recovery").string();
    SessionLock lock(nested);
    ASSERT_TRUE(lock.create().ok());
    EXPECT_TRUE(fs::exists(lock.path()));
}

TEST_F(SessionLockTest, ReadAbsentLock) {
    SessionLock lock(test_dir);
    std::optional<SessionInfo> info;
    ASSERT_TRUE(lock.read(&info).ok());
    EXPECT_FALSE(info.has_value());
}

TEST_F(SessionLockTest, CorruptLockIsIntegrityError) {
    write_file((fs::path(test_dir) / SessionLock::kFileName).string(), "{ not json");

    SessionLock lock(test_dir);
    std::optional<SessionInfo> info;
    RecoveryStatus st = lock.read(&info);
    EXPECT_TRUE(st.is_integrity()) << st.to_string();
    EXPECT_FALSE(info.has_value());

    bool crashed = true;
    EXPECT_TRUE(lock.detect_crash(&crashed).is_integrity());
    EXPECT_FALSE(crashed);
}

TEST_F(SessionLockTest, LockMissingPidIsIntegrityError) {
    write_file((fs::path(test_dir) / SessionLock::kFileName).string(), "{\"started_at\": 5}");

    SessionLock lock(test_dir);
    std::optional<SessionInfo> info;
    EXPECT_TRUE(lock.read(&info).is_integrity());
}

TEST_F(SessionLockTest, NoCrashWithoutLock) {
    SessionLock lock(test_dir);
    bool crashed = true;
    ASSERT_TRUE(lock.detect_crash(&crashed).ok());
    EXPECT_FALSE(crashed);
}

TEST_F(SessionLockTest, NoCrashWhileOwnerRuns) {
    SessionLock lock(test_dir);
    ASSERT_TRUE(lock.create().ok());

    bool crashed = true;
    ASSERT_TRUE(lock.detect_crash(&crashed).ok());
    EXPECT_FALSE(crashed);
}

TEST_F(SessionLockTest, CrashWhenOwnerIsGone) {
    write_lock(dead_pid());

    SessionLock lock(test_dir);
    bool crashed = false;
    ASSERT_TRUE(lock.detect_crash(&crashed).ok());
    EXPECT_TRUE(crashed);
}

TEST_F(SessionLockTest, RemoveEndsSession) {
    SessionLock lock(test_dir);
    ASSERT_TRUE(lock.create().ok());
    ASSERT_TRUE(lock.remove().ok());
    EXPECT_FALSE(fs::exists(lock.path()));

    // Removing twice is fine
    EXPECT_TRUE(lock.remove().ok());

    bool crashed = true;
    ASSERT_TRUE(lock.detect_crash(&crashed).ok());
    EXPECT_FALSE(crashed);
}

TEST_F(SessionLockTest, UpdateRewritesExistingLock) {
    write_lock(12345);

    SessionLock lock(test_dir);
    ASSERT_TRUE(lock.update().ok());

    std::optional<SessionInfo> info;
    ASSERT_TRUE(lock.read(&info).ok());
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->pid, PlatformFS::current_pid());
}

TEST_F(SessionLockTest, UpdateWithoutLockIsNoop) {
    SessionLock lock(test_dir);
    ASSERT_TRUE(lock.update().ok());
    EXPECT_FALSE(fs::exists(lock.path()));
}

TEST_F(SessionLockTest, JsonWithoutWorkingDir) {
    SessionInfo info;
    ASSERT_TRUE(SessionLock::from_json("{\"pid\": 7, \"started_at\": 100, \"working_dir\": null}", &info).ok());
    EXPECT_EQ(info.pid, 7u);
    EXPECT_EQ(info.started_at, 100u);
    EXPECT_FALSE(info.working_dir.has_value());
}
