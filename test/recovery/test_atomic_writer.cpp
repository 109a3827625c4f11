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
#include "../../src/recovery/atomic_writer.h"
#include "test_helpers.h"

using namespace lectern::recovery;
using namespace lectern::recovery::test;
namespace fs = std::filesystem;

class AtomicWriterTest : public ::testing::Test {
protected:
    std::string test_dir;

    void SetUp() override {
        test_dir = create_temp_dir("lectern_atomic_writer");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string path(const std::string& name) const {
        return (fs::path(test_dir) / name).string();
    }
};

TEST_F(AtomicWriterTest, TempPathAppendsSuffix) {
    EXPECT_EQ(AtomicFileWriter::temp_path_for("/x/abc.meta.json"), "/x/abc.meta.json.tmp");
}

TEST_F(AtomicWriterTest, WritesNewFile) {
    AtomicFileWriter writer;
    RecoveryStatus st = writer.write(path("out"), std::string("hello"));
    ASSERT_TRUE(st.ok()) << st.to_string();

    EXPECT_EQ(read_file(path("out")), "hello");
    EXPECT_FALSE(has_temp_files(test_dir));
}

TEST_F(AtomicWriterTest, ReplacesExistingFile) {
    write_file(path("out"), "previous contents that are longer");

    AtomicFileWriter writer(true);
    ASSERT_TRUE(writer.write(path("out"), std::string("new")).ok());

    EXPECT_EQ(read_file(path("out")), "new");
    EXPECT_FALSE(has_temp_files(test_dir));
}

TEST_F(AtomicWriterTest, EmptyPayload) {
    AtomicFileWriter writer;
    ASSERT_TRUE(writer.write(path("empty"), std::string()).ok());
    EXPECT_TRUE(fs::exists(path("empty")));
    EXPECT_EQ(fs::file_size(path("empty")), 0u);
}

TEST_F(AtomicWriterTest, MissingDirectoryIsIoError) {
    AtomicFileWriter writer;
    RecoveryStatus st = writer.write(path("no/such/dir/out"), std::string("x"));
    EXPECT_TRUE(st.is_io());
    EXPECT_EQ(st.err, ENOENT);
}

TEST_F(AtomicWriterTest, FailedRenameLeavesTargetAndNoTemp) {
    // A non-empty directory cannot be replaced by a regular file
    fs::create_directories(path("target"));
    write_file(path("target/keep"), "keep");

    AtomicFileWriter writer;
    RecoveryStatus st = writer.write(path("target"), std::string("payload"));
    EXPECT_TRUE(st.is_io());

    EXPECT_TRUE(fs::is_directory(path("target")));
    EXPECT_EQ(read_file(path("target/keep")), "keep");
    EXPECT_FALSE(fs::exists(path("target.tmp")));
}
