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
#include <random>
#include <string>
#include <vector>
#include "../../src/recovery/reconstruct.h"
#include "../../src/recovery/recovery_storage.h"
#include "test_helpers.h"

using namespace lectern::recovery;
using namespace lectern::recovery::test;
namespace fs = std::filesystem;

namespace {

ChunkedRecoveryData make_data(const std::string& original, std::vector<RecoveryChunk> chunks) {
    size_t final_size = expected_final_size(original.size(), chunks);
    return ChunkedRecoveryData(original.size(), final_size, std::move(chunks));
}

// Apply ascending, non-overlapping splices directly, back to front
std::string splice(std::string s, const std::vector<RecoveryChunk>& chunks) {
    for (auto it = chunks.rbegin(); it != chunks.rend(); ++it) {
        s.replace(it->offset, it->original_len, it->content);
    }
    return s;
}

} // namespace

class ReconstructTest : public ::testing::Test {
protected:
    const std::string original = "ABCDEFGH";
    std::string test_dir;

    void SetUp() override {
        test_dir = create_temp_dir("lectern_reconstruct");
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    std::string apply_ok(const std::string& orig, std::vector<RecoveryChunk> chunks) {
        std::string out;
        RecoveryStatus st = apply_chunks(orig, make_data(orig, std::move(chunks)), &out);
        EXPECT_TRUE(st.ok()) << st.to_string();
        return out;
    }

    // Persist the chunks, then rebuild from the stored entry and the original on disk
    std::string save_and_reconstruct(const std::string& orig, const std::vector<RecoveryChunk>& chunks) {
        std::string original_path = (fs::path(test_dir) / "original.txt").string();
        write_file(original_path, orig);

        RecoveryStorage storage((fs::path(test_dir) / "recovery").string());
        SaveRequest req;
        req.original_path = original_path;
        req.original_file_size = orig.size();
        req.final_size = expected_final_size(orig.size(), chunks);

        RecoveryStatus st = storage.save_recovery("edit", chunks, req);
        EXPECT_TRUE(st.ok()) << st.to_string();

        std::string out;
        st = storage.reconstruct_from_chunks("edit", original_path, &out);
        EXPECT_TRUE(st.ok()) << st.to_string();
        return out;
    }
};

TEST_F(ReconstructTest, ConcreteScenario) {
    std::string orig = "Hello, this is the original content of the file!";
    std::string out = apply_ok(orig, {
        RecoveryChunk(0, 0, "PREFIX: "),
        RecoveryChunk(19, 8, "MODIFIED"),
    });
    EXPECT_EQ(out, "PREFIX: Hello, this is the MODIFIED content of the file!");
}

TEST_F(ReconstructTest, InsertAtEveryPosition) {
    for (size_t pos = 0; pos <= original.size(); pos++) {
        std::string expected = original;
        expected.insert(pos, "XYZ");
        EXPECT_EQ(save_and_reconstruct(original, {RecoveryChunk(pos, 0, "XYZ")}), expected) << "pos=" << pos;
    }
}

TEST_F(ReconstructTest, DeleteAtEveryPosition) {
    for (size_t pos = 0; pos < original.size(); pos++) {
        for (size_t len = 1; pos + len <= original.size(); len++) {
            std::string expected = original;
            expected.erase(pos, len);
            EXPECT_EQ(apply_ok(original, {RecoveryChunk(pos, len, "")}), expected)
                << "pos=" << pos << " len=" << len;
        }
    }
}

TEST_F(ReconstructTest, ReplaceAtEveryPosition) {
    for (size_t pos = 0; pos < original.size(); pos++) {
        for (size_t len = 1; pos + len <= original.size(); len++) {
            std::string expected = original;
            expected.replace(pos, len, "xy");
            EXPECT_EQ(save_and_reconstruct(original, {RecoveryChunk(pos, len, "xy")}), expected)
                << "pos=" << pos << " len=" << len;
        }
    }
}

TEST_F(ReconstructTest, FullReplace) {
    EXPECT_EQ(apply_ok(original, {RecoveryChunk(0, original.size(), "entirely new text")}),
              "entirely new text");
}

TEST_F(ReconstructTest, DeleteAll) {
    EXPECT_EQ(apply_ok(original, {RecoveryChunk(0, original.size(), "")}), "");
}

TEST_F(ReconstructTest, NoOpChunk) {
    EXPECT_EQ(apply_ok(original, {RecoveryChunk(3, 0, "")}), original);
    EXPECT_EQ(apply_ok(original, {}), original);
}

TEST_F(ReconstructTest, AdjacentChunks) {
    // Second chunk starts exactly where the first one's replaced span ends
    EXPECT_EQ(apply_ok(original, {RecoveryChunk(0, 2, "ab"), RecoveryChunk(2, 2, "cd")}),
              "abcdEFGH");
}

TEST_F(ReconstructTest, NewBufferFromEmptyOriginal) {
    EXPECT_EQ(apply_ok("", {RecoveryChunk(0, 0, "fresh buffer\n")}), "fresh buffer\n");
}

TEST_F(ReconstructTest, RandomEditsRoundTrip) {
    std::mt19937 gen(1234);
    for (int round = 0; round < 200; round++) {
        std::string orig = generate_text(std::uniform_int_distribution<size_t>(0, 300)(gen), round);

        std::vector<RecoveryChunk> chunks;
        size_t pos = 0;
        while (pos <= orig.size()) {
            size_t gap = std::uniform_int_distribution<size_t>(0, 40)(gen);
            if (pos + gap > orig.size()) {
                break;
            }
            pos += gap;
            size_t max_len = std::min<size_t>(orig.size() - pos, 20);
            size_t len = std::uniform_int_distribution<size_t>(0, max_len)(gen);
            std::string content = generate_text(std::uniform_int_distribution<size_t>(0, 25)(gen),
                                                round * 1000 + static_cast<unsigned>(pos));
            chunks.emplace_back(pos, len, content);
            pos += len;
            if (len == 0) {
                pos++;   // at most one insertion per position
            }
        }

        std::string expected = splice(orig, chunks);
        EXPECT_EQ(save_and_reconstruct(orig, chunks), expected) << "round=" << round;
    }
}

TEST_F(ReconstructTest, ExpectedFinalSize) {
    std::vector<RecoveryChunk> chunks = {RecoveryChunk(0, 0, "PREFIX: "), RecoveryChunk(19, 8, "MODIFIED")};
    EXPECT_EQ(expected_final_size(49, chunks), 57u);
    EXPECT_EQ(expected_final_size(8, {RecoveryChunk(0, 8, "")}), 0u);
}

TEST_F(ReconstructTest, OriginalSizeMismatchFails) {
    ChunkedRecoveryData data = make_data(original, {RecoveryChunk(1, 1, "b")});
    std::string out = "untouched";
    RecoveryStatus st = apply_chunks(original + "extra", data, &out);
    EXPECT_TRUE(st.is_integrity());
    EXPECT_EQ(out, "untouched");
}

TEST_F(ReconstructTest, FinalSizeMismatchFails) {
    ChunkedRecoveryData data(original.size(), 100, {RecoveryChunk(1, 1, "b")});
    std::string out;
    EXPECT_TRUE(apply_chunks(original, data, &out).is_integrity());
    EXPECT_TRUE(out.empty());
}

TEST_F(ReconstructTest, UnsortedChunksFail) {
    ChunkedRecoveryData data(original.size(), original.size(),
                             {RecoveryChunk(5, 1, "x"), RecoveryChunk(1, 1, "y")});
    std::string out;
    EXPECT_TRUE(apply_chunks(original, data, &out).is_integrity());
}

TEST_F(ReconstructTest, OverlappingChunksFail) {
    ChunkedRecoveryData data(original.size(), original.size(),
                             {RecoveryChunk(1, 3, "abc"), RecoveryChunk(2, 1, "z")});
    std::string out;
    EXPECT_TRUE(apply_chunks(original, data, &out).is_integrity());
}

TEST_F(ReconstructTest, ChunkPastEndFails) {
    std::string out;
    EXPECT_TRUE(apply_chunks(original, ChunkedRecoveryData(8, 8, {RecoveryChunk(9, 0, "")}), &out)
                    .is_integrity());
    EXPECT_TRUE(apply_chunks(original, ChunkedRecoveryData(8, 8, {RecoveryChunk(6, 3, "abc")}), &out)
                    .is_integrity());
}
