/*
 * SPDX-License-Identifier: AGPL-3.0-or-later
 *
 * Common test helpers for recovery tests
 */

#pragma once

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <vector>

namespace lectern::recovery::test {

// Create a temporary directory for testing
inline std::string create_temp_dir(const std::string& prefix) {
    std::filesystem::path temp_path = std::filesystem::temp_directory_path();

    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<> dis(10000, 99999);

    std::string dir_name = prefix + "_" + std::to_string(dis(gen));
    std::filesystem::path test_dir = temp_path / dir_name;

    std::filesystem::create_directories(test_dir);
    return test_dir.string();
}

inline std::string read_file(const std::string& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

inline void write_file(const std::string& path, const std::string& bytes) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
}

// Sorted names of the regular files in dir
inline std::vector<std::string> list_names(const std::string& dir) {
    std::vector<std::string> names;
    if (!std::filesystem::exists(dir)) {
        return names;
    }
    for (const auto& e : std::filesystem::directory_iterator(dir)) {
        if (e.is_regular_file()) {
            names.push_back(e.path().filename().string());
        }
    }
    std::sort(names.begin(), names.end());
    return names;
}

inline bool has_temp_files(const std::string& dir) {
    for (const auto& name : list_names(dir)) {
        if (name.size() >= 4 && name.compare(name.size() - 4, 4, ".tmp") == 0) {
            return true;
        }
    }
    return false;
}

// Overwrite len bytes at offset with 0xFF
inline void corrupt_file(const std::string& path, size_t offset, size_t len) {
    std::fstream file(path, std::ios::binary | std::ios::in | std::ios::out);
    if (!file) return;

    file.seekp(offset);
    std::string garbage(len, '\xFF');
    file.write(garbage.data(), static_cast<std::streamsize>(len));
}

// Truncate file to simulate torn write
inline void truncate_file(const std::string& path, size_t new_size) {
    std::filesystem::resize_file(path, new_size);
}

// Deterministic printable text of the given size
inline std::string generate_text(size_t size, unsigned seed = 42) {
    static const char alphabet[] = "abcdefghijklmnopqrstuvwxyz \n";
    std::mt19937 gen(seed);
    std::uniform_int_distribution<size_t> dis(0, sizeof(alphabet) - 2);
    std::string s(size, ' ');
    for (auto& c : s) {
        c = alphabet[dis(gen)];
    }
    return s;
}

} // namespace lectern::recovery::test
