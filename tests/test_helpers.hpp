// tests/test_helpers.hpp
#pragma once

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <string>
#include <system_error>
#include <vector>

#include <gtest/gtest.h>

namespace PackageSync {
namespace Testing {

// A fresh directory under the system temp dir, removed with everything in it
// when the object goes away.
class TempDir {
public:
    TempDir() {
        const ::testing::TestInfo* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = "package_sync_";
        if (info != nullptr) {
            name += std::string(info->test_suite_name()) + "_" + info->name() + "_";
        }
        // Parameterized tests carry '/' in their names
        std::replace(name.begin(), name.end(), '/', '_');
        std::random_device rd;
        name += std::to_string(rd());
        dir_path = std::filesystem::temp_directory_path() / name;
        std::filesystem::create_directories(dir_path);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(dir_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return dir_path; }

private:
    std::filesystem::path dir_path;
};

// Names of the entries directly inside dir
inline std::vector<std::string> listNames(const std::filesystem::path& dir) {
    std::vector<std::string> names;
    for (const auto& entry : std::filesystem::directory_iterator(dir)) {
        names.push_back(entry.path().filename().string());
    }
    std::sort(names.begin(), names.end());
    return names;
}

// Deterministic pseudo-random bytes; the same seed always gives the same data.
inline std::vector<char> randomBytes(size_t size, uint32_t seed) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    std::vector<char> data(size);
    for (auto& byte : data) {
        byte = static_cast<char>(dist(gen));
    }
    return data;
}

inline void writeFile(const std::filesystem::path& path, const std::vector<char>& data) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream ofs(path, std::ios::binary | std::ios::trunc);
    ofs.write(data.data(), static_cast<std::streamsize>(data.size()));
}

inline void writeFile(const std::filesystem::path& path, const std::string& text) {
    writeFile(path, std::vector<char>(text.begin(), text.end()));
}

inline std::vector<char> readFile(const std::filesystem::path& path) {
    std::ifstream ifs(path, std::ios::binary);
    return std::vector<char>((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

} // namespace Testing
} // namespace PackageSync
