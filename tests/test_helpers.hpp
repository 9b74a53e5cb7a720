/**
 * @file test_helpers.hpp
 * @brief Shared fixtures for tests touching the filesystem or waiting on threads
 */
#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <functional>
#include <stdexcept>
#include <string>
#include <thread>

namespace helpers {

/**
 * @brief Unique directory removed when the fixture goes out of scope
 */
class TempDir {
public:
    TempDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "camsim-test-XXXXXX").string();
        if (!mkdtemp(&pattern[0])) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }
    std::string str() const { return path_.string(); }

    // Create a file with the given name and contents
    std::string touch(const std::string& name, const std::string& contents = "x") const {
        const auto file = path_ / name;
        std::ofstream out(file);
        out << contents;
        return file.string();
    }

private:
    std::filesystem::path path_;
};

/**
 * @brief Poll predicate until it holds or the timeout expires
 */
inline bool waitFor(const std::function<bool()>& predicate,
                    std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(2));
    }
    return predicate();
}

} // namespace helpers
