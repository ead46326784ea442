/**
 * @file test_helpers.h
 * @brief Common test utilities and helpers for PACS Forward tests
 *
 * Provides utility functions, fixtures, and macros for unit testing.
 * Uses Google Test (gtest) and Google Mock (gmock) frameworks.
 */

#ifndef PACS_FORWARD_TEST_HELPERS_H
#define PACS_FORWARD_TEST_HELPERS_H

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <random>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace pacs::forward::test {

// =============================================================================
// File Utilities
// =============================================================================

/**
 * @brief Write @p content to @p path, creating parent directories
 */
inline void write_file(const std::filesystem::path& path, std::string_view content) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
}

/**
 * @brief Write a file and move its modification time into the past
 * @param age How long ago the file was last written
 */
inline void write_aged_file(const std::filesystem::path& path,
                            std::string_view content,
                            std::chrono::milliseconds age) {
    write_file(path, content);
    std::filesystem::last_write_time(
        path, std::filesystem::file_time_type::clock::now() - age);
}

/**
 * @brief Read entire contents of a file
 */
inline std::string read_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in),
                       std::istreambuf_iterator<char>());
}

/**
 * @brief Write an executable shell script standing in for a DCMTK tool
 * @param body Script body run by /bin/sh
 */
inline std::filesystem::path write_script(const std::filesystem::path& path,
                                          std::string_view body) {
    write_file(path, "#!/bin/sh\n" + std::string(body) + "\n");
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

/**
 * @brief Count regular files below @p dir (recursive)
 */
inline size_t count_files(const std::filesystem::path& dir) {
    size_t count = 0;
    std::error_code ec;
    for (std::filesystem::recursive_directory_iterator it(dir, ec), end;
         !ec && it != end; it.increment(ec)) {
        if (it->is_regular_file()) {
            ++count;
        }
    }
    return count;
}

// =============================================================================
// Synchronization Utilities
// =============================================================================

/**
 * @brief Wait for a condition using polling with timeout
 *
 * @tparam Predicate Callable returning bool
 * @param pred Predicate to wait for
 * @param timeout Maximum wait time (default 5 seconds)
 * @return true if condition met, false on timeout
 */
template <typename Predicate>
bool wait_for(Predicate pred,
              std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return true;
}

// =============================================================================
// Test Fixture Base Class
// =============================================================================

/**
 * @brief Base fixture for PACS Forward tests
 *
 * Gives each test its own scratch directory, removed on teardown.
 */
class pacs_forward_test : public ::testing::Test {
protected:
    void SetUp() override {
        std::random_device rd;
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        std::string name = info != nullptr
                               ? std::string(info->test_suite_name()) + "_" +
                                     info->name()
                               : std::string("test");
        for (auto& c : name) {
            if (c == '/') {
                c = '_';
            }
        }
        root_ = std::filesystem::temp_directory_path() /
                ("pacs_forward_" + name + "_" + std::to_string(rd()));
        std::filesystem::create_directories(root_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    /**
     * @brief Scratch directory of the current test
     */
    [[nodiscard]] const std::filesystem::path& root() const { return root_; }

    /**
     * @brief Create and return a sub directory of the scratch directory
     */
    std::filesystem::path make_dir(std::string_view name) {
        auto dir = root_ / name;
        std::filesystem::create_directories(dir);
        return dir;
    }

private:
    std::filesystem::path root_;
};

// =============================================================================
// Custom Matchers
// =============================================================================

/**
 * @brief Matcher for checking if a string contains a substring
 */
MATCHER_P(ContainsSubstring, substring, "") {
    return arg.find(substring) != std::string::npos;
}

}  // namespace pacs::forward::test

#endif  // PACS_FORWARD_TEST_HELPERS_H
