/*
 *   Copyright (c) 2025 Edward Boggis-Rolfe
 *   All rights reserved.
 */

#pragma once

#include <atomic>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "gtest/gtest.h"

// gives each test its own empty schema directory, removed again on tear down
class schema_directory_fixture : public testing::Test
{
    std::filesystem::path root_;

protected:
    void SetUp() override
    {
        static std::atomic<int> counter {0};
        auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
        root_ = std::filesystem::temp_directory_path()
                / ("schema_finder_test_" + std::to_string(stamp) + "_" + std::to_string(counter++));
        std::filesystem::create_directories(root_);
    }

    void TearDown() override
    {
        std::error_code ec;
        std::filesystem::remove_all(root_, ec);
    }

    const std::filesystem::path& get_root() const { return root_; }

    // writes a file relative to the schema directory, creating any sub directories
    std::filesystem::path create_file(const std::string& relative, const std::string& contents = "{}") const
    {
        auto full_path = root_ / relative;
        std::filesystem::create_directories(full_path.parent_path());
        std::ofstream stream(full_path, std::ios::out | std::ios::binary);
        stream << contents;
        return full_path;
    }

    std::filesystem::path create_directory(const std::string& relative) const
    {
        auto full_path = root_ / relative;
        std::filesystem::create_directories(full_path);
        return full_path;
    }
};
