#pragma once

#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using json = nlohmann::json;

// Fresh directory per test, removed afterwards.
class TempDirTest : public ::testing::Test {
protected:
    fs::path test_dir;

    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        test_dir = fs::temp_directory_path() /
                   (std::string("tracesync_") + info->test_suite_name() + "_" + info->name());
        fs::remove_all(test_dir);
        fs::create_directories(test_dir);
    }

    void TearDown() override {
        fs::remove_all(test_dir);
    }

    void write_file(const fs::path& path, const std::string& content) {
        fs::create_directories(path.parent_path());
        std::ofstream(path, std::ios::binary) << content;
    }

    static std::vector<std::string> read_lines(const fs::path& path) {
        std::vector<std::string> lines;
        std::ifstream in(path);
        std::string line;
        while (std::getline(in, line)) lines.push_back(line);
        return lines;
    }

    static json read_json(const fs::path& path) {
        std::ifstream in(path);
        return json::parse(in);
    }
};

// "limit: 25" -> 25
inline size_t query_limit(const std::string& query) {
    auto pos = query.find("limit: ");
    if (pos == std::string::npos) return 0;
    return std::stoul(query.substr(pos + 7));
}

// cursor: "12" -> "12"
inline std::optional<std::string> query_cursor(const std::string& query) {
    auto pos = query.find("cursor: ");
    if (pos == std::string::npos) return std::nullopt;
    return json::parse(query.substr(pos + 8)).get<std::string>();
}
