#pragma once

#include <string>
#include <vector>
#include <fstream>
#include <filesystem>
#include <cstdint>
#include <core/constants.hpp>
#include "sync_types.hpp"

namespace fs = std::filesystem;

// {dir}/part-000001.jsonl
fs::path output_part_path(const fs::path& dir, size_t part_index);

// Indices of the part-*.jsonl files in dir, unsorted. Empty if dir is missing.
std::vector<size_t> list_output_part_indices(const fs::path& dir);

// Appends one JSON document per line to numbered part files, starting a new
// part when the next line would push a non-empty part past max_part_bytes.
class JsonlPartWriter {
public:
    // append: continue the highest existing part from its current size.
    // Otherwise part 1 is truncated.
    JsonlPartWriter(const fs::path& dir, bool append,
                    uint64_t max_part_bytes = PULL_OUTPUT_PART_MAX_BYTES);

    JsonlPartWriter(const JsonlPartWriter&) = delete;
    JsonlPartWriter& operator=(const JsonlPartWriter&) = delete;

    // Returns bytes written, newline included.
    size_t write_line(const std::string& line);
    size_t write_row(const json& row);

    void flush();

    size_t part_index() const { return part_index_; }
    uint64_t current_bytes() const { return current_bytes_; }

private:
    void open_part(bool append);
    void rotate();

    fs::path dir_;
    uint64_t max_part_bytes_;
    size_t part_index_ = 1;
    uint64_t current_bytes_ = 0;
    std::ofstream out_;
};
