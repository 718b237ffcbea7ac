#include "jsonl_writer.hpp"
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <fmt/format.h>

fs::path output_part_path(const fs::path& dir, size_t part_index) {
    return dir / fmt::format("part-{:06}.jsonl", part_index);
}

std::vector<size_t> list_output_part_indices(const fs::path& dir) {
    std::vector<size_t> indices;
    if (!fs::exists(dir)) return indices;

    const std::string prefix = "part-";
    const std::string suffix = ".jsonl";
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        std::string name = entry.path().filename().string();
        if (name.size() <= prefix.size() + suffix.size()) continue;
        if (name.compare(0, prefix.size(), prefix) != 0) continue;
        if (name.compare(name.size() - suffix.size(), suffix.size(), suffix) != 0) continue;

        std::string num = name.substr(prefix.size(), name.size() - prefix.size() - suffix.size());
        if (!std::all_of(num.begin(), num.end(), [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        try {
            indices.push_back(static_cast<size_t>(std::stoull(num)));
        } catch (const std::out_of_range&) {
            continue;
        }
    }
    return indices;
}

JsonlPartWriter::JsonlPartWriter(const fs::path& dir, bool append, uint64_t max_part_bytes)
    : dir_(dir), max_part_bytes_(max_part_bytes) {
    std::error_code ec;
    fs::create_directories(dir_, ec);
    if (ec) {
        throw std::runtime_error(fmt::format("failed to create {}: {}", dir_.string(), ec.message()));
    }

    auto indices = list_output_part_indices(dir_);
    if (append && !indices.empty()) {
        part_index_ = *std::max_element(indices.begin(), indices.end());
        current_bytes_ = fs::file_size(output_part_path(dir_, part_index_));
        open_part(true);
    } else {
        part_index_ = 1;
        current_bytes_ = 0;
        open_part(false);
    }
}

void JsonlPartWriter::open_part(bool append) {
    fs::path path = output_part_path(dir_, part_index_);
    auto mode = std::ios::binary | (append ? std::ios::app : std::ios::trunc);
    out_.open(path, mode);
    if (!out_) {
        throw std::runtime_error(fmt::format("failed to open output file {}", path.string()));
    }
}

size_t JsonlPartWriter::write_line(const std::string& line) {
    uint64_t line_bytes = line.size() + 1;
    if (current_bytes_ > 0 && current_bytes_ + line_bytes > max_part_bytes_) {
        rotate();
    }
    out_ << line << '\n';
    if (!out_) {
        throw std::runtime_error(fmt::format("failed to write JSONL row to {}",
                                             output_part_path(dir_, part_index_).string()));
    }
    current_bytes_ += line_bytes;
    return static_cast<size_t>(line_bytes);
}

size_t JsonlPartWriter::write_row(const json& row) {
    return write_line(row.dump());
}

void JsonlPartWriter::flush() {
    out_.flush();
    if (!out_) {
        throw std::runtime_error("failed to flush JSONL output");
    }
}

void JsonlPartWriter::rotate() {
    flush();
    out_.close();
    part_index_++;
    current_bytes_ = 0;
    open_part(false);
}
