#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include "sync_types.hpp"

namespace fs = std::filesystem;

struct StatusQuery {
    ObjectRef object;
    Direction direction = Direction::Pull;
    Scope scope = Scope::All;
    std::optional<size_t> limit;
    std::optional<std::string> filter;
    size_t page_size = 0;
    fs::path root = "tracesync";
};

// {spec_dir, spec_hash, direction, spec?, state?, manifest?} for the spec the
// query describes. Throws if the spec directory does not exist. Reads only,
// apart from moving a legacy-layout directory into place.
json build_status_report(const StatusQuery& query);
