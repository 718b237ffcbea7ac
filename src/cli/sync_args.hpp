#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <managers/sync_types.hpp>

namespace fs = std::filesystem;

// Flags shared by pull, push and status.
struct CommonSyncArgs {
    std::string object_ref;
    std::optional<std::string> filter;
    std::optional<size_t> traces;
    std::optional<size_t> spans;
    size_t page_size = 0;
    fs::path root;
};

struct PullArgs : CommonSyncArgs {
    std::optional<std::string> cursor;
    bool fresh = false;
    size_t workers = 0;
};

struct PushArgs : CommonSyncArgs {
    std::optional<fs::path> input;
    bool fresh = false;
    size_t workers = 0;
};

struct StatusArgs : CommonSyncArgs {
    Direction direction = Direction::Pull;
};

// Parse the arguments following the subcommand name. Flags take their value
// either as the next argument or inline (--page-size=50). Unset sizes and the
// root come from the configured defaults.
Result<PullArgs> parse_pull_args(const std::vector<std::string>& args,
                                 const SyncDefaults& defaults);
Result<PushArgs> parse_push_args(const std::vector<std::string>& args,
                                 const SyncDefaults& defaults);
Result<StatusArgs> parse_status_args(const std::vector<std::string>& args,
                                     const SyncDefaults& defaults);
