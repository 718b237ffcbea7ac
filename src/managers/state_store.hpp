#pragma once

#include <string>
#include <vector>
#include <optional>
#include <filesystem>
#include <stdexcept>
#include <utility>
#include <fmt/format.h>
#include "sync_types.hpp"

namespace fs = std::filesystem;

// Write pretty JSON to <path>.tmp, then rename it over path. Creates the
// parent directory. Throws std::runtime_error on any I/O failure.
void write_json_atomic(const fs::path& path, const json& value);

// Parse a JSON file. Errors name the path and the parser message.
json read_json_file(const fs::path& path);

template <typename T>
T read_json_as(const fs::path& path) {
    json j = read_json_file(path);
    try {
        return j.get<T>();
    } catch (const json::exception& e) {
        throw std::runtime_error(fmt::format("failed to parse {}: {}", path.string(), e.what()));
    }
}

// Keep [A-Za-z0-9-_.], map everything else to '_'. Empty input becomes "_".
std::string sanitize_segment(const std::string& value);

// {root}/{type}_{name}/{hash12}
fs::path spec_dir(const fs::path& root, const ObjectRef& object, const std::string& hash);

// {root}/{type}/{name}/{direction}/{scope}/spec_{hash12}
fs::path legacy_spec_dir(const fs::path& root, const ObjectRef& object,
                         Direction direction, Scope scope, const std::string& hash);

// Directory for a spec. When reusing, an existing legacy directory is moved
// to the flat layout; if the move fails the legacy path is used in place.
fs::path resolve_spec_dir(const fs::path& root, const ObjectRef& object,
                          Direction direction, Scope scope, const std::string& hash,
                          bool reuse_existing);

// Every spec directory of an object in both layouts, sorted.
std::vector<fs::path> collect_object_spec_dirs(const fs::path& root, const ObjectRef& object);

// Output of a pull spec directory: manifest output_path (absolute or relative
// to the directory), then data/, data.jsonl, data.ndjson.
std::optional<fs::path> resolve_pull_spec_output_path(const fs::path& dir);

void update_manifest_from_pull_state(const fs::path& path, const std::string& hash,
                                     const SyncSpec& spec, const PullState& state,
                                     std::optional<RunStatus> status_override = std::nullopt);

void update_manifest_from_push_state(const fs::path& path, const std::string& hash,
                                     const SyncSpec& spec, const PushState& state,
                                     std::optional<RunStatus> status_override = std::nullopt);

// The three checkpoint files of one spec directory.
class StateStore {
public:
    explicit StateStore(fs::path dir);

    const fs::path& dir() const { return dir_; }
    fs::path spec_path() const;
    fs::path state_path() const;
    fs::path manifest_path() const;
    fs::path data_dir() const;

    bool has_state() const;

    // spec.json never changes for a given directory; written once.
    void ensure_spec(const SyncSpec& spec) const;

    template <typename T>
    std::optional<T> load_state() const {
        if (!has_state()) return std::nullopt;
        return read_json_as<T>(state_path());
    }

    template <typename T>
    void save_state(const T& state) const {
        write_json_atomic(state_path(), json(state));
    }

    // Spec the manifest is keyed by. Must be set before save_checkpoint.
    void bind_spec(const std::string& hash, const SyncSpec& spec);

    // state.json, then manifest.json refreshed from the same state.
    void save_checkpoint(const PullState& state) const;
    void save_checkpoint(const PushState& state) const;

private:
    fs::path dir_;
    std::optional<std::pair<std::string, SyncSpec>> bound_spec_;
};
