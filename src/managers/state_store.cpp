#include "state_store.hpp"
#include <core/constants.hpp>
#include <fstream>
#include <sstream>
#include <algorithm>
#include <cctype>

// ── JSON files ──────────────────────────────────────────────

void write_json_atomic(const fs::path& path, const json& value) {
    fs::path parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        fs::create_directories(parent, ec);
        if (ec) {
            throw std::runtime_error(fmt::format("failed to create {}: {}",
                                                 parent.string(), ec.message()));
        }
    }

    fs::path tmp = path;
    tmp.replace_extension("tmp");
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw std::runtime_error(fmt::format("failed to write {}", tmp.string()));
        }
        out << value.dump(2);
        out.flush();
        if (!out) {
            throw std::runtime_error(fmt::format("failed to write {}", tmp.string()));
        }
    }

    std::error_code ec;
    fs::rename(tmp, path, ec);
    if (ec) {
        throw std::runtime_error(fmt::format("failed to move temporary file {} to {}: {}",
                                             tmp.string(), path.string(), ec.message()));
    }
}

json read_json_file(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error(fmt::format("failed to read {}", path.string()));
    }
    std::stringstream buf;
    buf << in.rdbuf();

    try {
        return json::parse(buf.str());
    } catch (const json::parse_error& e) {
        throw std::runtime_error(fmt::format("failed to parse {}: {}", path.string(), e.what()));
    }
}

// ── Spec directory layout ───────────────────────────────────

std::string sanitize_segment(const std::string& value) {
    std::string out;
    out.reserve(value.size());
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.') {
            out += static_cast<char>(c);
        } else {
            out += '_';
        }
    }
    if (out.empty()) return "_";
    return out;
}

static std::string hash_prefix(const std::string& hash) {
    return hash.substr(0, SPEC_HASH_PREFIX_LEN);
}

static fs::path object_base_dir(const fs::path& root, const ObjectRef& object) {
    return root / (sanitize_segment(object.object_type) + "_" +
                   sanitize_segment(object.object_name));
}

fs::path spec_dir(const fs::path& root, const ObjectRef& object, const std::string& hash) {
    return object_base_dir(root, object) / hash_prefix(hash);
}

fs::path legacy_spec_dir(const fs::path& root, const ObjectRef& object,
                         Direction direction, Scope scope, const std::string& hash) {
    return root / sanitize_segment(object.object_type) / sanitize_segment(object.object_name) /
           to_string(direction) / to_string(scope) / ("spec_" + hash_prefix(hash));
}

fs::path resolve_spec_dir(const fs::path& root, const ObjectRef& object,
                          Direction direction, Scope scope, const std::string& hash,
                          bool reuse_existing) {
    fs::path new_dir = spec_dir(root, object, hash);
    if (!reuse_existing || fs::exists(new_dir)) {
        return new_dir;
    }

    fs::path old_dir = legacy_spec_dir(root, object, direction, scope, hash);
    if (!fs::exists(old_dir)) {
        return new_dir;
    }

    std::error_code ec;
    fs::create_directories(new_dir.parent_path(), ec);
    if (ec) {
        throw std::runtime_error(fmt::format("failed to create {}: {}",
                                             new_dir.parent_path().string(), ec.message()));
    }
    fs::rename(old_dir, new_dir, ec);
    if (ec) return old_dir;
    return new_dir;
}

static void push_child_dirs(const fs::path& dir, std::vector<fs::path>& out) {
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (entry.is_directory()) out.push_back(entry.path());
    }
}

std::vector<fs::path> collect_object_spec_dirs(const fs::path& root, const ObjectRef& object) {
    std::vector<fs::path> dirs;

    fs::path flat_base = object_base_dir(root, object);
    if (fs::is_directory(flat_base)) {
        push_child_dirs(flat_base, dirs);
    }

    fs::path legacy_base = root / sanitize_segment(object.object_type) /
                           sanitize_segment(object.object_name);
    if (fs::is_directory(legacy_base)) {
        std::vector<fs::path> direction_dirs;
        push_child_dirs(legacy_base, direction_dirs);
        for (const auto& direction_dir : direction_dirs) {
            std::vector<fs::path> scope_dirs;
            push_child_dirs(direction_dir, scope_dirs);
            for (const auto& scope_dir : scope_dirs) {
                push_child_dirs(scope_dir, dirs);
            }
        }
    }

    std::sort(dirs.begin(), dirs.end());
    dirs.erase(std::unique(dirs.begin(), dirs.end()), dirs.end());
    return dirs;
}

std::optional<fs::path> resolve_pull_spec_output_path(const fs::path& dir) {
    fs::path manifest_path = dir / MANIFEST_FILE_NAME;
    if (fs::exists(manifest_path)) {
        auto manifest = read_json_as<SyncManifest>(manifest_path);
        if (manifest.output_path) {
            fs::path candidate(*manifest.output_path);
            if (fs::exists(candidate)) return candidate;
            fs::path joined = dir / candidate;
            if (fs::exists(joined)) return joined;
        }
    }

    fs::path data_dir = dir / DATA_DIR_NAME;
    if (fs::is_directory(data_dir)) return data_dir;
    fs::path legacy_jsonl = dir / LEGACY_JSONL_NAME;
    if (fs::is_regular_file(legacy_jsonl)) return legacy_jsonl;
    fs::path legacy_ndjson = dir / LEGACY_NDJSON_NAME;
    if (fs::is_regular_file(legacy_ndjson)) return legacy_ndjson;
    return std::nullopt;
}

// ── Manifest ────────────────────────────────────────────────

void update_manifest_from_pull_state(const fs::path& path, const std::string& hash,
                                     const SyncSpec& spec, const PullState& state,
                                     std::optional<RunStatus> status_override) {
    SyncManifest m;
    m.schema_version = STATE_SCHEMA_VERSION;
    m.spec_hash = hash;
    m.spec = spec;
    m.last_run_id = state.run_id;
    m.status = status_override.value_or(state.status);
    m.items_done = state.items_done;
    m.pages_done = state.pages_done;
    m.bytes_processed = state.bytes_written;
    m.output_path = state.output_path;
    m.started_at = state.started_at;
    m.updated_at = state.updated_at;
    m.completed_at = state.completed_at;
    write_json_atomic(path, json(m));
}

void update_manifest_from_push_state(const fs::path& path, const std::string& hash,
                                     const SyncSpec& spec, const PushState& state,
                                     std::optional<RunStatus> status_override) {
    SyncManifest m;
    m.schema_version = STATE_SCHEMA_VERSION;
    m.spec_hash = hash;
    m.spec = spec;
    m.last_run_id = state.run_id;
    m.status = status_override.value_or(state.status);
    m.items_done = state.items_done;
    m.pages_done = state.pages_done;
    m.bytes_processed = state.bytes_sent;
    m.input_path = state.source_path;
    m.started_at = state.started_at;
    m.updated_at = state.updated_at;
    m.completed_at = state.completed_at;
    write_json_atomic(path, json(m));
}

// ── StateStore ──────────────────────────────────────────────

StateStore::StateStore(fs::path dir) : dir_(std::move(dir)) {}

fs::path StateStore::spec_path() const { return dir_ / SPEC_FILE_NAME; }
fs::path StateStore::state_path() const { return dir_ / STATE_FILE_NAME; }
fs::path StateStore::manifest_path() const { return dir_ / MANIFEST_FILE_NAME; }
fs::path StateStore::data_dir() const { return dir_ / DATA_DIR_NAME; }

bool StateStore::has_state() const {
    return fs::exists(state_path());
}

void StateStore::ensure_spec(const SyncSpec& spec) const {
    if (fs::exists(spec_path())) return;
    write_json_atomic(spec_path(), json(spec));
}

void StateStore::bind_spec(const std::string& hash, const SyncSpec& spec) {
    bound_spec_ = std::make_pair(hash, spec);
}

void StateStore::save_checkpoint(const PullState& state) const {
    if (!bound_spec_) throw std::logic_error("save_checkpoint before bind_spec");
    save_state(state);
    update_manifest_from_pull_state(manifest_path(), bound_spec_->first, bound_spec_->second,
                                    state);
}

void StateStore::save_checkpoint(const PushState& state) const {
    if (!bound_spec_) throw std::logic_error("save_checkpoint before bind_spec");
    save_state(state);
    update_manifest_from_push_state(manifest_path(), bound_spec_->first, bound_spec_->second,
                                    state);
}
