#include "sync_types.hpp"

const char* to_string(Direction d) {
    switch (d) {
        case Direction::Pull: return "pull";
        case Direction::Push: return "push";
    }
    return "pull";
}

const char* to_string(Scope s) {
    switch (s) {
        case Scope::Traces: return "traces";
        case Scope::Spans: return "spans";
        case Scope::All: return "all";
    }
    return "all";
}

const char* to_string(RunStatus s) {
    switch (s) {
        case RunStatus::Running: return "running";
        case RunStatus::Interrupted: return "interrupted";
        case RunStatus::Completed: return "completed";
    }
    return "running";
}

const char* to_string(PullPhase p) {
    switch (p) {
        case PullPhase::DiscoverRoots: return "discover_roots";
        case PullPhase::FetchRoots: return "fetch_roots";
        case PullPhase::Spans: return "spans";
        case PullPhase::Completed: return "completed";
    }
    return "discover_roots";
}

// ── Optional helpers ────────────────────────────────────────
// Absent optionals are written as null and read back from null or a missing key.

template <typename T>
static void put_optional(json& j, const char* key, const std::optional<T>& value) {
    if (value) {
        j[key] = *value;
    } else {
        j[key] = nullptr;
    }
}

template <typename T>
static void get_optional(const json& j, const char* key, std::optional<T>& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out.reset();
    } else {
        out = it->get<T>();
    }
}

template <typename T>
static void get_or(const json& j, const char* key, T& out, const T& fallback) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) {
        out = fallback;
    } else {
        out = it->get<T>();
    }
}

// ── SyncSpec ────────────────────────────────────────────────

void to_json(json& j, const SyncSpec& s) {
    j = json::object();
    j["schema_version"] = s.schema_version;
    j["object_ref"] = s.object_ref;
    j["object_type"] = s.object_type;
    j["object_name"] = s.object_name;
    j["direction"] = s.direction;
    j["scope"] = s.scope;
    put_optional(j, "filter", s.filter);
    put_optional(j, "limit", s.limit);
    j["page_size"] = s.page_size;
}

void from_json(const json& j, SyncSpec& s) {
    j.at("schema_version").get_to(s.schema_version);
    j.at("object_ref").get_to(s.object_ref);
    j.at("object_type").get_to(s.object_type);
    j.at("object_name").get_to(s.object_name);
    j.at("direction").get_to(s.direction);
    j.at("scope").get_to(s.scope);
    get_optional(j, "filter", s.filter);
    get_optional(j, "limit", s.limit);
    j.at("page_size").get_to(s.page_size);
}

// ── SyncManifest ────────────────────────────────────────────

void to_json(json& j, const SyncManifest& m) {
    j = json::object();
    j["schema_version"] = m.schema_version;
    j["spec_hash"] = m.spec_hash;
    j["spec"] = m.spec;
    j["last_run_id"] = m.last_run_id;
    j["status"] = m.status;
    j["items_done"] = m.items_done;
    j["pages_done"] = m.pages_done;
    j["bytes_processed"] = m.bytes_processed;
    put_optional(j, "output_path", m.output_path);
    put_optional(j, "input_path", m.input_path);
    j["started_at"] = m.started_at;
    j["updated_at"] = m.updated_at;
    put_optional(j, "completed_at", m.completed_at);
    put_optional(j, "message", m.message);
}

void from_json(const json& j, SyncManifest& m) {
    j.at("schema_version").get_to(m.schema_version);
    j.at("spec_hash").get_to(m.spec_hash);
    j.at("spec").get_to(m.spec);
    j.at("last_run_id").get_to(m.last_run_id);
    j.at("status").get_to(m.status);
    j.at("items_done").get_to(m.items_done);
    j.at("pages_done").get_to(m.pages_done);
    j.at("bytes_processed").get_to(m.bytes_processed);
    get_optional(j, "output_path", m.output_path);
    get_optional(j, "input_path", m.input_path);
    j.at("started_at").get_to(m.started_at);
    j.at("updated_at").get_to(m.updated_at);
    get_optional(j, "completed_at", m.completed_at);
    get_optional(j, "message", m.message);
}

// ── TraceChunkState ─────────────────────────────────────────

void to_json(json& j, const TraceChunkState& c) {
    j = json::object();
    j["chunk_index"] = c.chunk_index;
    j["start"] = c.start;
    j["end"] = c.end;
    put_optional(j, "cursor", c.cursor);
    j["completed"] = c.completed;
}

void from_json(const json& j, TraceChunkState& c) {
    j.at("chunk_index").get_to(c.chunk_index);
    j.at("start").get_to(c.start);
    j.at("end").get_to(c.end);
    get_optional(j, "cursor", c.cursor);
    j.at("completed").get_to(c.completed);
}

// ── PullState ───────────────────────────────────────────────

void to_json(json& j, const PullState& s) {
    j = json::object();
    j["schema_version"] = s.schema_version;
    j["run_id"] = s.run_id;
    j["status"] = s.status;
    j["phase"] = s.phase;
    j["scope"] = s.scope;
    j["limit"] = s.limit;
    put_optional(j, "filter", s.filter);
    j["page_size"] = s.page_size;
    put_optional(j, "cursor", s.cursor);
    put_optional(j, "root_discovery_cursor", s.root_discovery_cursor);
    j["root_ids"] = s.root_ids;
    j["current_root_index"] = s.current_root_index;
    put_optional(j, "current_root_cursor", s.current_root_cursor);
    j["trace_chunks"] = s.trace_chunks;
    j["items_done"] = s.items_done;
    j["pages_done"] = s.pages_done;
    j["bytes_written"] = s.bytes_written;
    j["output_path"] = s.output_path;
    j["started_at"] = s.started_at;
    j["updated_at"] = s.updated_at;
    put_optional(j, "completed_at", s.completed_at);
}

void from_json(const json& j, PullState& s) {
    j.at("schema_version").get_to(s.schema_version);
    j.at("run_id").get_to(s.run_id);
    j.at("status").get_to(s.status);
    j.at("phase").get_to(s.phase);
    j.at("scope").get_to(s.scope);
    j.at("limit").get_to(s.limit);
    get_optional(j, "filter", s.filter);
    j.at("page_size").get_to(s.page_size);
    get_optional(j, "cursor", s.cursor);
    get_optional(j, "root_discovery_cursor", s.root_discovery_cursor);
    j.at("root_ids").get_to(s.root_ids);
    j.at("current_root_index").get_to(s.current_root_index);
    get_optional(j, "current_root_cursor", s.current_root_cursor);
    get_or(j, "trace_chunks", s.trace_chunks, std::vector<TraceChunkState>{});
    j.at("items_done").get_to(s.items_done);
    j.at("pages_done").get_to(s.pages_done);
    j.at("bytes_written").get_to(s.bytes_written);
    j.at("output_path").get_to(s.output_path);
    j.at("started_at").get_to(s.started_at);
    j.at("updated_at").get_to(s.updated_at);
    get_optional(j, "completed_at", s.completed_at);
}

// ── PushState ───────────────────────────────────────────────

void to_json(json& j, const PushState& s) {
    j = json::object();
    j["schema_version"] = s.schema_version;
    j["run_id"] = s.run_id;
    j["status"] = s.status;
    j["scope"] = s.scope;
    put_optional(j, "limit", s.limit);
    j["page_size"] = s.page_size;
    j["source_path"] = s.source_path;
    j["line_offset"] = s.line_offset;
    j["items_done"] = s.items_done;
    j["pages_done"] = s.pages_done;
    j["bytes_sent"] = s.bytes_sent;
    j["distinct_roots_done"] = s.distinct_roots_done;
    j["started_at"] = s.started_at;
    j["updated_at"] = s.updated_at;
    put_optional(j, "completed_at", s.completed_at);
}

void from_json(const json& j, PushState& s) {
    j.at("schema_version").get_to(s.schema_version);
    j.at("run_id").get_to(s.run_id);
    j.at("status").get_to(s.status);
    j.at("scope").get_to(s.scope);
    get_optional(j, "limit", s.limit);
    j.at("page_size").get_to(s.page_size);
    j.at("source_path").get_to(s.source_path);
    j.at("line_offset").get_to(s.line_offset);
    j.at("items_done").get_to(s.items_done);
    j.at("pages_done").get_to(s.pages_done);
    j.at("bytes_sent").get_to(s.bytes_sent);
    j.at("distinct_roots_done").get_to(s.distinct_roots_done);
    j.at("started_at").get_to(s.started_at);
    j.at("updated_at").get_to(s.updated_at);
    get_optional(j, "completed_at", s.completed_at);
}
