#pragma once

#include <string>
#include <vector>
#include <optional>
#include <cstdint>
#include <cstddef>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

enum class Direction { Pull, Push };
enum class Scope { Traces, Spans, All };
enum class RunStatus { Running, Interrupted, Completed };
enum class PullPhase { DiscoverRoots, FetchRoots, Spans, Completed };

const char* to_string(Direction d);
const char* to_string(Scope s);
const char* to_string(RunStatus s);
const char* to_string(PullPhase p);

NLOHMANN_JSON_SERIALIZE_ENUM(Direction, {
    {Direction::Pull, "pull"},
    {Direction::Push, "push"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(Scope, {
    {Scope::Traces, "traces"},
    {Scope::Spans, "spans"},
    {Scope::All, "all"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(RunStatus, {
    {RunStatus::Running, "running"},
    {RunStatus::Interrupted, "interrupted"},
    {RunStatus::Completed, "completed"},
})

NLOHMANN_JSON_SERIALIZE_ENUM(PullPhase, {
    {PullPhase::DiscoverRoots, "discover_roots"},
    {PullPhase::FetchRoots, "fetch_roots"},
    {PullPhase::Spans, "spans"},
    {PullPhase::Completed, "completed"},
})

// type:id reference to a remote collection
struct ObjectRef {
    std::string object_type;        // project_logs | experiment | dataset
    std::string object_name;        // object id
};

// Canonical description of one transfer. Hashed to key the spec directory.
struct SyncSpec {
    uint32_t schema_version = 0;
    std::string object_ref;
    std::string object_type;
    std::string object_name;
    std::string direction;          // "pull" | "push"
    std::string scope;              // "traces" | "spans" | "all"
    std::optional<std::string> filter;
    std::optional<size_t> limit;
    size_t page_size = 0;
};

// Latest-status summary for a spec directory
struct SyncManifest {
    uint32_t schema_version = 0;
    std::string spec_hash;
    SyncSpec spec;
    std::string last_run_id;
    RunStatus status = RunStatus::Running;
    size_t items_done = 0;
    size_t pages_done = 0;
    uint64_t bytes_processed = 0;
    std::optional<std::string> output_path;
    std::optional<std::string> input_path;
    uint64_t started_at = 0;
    uint64_t updated_at = 0;
    std::optional<uint64_t> completed_at;
    std::optional<std::string> message;
};

// Fixed-size slice [start, end) of PullState::root_ids fetched as one unit
struct TraceChunkState {
    size_t chunk_index = 0;
    size_t start = 0;
    size_t end = 0;
    std::optional<std::string> cursor;
    bool completed = false;
};

struct PullState {
    uint32_t schema_version = 0;
    std::string run_id;
    RunStatus status = RunStatus::Running;
    PullPhase phase = PullPhase::DiscoverRoots;
    std::string scope;
    size_t limit = 0;
    std::optional<std::string> filter;
    size_t page_size = 0;
    std::optional<std::string> cursor;                  // spans mode
    std::optional<std::string> root_discovery_cursor;
    std::vector<std::string> root_ids;
    size_t current_root_index = 0;                      // == roots in completed chunks
    std::optional<std::string> current_root_cursor;     // pre-chunk states only
    std::vector<TraceChunkState> trace_chunks;
    size_t items_done = 0;
    size_t pages_done = 0;
    uint64_t bytes_written = 0;
    std::string output_path;
    uint64_t started_at = 0;
    uint64_t updated_at = 0;
    std::optional<uint64_t> completed_at;
};

struct PushState {
    uint32_t schema_version = 0;
    std::string run_id;
    RunStatus status = RunStatus::Running;
    std::string scope;
    std::optional<size_t> limit;
    size_t page_size = 0;
    std::string source_path;
    size_t line_offset = 0;         // every line before this is durably uploaded
    size_t items_done = 0;
    size_t pages_done = 0;
    uint64_t bytes_sent = 0;
    size_t distinct_roots_done = 0;
    uint64_t started_at = 0;
    uint64_t updated_at = 0;
    std::optional<uint64_t> completed_at;
};

void to_json(json& j, const SyncSpec& s);
void from_json(const json& j, SyncSpec& s);
void to_json(json& j, const SyncManifest& m);
void from_json(const json& j, SyncManifest& m);
void to_json(json& j, const TraceChunkState& c);
void from_json(const json& j, TraceChunkState& c);
void to_json(json& j, const PullState& s);
void from_json(const json& j, PullState& s);
void to_json(json& j, const PushState& s);
void from_json(const json& j, PushState& s);
