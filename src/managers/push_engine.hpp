#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <unordered_set>
#include <filesystem>
#include <core/types.hpp>
#include <core/constants.hpp>
#include <platform/interrupt.hpp>
#include "sync_types.hpp"
#include "remote_client.hpp"
#include "query_executor.hpp"

namespace fs = std::filesystem;

struct PushOptions {
    ObjectRef object;
    Scope scope = Scope::All;
    std::optional<size_t> limit;
    std::optional<std::string> filter;
    size_t page_size = DEFAULT_PAGE_SIZE;
    std::optional<fs::path> input;          // nullopt = newest completed pull
    bool fresh = false;
    fs::path root = "tracesync";
    size_t workers = DEFAULT_WORKERS;
};

struct PushOutcome {
    RunStatus status = RunStatus::Running;
    bool already_completed = false;
    fs::path spec_dir;
    std::string input_path;
    size_t items_done = 0;
    size_t pages_done = 0;
    uint64_t bytes_sent = 0;
    size_t distinct_roots_done = 0;
    uint64_t started_at = 0;
    std::optional<std::string> retry_summary;
};

// One upload unit. end_line_offset is the global line index just past its last row.
struct PushBatchWork {
    size_t batch_index = 0;
    std::vector<json> rows;
    size_t end_line_offset = 0;
    size_t distinct_roots_done = 0;
};

struct PushBatchResult {
    size_t batch_index = 0;
    size_t row_count = 0;
    uint64_t bytes_sent = 0;
    size_t end_line_offset = 0;
    size_t distinct_roots_done = 0;
};

// ── Input files ─────────────────────────────────────────────

// A file as is; a directory's *.jsonl / *.ndjson sorted by name; an empty
// directory that is a pull spec directory resolves through its output.
std::vector<fs::path> resolve_push_input_files(const fs::path& input);

// Output of the completed pull with the newest updated_at, both layouts.
fs::path resolve_default_push_input(const fs::path& root, const ObjectRef& object);

size_t count_lines(const std::vector<fs::path>& files);

// Root ids of every non-blank line before line_offset.
std::unordered_set<std::string> collect_seen_roots_until_offset(
    const std::vector<fs::path>& files, size_t line_offset);

// ── Rows and checkpoints ────────────────────────────────────

// Strip server-assigned fields and fill in the ids the ingest API requires.
void prepare_row_for_upload(json& row, const std::string& project_id,
                            const std::string& run_id, size_t row_index);

void commit_push_batch_state(PushState& state, const PushBatchResult& result);

// Commit buffered results in batch order starting at next_commit_index,
// writing the state after each. Stops at the first gap.
void flush_ready_push_results(std::map<size_t, PushBatchResult>& pending,
                              size_t& next_commit_index, PushState& state,
                              const fs::path& state_path,
                              const StatusCallback& on_commit = nullptr);

// Uploads local JSONL rows into project logs. Progress is checkpointed only
// up to the last contiguously committed batch.
class PushEngine {
public:
    PushEngine(IngestClient& client, CancelToken& cancel, RetryPolicy policy = {});

    // Called after each committed batch with a progress message.
    void set_progress_callback(StatusCallback cb) { on_progress_ = std::move(cb); }

    PushOutcome run(const PushOptions& opts);

    // Upload retries seen so far; safe to call from the progress callback.
    std::optional<std::string> retry_summary() const { return tracker_.summary_line(); }

private:
    IngestClient& client_;
    CancelToken& cancel_;
    RetryPolicy policy_;
    RetryTracker tracker_;
    StatusCallback on_progress_;
};
