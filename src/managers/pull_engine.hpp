#pragma once

#include <string>
#include <optional>
#include <filesystem>
#include <core/types.hpp>
#include <platform/interrupt.hpp>
#include "sync_types.hpp"
#include "remote_client.hpp"
#include "query_executor.hpp"

namespace fs = std::filesystem;

class StateStore;

struct PullOptions {
    ObjectRef object;
    Scope scope = Scope::Traces;
    size_t limit = 0;
    std::optional<std::string> filter;
    size_t page_size = DEFAULT_PAGE_SIZE;
    std::optional<std::string> cursor;      // spans mode start cursor; implies fresh
    bool fresh = false;
    fs::path root = "tracesync";
    size_t workers = DEFAULT_WORKERS;
    size_t chunk_size = ROOT_FETCH_CHUNK_SIZE;  // roots per trace fetch chunk
};

struct PullOutcome {
    RunStatus status = RunStatus::Running;
    bool already_completed = false;
    fs::path spec_dir;
    std::string output_path;
    Scope scope = Scope::Traces;
    size_t limit = 0;
    size_t traces_done = 0;
    size_t items_done = 0;
    size_t pages_done = 0;
    uint64_t bytes_written = 0;
    uint64_t started_at = 0;
    std::optional<std::string> retry_summary;
};

// ── Trace chunk bookkeeping ─────────────────────────────────

// True when a trace-scope state has no work recorded at all, whatever its phase.
bool trace_state_needs_discovery(const PullState& state);

// Convert a pre-chunk state (current_root_index + current_root_cursor) into chunks.
// No-op if chunks already exist.
void initialize_trace_chunks(PullState& state, size_t chunk_size);

// Append chunks for roots past the last chunk end. Only full chunks unless
// flush_partial. Recomputes current_root_index. Returns the number added.
size_t append_trace_chunks(PullState& state, size_t chunk_size, bool flush_partial);

// Roots covered by completed chunks.
size_t completed_root_count(const PullState& state);

// Downloads spans or whole traces into the spec directory's data/ parts,
// checkpointing after every page. Reruns resume from the checkpoint.
class PullEngine {
public:
    PullEngine(QueryClient& client, CancelToken& cancel, RetryPolicy policy = {});

    // Called with a progress message after every page. May be called from
    // worker threads, never concurrently.
    void set_progress_callback(StatusCallback cb) { on_progress_ = std::move(cb); }

    PullOutcome run(const PullOptions& opts);

    // Retries seen so far; safe to call from the progress callback.
    std::optional<std::string> retry_summary() const { return tracker_.summary_line(); }

private:
    // Return true when the spans loop ran to the end, false when cancelled.
    bool run_spans(const std::string& source, const PullOptions& opts,
                   const StateStore& store, PullState& state);
    bool run_traces(const std::string& source, const PullOptions& opts,
                    const StateStore& store, PullState& state);

    QueryClient& client_;
    CancelToken& cancel_;
    RetryPolicy policy_;
    RetryTracker tracker_;
    StatusCallback on_progress_;
};
