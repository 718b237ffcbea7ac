#include "pull_engine.hpp"
#include <core/utils.hpp>
#include <managers/sync_log.hpp>
#include "sync_spec.hpp"
#include "state_store.hpp"
#include "jsonl_writer.hpp"
#include "query_builder.hpp"
#include "progress.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <set>
#include <stdexcept>
#include <thread>
#include <unordered_set>
#include <vector>

// ── Trace chunk bookkeeping ─────────────────────────────────

bool trace_state_needs_discovery(const PullState& state) {
    return state.items_done == 0 &&
           state.current_root_index == 0 &&
           state.root_ids.empty() &&
           state.trace_chunks.empty();
}

size_t completed_root_count(const PullState& state) {
    size_t total = 0;
    for (const auto& chunk : state.trace_chunks) {
        if (chunk.completed && chunk.end > chunk.start) total += chunk.end - chunk.start;
    }
    return total;
}

void initialize_trace_chunks(PullState& state, size_t chunk_size) {
    if (!state.trace_chunks.empty()) return;

    size_t root_count = state.root_ids.size();
    if (root_count == 0) {
        state.current_root_index = 0;
        state.current_root_cursor.reset();
        return;
    }

    size_t legacy_index = std::min(state.current_root_index, root_count);
    for (size_t start = 0; start < root_count; ) {
        TraceChunkState chunk;
        chunk.chunk_index = state.trace_chunks.size();
        chunk.start = start;
        chunk.end = std::min(start + chunk_size, root_count);
        chunk.completed = chunk.end <= legacy_index;
        if (start == legacy_index) chunk.cursor = state.current_root_cursor;
        start = chunk.end;
        state.trace_chunks.push_back(chunk);
    }

    state.current_root_index = completed_root_count(state);
    state.current_root_cursor.reset();
}

size_t append_trace_chunks(PullState& state, size_t chunk_size, bool flush_partial) {
    size_t next_start = state.trace_chunks.empty() ? 0 : state.trace_chunks.back().end;
    size_t root_count = state.root_ids.size();
    size_t added = 0;

    while (next_start < root_count) {
        if (!flush_partial && root_count - next_start < chunk_size) break;
        TraceChunkState chunk;
        chunk.chunk_index = state.trace_chunks.size();
        chunk.start = next_start;
        chunk.end = std::min(next_start + chunk_size, root_count);
        next_start = chunk.end;
        state.trace_chunks.push_back(chunk);
        added++;
    }

    state.current_root_index = completed_root_count(state);
    state.current_root_cursor.reset();
    return added;
}

static std::optional<std::string> non_empty_cursor(const std::optional<std::string>& cursor) {
    if (cursor && !cursor->empty()) return cursor;
    return std::nullopt;
}

static void remove_output_path(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec)) return;
    fs::remove_all(path, ec);
    if (ec) {
        throw std::runtime_error(fmt::format("failed to remove {}: {}", path.string(), ec.message()));
    }
}

// ── Traces mode shared context ──────────────────────────────

namespace {

struct TraceFetchContext {
    TraceFetchContext(PullState& s, JsonlPartWriter& w, const StateStore& st,
                      QueryExecutor& ex, CancelToken& c)
        : state(s), writer(w), store(st), executor(ex), cancel(c) {}

    PullState& state;               // guarded by mutex
    JsonlPartWriter& writer;        // guarded by mutex
    const StateStore& store;
    QueryExecutor& executor;
    CancelToken& cancel;

    std::string source;
    std::optional<std::string> filter;
    size_t page_size = 0;
    size_t chunk_size = ROOT_FETCH_CHUNK_SIZE;
    ProgressBaseline baseline;
    StatusCallback on_progress;

    std::mutex mutex;
    std::condition_variable work_cv;
    std::set<size_t> active;                            // chunks being fetched
    std::unordered_set<std::string> progress_roots;     // roots with spans on disk
    bool discovery_done = false;
    std::atomic<bool> failed{false};
    std::exception_ptr first_error;

    bool should_stop() const { return failed.load() || cancel.cancelled(); }

    void fail(std::exception_ptr err) {
        {
            std::lock_guard<std::mutex> lock(mutex);
            if (!first_error) first_error = err;
        }
        failed.store(true);
        work_cv.notify_all();
    }

    // Caller holds mutex.
    void checkpoint() {
        state.current_root_index = completed_root_count(state);
        state.current_root_cursor.reset();
        state.updated_at = epoch_seconds();
        store.save_checkpoint(state);
        if (on_progress) {
            on_progress(pull_trace_progress_message(state, baseline, progress_roots.size()));
        }
    }
};

} // namespace

static std::optional<size_t> claim_next_trace_chunk(TraceFetchContext& ctx) {
    std::unique_lock<std::mutex> lock(ctx.mutex);
    while (true) {
        if (ctx.should_stop()) return std::nullopt;
        const auto& chunks = ctx.state.trace_chunks;
        for (size_t i = 0; i < chunks.size(); i++) {
            if (!chunks[i].completed && ctx.active.count(i) == 0) {
                ctx.active.insert(i);
                return i;
            }
        }
        if (ctx.discovery_done) return std::nullopt;
        // Timed so a cancelled token is noticed without a notify
        ctx.work_cv.wait_for(lock, std::chrono::milliseconds(100));
    }
}

static void process_trace_chunk(TraceFetchContext& ctx, size_t chunk_idx) {
    while (!ctx.should_stop()) {
        std::vector<std::string> roots;
        std::optional<std::string> cursor;
        {
            std::lock_guard<std::mutex> lock(ctx.mutex);
            const auto& chunk = ctx.state.trace_chunks.at(chunk_idx);
            if (chunk.completed) return;
            size_t end = std::min(chunk.end, ctx.state.root_ids.size());
            size_t start = std::min(chunk.start, end);
            roots.assign(ctx.state.root_ids.begin() + start, ctx.state.root_ids.begin() + end);
            cursor = chunk.cursor;
        }
        if (roots.empty()) return;

        std::string query = build_root_spans_query(ctx.source, roots, ctx.filter,
                                                   ctx.page_size, cursor);
        QueryResponse resp = ctx.executor.run(query);
        auto next_cursor = non_empty_cursor(resp.cursor);

        std::lock_guard<std::mutex> lock(ctx.mutex);
        auto& chunk = ctx.state.trace_chunks.at(chunk_idx);
        if (!resp.rows.empty()) {
            uint64_t bytes = 0;
            for (const auto& row : resp.rows) {
                bytes += ctx.writer.write_row(row);
                auto root = row_root_span_id(row);
                if (root && !root->empty()) ctx.progress_roots.insert(*root);
            }
            ctx.writer.flush();

            ctx.state.items_done += resp.rows.size();
            ctx.state.pages_done++;
            ctx.state.bytes_written += bytes;
            chunk.cursor = next_cursor;
            chunk.completed = !next_cursor.has_value();
        } else {
            chunk.cursor.reset();
            chunk.completed = true;
        }
        if (chunk.completed) {
            ctx.progress_roots.insert(roots.begin(), roots.end());
            sync_log(fmt::format("pull: chunk {} complete ({} roots)", chunk_idx, roots.size()));
        }
        bool done = chunk.completed;
        ctx.checkpoint();
        if (done) return;
    }
}

// Returns false if cancelled before discovery finished.
static bool run_root_discovery(TraceFetchContext& ctx) {
    std::unordered_set<std::string> seen;
    std::optional<std::string> cursor;
    size_t limit = 0;
    {
        std::lock_guard<std::mutex> lock(ctx.mutex);
        seen.insert(ctx.state.root_ids.begin(), ctx.state.root_ids.end());
        cursor = ctx.state.root_discovery_cursor;
        limit = ctx.state.limit;
    }

    while (seen.size() < limit) {
        if (ctx.should_stop()) return false;

        std::string query = build_root_discovery_query(ctx.source, ctx.filter,
                                                       ROOT_DISCOVERY_PAGE_SIZE, cursor);
        QueryResponse resp = ctx.executor.run(query);

        size_t added = 0;
        {
            std::lock_guard<std::mutex> lock(ctx.mutex);
            for (const auto& row : resp.rows) {
                auto root = row_root_span_id(row);
                if (!root || root->empty() || seen.size() >= limit) continue;
                if (seen.insert(*root).second) ctx.state.root_ids.push_back(*root);
            }
            ctx.state.pages_done++;
            cursor = non_empty_cursor(resp.cursor);
            ctx.state.root_discovery_cursor = cursor;
            added = append_trace_chunks(ctx.state, ctx.chunk_size, false);
            ctx.checkpoint();
        }
        if (added > 0) ctx.work_cv.notify_all();

        if (resp.rows.empty() || !cursor) break;
    }

    {
        std::lock_guard<std::mutex> lock(ctx.mutex);
        ctx.state.phase = PullPhase::FetchRoots;
        ctx.state.root_discovery_cursor.reset();
        append_trace_chunks(ctx.state, ctx.chunk_size, true);
        ctx.checkpoint();
        ctx.discovery_done = true;
        sync_log(fmt::format("pull: discovery done, {} roots in {} chunks",
                             ctx.state.root_ids.size(), ctx.state.trace_chunks.size()));
    }
    ctx.work_cv.notify_all();
    return true;
}

// ── PullEngine ──────────────────────────────────────────────

PullEngine::PullEngine(QueryClient& client, CancelToken& cancel, RetryPolicy policy)
    : client_(client), cancel_(cancel), policy_(policy) {}

bool PullEngine::run_spans(const std::string& source, const PullOptions& opts,
                           const StateStore& store, PullState& state) {
    QueryExecutor executor(client_, policy_, &tracker_);
    ProgressBaseline baseline{epoch_seconds(), state.root_ids.size(),
                              state.items_done, state.bytes_written};
    std::unordered_set<std::string> seen(state.root_ids.begin(), state.root_ids.end());
    JsonlPartWriter writer(store.data_dir(), state.items_done > 0);

    while (state.items_done < state.limit) {
        if (cancel_.cancelled()) return false;

        size_t batch_limit = std::min(state.limit - state.items_done, opts.page_size);
        std::string query = build_spans_query(source, state.filter, batch_limit, state.cursor);
        QueryResponse resp = executor.run(query);
        if (resp.rows.empty()) {
            state.cursor.reset();
            break;
        }

        for (const auto& row : resp.rows) {
            auto root = row_root_span_id(row);
            if (root && !root->empty() && seen.insert(*root).second) {
                state.root_ids.push_back(*root);
            }
            state.bytes_written += writer.write_row(row);
        }
        writer.flush();

        state.items_done += resp.rows.size();
        state.pages_done++;
        state.cursor = non_empty_cursor(resp.cursor);
        state.updated_at = epoch_seconds();
        store.save_checkpoint(state);
        if (on_progress_) on_progress_(pull_spans_progress_message(state, baseline));

        if (!state.cursor || resp.rows.size() < batch_limit) break;
    }
    return true;
}

bool PullEngine::run_traces(const std::string& source, const PullOptions& opts,
                            const StateStore& store, PullState& state) {
    if (trace_state_needs_discovery(state)) {
        state.phase = PullPhase::DiscoverRoots;
    }
    size_t chunk_size = std::max<size_t>(opts.chunk_size, 1);
    if (state.trace_chunks.empty() && !state.root_ids.empty()) {
        initialize_trace_chunks(state, chunk_size);
    }
    append_trace_chunks(state, chunk_size, false);
    state.updated_at = epoch_seconds();
    store.save_checkpoint(state);

    QueryExecutor executor(client_, policy_, &tracker_);
    JsonlPartWriter writer(store.data_dir(), state.items_done > 0);
    TraceFetchContext ctx(state, writer, store, executor, cancel_);
    ctx.source = source;
    ctx.filter = state.filter;
    ctx.page_size = opts.page_size;
    ctx.chunk_size = chunk_size;
    ctx.on_progress = on_progress_;

    for (const auto& chunk : state.trace_chunks) {
        if (!chunk.completed) continue;
        size_t end = std::min(chunk.end, state.root_ids.size());
        for (size_t i = std::min(chunk.start, end); i < end; i++) {
            ctx.progress_roots.insert(state.root_ids[i]);
        }
    }
    ctx.baseline = {epoch_seconds(), ctx.progress_roots.size(),
                    state.items_done, state.bytes_written};

    bool needs_discovery = state.phase == PullPhase::DiscoverRoots;
    ctx.discovery_done = !needs_discovery;
    sync_log(fmt::format("pull: traces mode, {} worker(s), discovery {}",
                         std::max<size_t>(opts.workers, 1), needs_discovery ? "needed" : "done"));

    std::vector<std::thread> workers;
    for (size_t i = 0; i < std::max<size_t>(opts.workers, 1); i++) {
        workers.emplace_back([&ctx] {
            while (auto idx = claim_next_trace_chunk(ctx)) {
                try {
                    process_trace_chunk(ctx, *idx);
                } catch (...) {
                    ctx.fail(std::current_exception());
                }
                {
                    std::lock_guard<std::mutex> lock(ctx.mutex);
                    ctx.active.erase(*idx);
                }
                ctx.work_cv.notify_all();
            }
        });
    }

    bool discovery_finished = true;
    if (needs_discovery) {
        try {
            discovery_finished = run_root_discovery(ctx);
        } catch (...) {
            ctx.fail(std::current_exception());
        }
    }
    {
        std::lock_guard<std::mutex> lock(ctx.mutex);
        ctx.discovery_done = true;
    }
    ctx.work_cv.notify_all();

    for (auto& t : workers) t.join();
    if (ctx.first_error) std::rethrow_exception(ctx.first_error);
    writer.flush();

    bool all_done = std::all_of(state.trace_chunks.begin(), state.trace_chunks.end(),
                                [](const TraceChunkState& c) { return c.completed; });
    if (discovery_finished && all_done) return true;
    if (!cancel_.cancelled()) {
        throw std::runtime_error("trace fetch stopped with unfinished chunks");
    }
    return false;
}

PullOutcome PullEngine::run(const PullOptions& opts) {
    if (opts.scope == Scope::All) {
        throw std::invalid_argument("invalid pull scope");
    }

    std::string source = source_expr(opts.object);
    bool fresh = opts.fresh || opts.cursor.has_value();
    auto filter = trim_optional(opts.filter);

    SyncSpec spec = make_sync_spec(opts.object, Direction::Pull, opts.scope, filter,
                                   opts.limit, opts.page_size);
    std::string hash = spec_hash(spec);
    fs::path dir = resolve_spec_dir(opts.root, opts.object, Direction::Pull, opts.scope,
                                    hash, !fresh);
    fs::create_directories(dir);
    StateStore store(dir);
    store.ensure_spec(spec);
    store.bind_spec(hash, spec);
    fs::path output_dir = store.data_dir();

    PullState state;
    if (fresh || !store.has_state()) {
        state = new_pull_state(opts.scope, opts.limit, opts.page_size, filter, opts.cursor,
                               output_dir.string());
    } else {
        state = *store.load_state<PullState>();
    }

    PullOutcome outcome;
    outcome.spec_dir = dir;
    outcome.scope = opts.scope;
    outcome.limit = opts.limit;

    auto fill_outcome = [&] {
        outcome.status = state.status;
        outcome.output_path = state.output_path;
        outcome.traces_done = state.root_ids.size();
        outcome.items_done = state.items_done;
        outcome.pages_done = state.pages_done;
        outcome.bytes_written = state.bytes_written;
        outcome.started_at = state.started_at;
        outcome.retry_summary = tracker_.summary_line();
    };

    if (state.status == RunStatus::Completed && !fresh) {
        sync_log(fmt::format("pull: {} already completed", dir.string()));
        outcome.already_completed = true;
        fill_outcome();
        return outcome;
    }

    fs::path previous_output(state.output_path);
    if (fresh) {
        remove_output_path(output_dir);
        remove_output_path(dir / LEGACY_JSONL_NAME);
        remove_output_path(dir / LEGACY_NDJSON_NAME);
    } else if (fs::is_regular_file(previous_output)) {
        // Single-file output from an older layout becomes part 1
        fs::create_directories(output_dir);
        fs::path migrated = output_part_path(output_dir, 1);
        if (!fs::exists(migrated)) {
            std::error_code ec;
            fs::rename(previous_output, migrated, ec);
            if (ec) {
                throw std::runtime_error(fmt::format("failed to migrate legacy output {} to {}: {}",
                                                     previous_output.string(), migrated.string(),
                                                     ec.message()));
            }
        }
    }
    if (state.items_done == 0) {
        remove_output_path(output_dir);
    }
    state.output_path = output_dir.string();

    state.status = RunStatus::Running;
    state.updated_at = epoch_seconds();
    store.save_checkpoint(state);
    sync_log(fmt::format("pull: {} run {} ({}, limit {}, items so far {})", dir.string(),
                         state.run_id, to_string(opts.scope), opts.limit, state.items_done));

    bool finished = opts.scope == Scope::Spans
        ? run_spans(source, opts, store, state)
        : run_traces(source, opts, store, state);

    state.updated_at = epoch_seconds();
    if (finished) {
        state.status = RunStatus::Completed;
        state.phase = PullPhase::Completed;
        state.completed_at = state.updated_at;
    } else {
        state.status = RunStatus::Interrupted;
        sync_log(fmt::format("pull: interrupted at {} items", state.items_done));
    }
    store.save_checkpoint(state);

    fill_outcome();
    return outcome;
}
