#include "push_engine.hpp"
#include <core/utils.hpp>
#include <managers/sync_log.hpp>
#include "sync_spec.hpp"
#include "state_store.hpp"
#include "progress.hpp"
#include <fmt/format.h>
#include <algorithm>
#include <condition_variable>
#include <deque>
#include <exception>
#include <fstream>
#include <mutex>
#include <stdexcept>
#include <thread>

// ── Input files ─────────────────────────────────────────────

static std::vector<fs::path> collect_json_input_files(const fs::path& dir) {
    std::vector<fs::path> files;
    for (const auto& entry : fs::directory_iterator(dir)) {
        if (!entry.is_regular_file()) continue;
        auto ext = entry.path().extension().string();
        if (ext == ".jsonl" || ext == ".ndjson") files.push_back(entry.path());
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::vector<fs::path> resolve_push_input_files(const fs::path& input) {
    if (fs::is_regular_file(input)) return {input};
    if (!fs::is_directory(input)) {
        throw std::runtime_error(fmt::format("input path is neither file nor directory: {}",
                                             input.string()));
    }

    auto files = collect_json_input_files(input);
    if (files.empty()) {
        if (auto resolved = resolve_pull_spec_output_path(input)) {
            if (fs::is_regular_file(*resolved)) files = {*resolved};
            else if (fs::is_directory(*resolved)) files = collect_json_input_files(*resolved);
        }
    }
    if (files.empty()) {
        throw std::runtime_error(fmt::format(
            "no .jsonl or .ndjson files found in input directory {}", input.string()));
    }
    return files;
}

fs::path resolve_default_push_input(const fs::path& root, const ObjectRef& object) {
    std::optional<std::pair<uint64_t, fs::path>> best;
    for (const auto& dir : collect_object_spec_dirs(root, object)) {
        fs::path manifest_path = dir / MANIFEST_FILE_NAME;
        if (!fs::exists(manifest_path)) continue;

        auto manifest = read_json_as<SyncManifest>(manifest_path);
        if (manifest.status != RunStatus::Completed || manifest.spec.direction != "pull") {
            continue;
        }

        std::optional<fs::path> output;
        if (manifest.output_path && fs::exists(*manifest.output_path)) {
            output = fs::path(*manifest.output_path);
        } else {
            output = resolve_pull_spec_output_path(dir);
        }
        if (!output) continue;

        if (!best || manifest.updated_at > best->first) {
            best = std::make_pair(manifest.updated_at, *output);
        }
    }

    if (!best) {
        throw std::runtime_error(fmt::format(
            "no completed pull output found for object {}. run `tracesync pull {}:{} ...` "
            "first or pass --in", object.object_name, object.object_type, object.object_name));
    }
    return best->second;
}

static std::ifstream open_input(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) throw std::runtime_error(fmt::format("failed to open input {}", path.string()));
    return in;
}

static bool is_blank(const std::string& line) {
    return line.find_first_not_of(" \t\r\n") == std::string::npos;
}

size_t count_lines(const std::vector<fs::path>& files) {
    size_t count = 0;
    for (const auto& path : files) {
        auto in = open_input(path);
        std::string line;
        while (std::getline(in, line)) count++;
    }
    return count;
}

std::unordered_set<std::string> collect_seen_roots_until_offset(
        const std::vector<fs::path>& files, size_t line_offset) {
    std::unordered_set<std::string> seen;
    size_t global_index = 0;

    for (const auto& path : files) {
        auto in = open_input(path);
        std::string line;
        size_t line_number = 0;
        while (std::getline(in, line)) {
            if (global_index >= line_offset) return seen;
            line_number++;
            global_index++;
            if (is_blank(line)) continue;

            json row;
            try {
                row = json::parse(line);
            } catch (const json::parse_error& e) {
                throw std::runtime_error(fmt::format(
                    "invalid JSON in {} at line {} while rebuilding trace resume state: {}",
                    path.string(), line_number, e.what()));
            }
            seen.insert(row_root_span_id(row).value_or(MISSING_ROOT_ID));
        }
    }
    return seen;
}

// ── Rows and checkpoints ────────────────────────────────────

static std::optional<std::string> string_field(const json& row, const char* key) {
    auto it = row.find(key);
    if (it != row.end() && it->is_string()) return it->get<std::string>();
    return std::nullopt;
}

void prepare_row_for_upload(json& row, const std::string& project_id,
                            const std::string& run_id, size_t row_index) {
    static const std::vector<std::string> server_fields = {
        "_xact_id", "_pagination_key", "_async_scoring_state", "org_id", "created"};
    for (const auto& key : server_fields) row.erase(key);
    row["project_id"] = project_id;
    row["log_id"] = DEFAULT_LOG_ID;

    std::string id = string_field(row, "id")
        .value_or(string_field(row, "span_id")
        .value_or(fmt::format("sync-{}-{}", run_id, row_index)));
    row["id"] = id;

    std::string span_id = string_field(row, "span_id").value_or(id);
    row["span_id"] = span_id;
    row["root_span_id"] = string_field(row, "root_span_id").value_or(span_id);

    if (!row.contains("span_parents")) {
        row["span_parents"] = json::array();
    }
}

void commit_push_batch_state(PushState& state, const PushBatchResult& result) {
    state.items_done += result.row_count;
    state.pages_done++;
    state.bytes_sent += result.bytes_sent;
    state.line_offset = result.end_line_offset;
    state.distinct_roots_done = result.distinct_roots_done;
    state.updated_at = epoch_seconds();
}

void flush_ready_push_results(std::map<size_t, PushBatchResult>& pending,
                              size_t& next_commit_index, PushState& state,
                              const fs::path& state_path,
                              const StatusCallback& on_commit) {
    for (auto it = pending.find(next_commit_index); it != pending.end();
         it = pending.find(next_commit_index)) {
        commit_push_batch_state(state, it->second);
        pending.erase(it);
        write_json_atomic(state_path, json(state));
        next_commit_index++;
        if (on_commit) on_commit(fmt::format("committed batch {}", next_commit_index - 1));
    }
}

// ── Upload pool ─────────────────────────────────────────────

namespace {

// Fixed set of upload threads. Results come back in completion order.
class UploadPool {
public:
    UploadPool(IngestClient& client, size_t workers, size_t page_size,
               const RetryPolicy& policy, RetryTracker& tracker)
        : client_(client), page_size_(page_size), policy_(policy), tracker_(tracker) {
        for (size_t i = 0; i < workers; i++) {
            threads_.emplace_back([this] { worker_loop(); });
        }
    }

    ~UploadPool() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        work_cv_.notify_all();
        for (auto& t : threads_) t.join();
    }

    UploadPool(const UploadPool&) = delete;
    UploadPool& operator=(const UploadPool&) = delete;

    void submit(PushBatchWork work) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            queue_.push_back(std::move(work));
            in_flight_++;
        }
        work_cv_.notify_one();
    }

    size_t in_flight() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return in_flight_;
    }

    // Blocks for the next finished batch. Rethrows an upload failure.
    PushBatchResult next_result() {
        std::unique_lock<std::mutex> lock(mutex_);
        result_cv_.wait(lock, [this] { return !results_.empty(); });
        Slot slot = std::move(results_.front());
        results_.pop_front();
        in_flight_--;
        if (slot.error) std::rethrow_exception(slot.error);
        return slot.result;
    }

private:
    struct Slot {
        PushBatchResult result;
        std::exception_ptr error;
    };

    void worker_loop() {
        while (true) {
            PushBatchWork work;
            {
                std::unique_lock<std::mutex> lock(mutex_);
                work_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
                if (stopping_) return;
                work = std::move(queue_.front());
                queue_.pop_front();
            }

            Slot slot;
            try {
                size_t bytes = run_with_retries(
                    policy_, &tracker_, fmt::format("upload of batch {}", work.batch_index), "",
                    [&] { return client_.upload_rows(work.rows, page_size_); });
                slot.result.batch_index = work.batch_index;
                slot.result.row_count = work.rows.size();
                slot.result.bytes_sent = bytes;
                slot.result.end_line_offset = work.end_line_offset;
                slot.result.distinct_roots_done = work.distinct_roots_done;
            } catch (...) {
                slot.error = std::current_exception();
            }

            {
                std::lock_guard<std::mutex> lock(mutex_);
                results_.push_back(std::move(slot));
            }
            result_cv_.notify_one();
        }
    }

    IngestClient& client_;
    size_t page_size_;
    RetryPolicy policy_;
    RetryTracker& tracker_;
    std::vector<std::thread> threads_;

    mutable std::mutex mutex_;
    std::condition_variable work_cv_;
    std::condition_variable result_cv_;
    std::deque<PushBatchWork> queue_;
    std::deque<Slot> results_;
    size_t in_flight_ = 0;
    bool stopping_ = false;
};

} // namespace

// ── PushEngine ──────────────────────────────────────────────

PushEngine::PushEngine(IngestClient& client, CancelToken& cancel, RetryPolicy policy)
    : client_(client), cancel_(cancel), policy_(policy), tracker_("upload retries") {}

PushOutcome PushEngine::run(const PushOptions& opts) {
    if (opts.object.object_type != "project_logs") {
        throw std::invalid_argument(fmt::format(
            "push currently supports only project_logs:<project_id>; got {}:{}",
            opts.object.object_type, opts.object.object_name));
    }
    size_t page_size = std::max<size_t>(opts.page_size, 1);

    SyncSpec spec = make_sync_spec(opts.object, Direction::Push, opts.scope,
                                   trim_optional(opts.filter), opts.limit, opts.page_size);
    std::string hash = spec_hash(spec);
    fs::path dir = resolve_spec_dir(opts.root, opts.object, Direction::Push, opts.scope,
                                    hash, !opts.fresh);
    fs::create_directories(dir);
    StateStore store(dir);
    store.ensure_spec(spec);
    store.bind_spec(hash, spec);

    fs::path input_path = opts.input ? *opts.input
                                     : resolve_default_push_input(opts.root, opts.object);
    if (!fs::exists(input_path)) {
        throw std::runtime_error(fmt::format("input path does not exist: {}", input_path.string()));
    }

    PushState state;
    if (opts.fresh || !store.has_state()) {
        state = new_push_state(opts.scope, opts.limit, opts.page_size, input_path.string());
    } else {
        state = *store.load_state<PushState>();
    }

    PushOutcome outcome;
    outcome.spec_dir = dir;
    outcome.input_path = input_path.string();
    auto fill_outcome = [&] {
        outcome.status = state.status;
        outcome.items_done = state.items_done;
        outcome.pages_done = state.pages_done;
        outcome.bytes_sent = state.bytes_sent;
        outcome.distinct_roots_done = state.distinct_roots_done;
        outcome.started_at = state.started_at;
        outcome.retry_summary = tracker_.summary_line();
    };

    if (state.status == RunStatus::Completed && !opts.fresh) {
        outcome.input_path = state.source_path;
        outcome.already_completed = true;
        fill_outcome();
        return outcome;
    }

    state.status = RunStatus::Running;
    state.updated_at = epoch_seconds();
    store.save_checkpoint(state);

    auto files = resolve_push_input_files(input_path);
    std::optional<size_t> upload_total;
    if (opts.scope != Scope::Traces) {
        size_t lines = count_lines(files);
        upload_total = opts.limit ? std::min(*opts.limit, lines) : lines;
    }

    std::unordered_set<std::string> seen_roots;
    if (state.line_offset > 0) {
        seen_roots = collect_seen_roots_until_offset(files, state.line_offset);
    }
    state.distinct_roots_done = std::max(state.distinct_roots_done, seen_roots.size());

    ProgressBaseline baseline{epoch_seconds(), state.distinct_roots_done,
                              state.items_done, state.bytes_sent};
    StatusCallback on_commit = [&](const std::string& msg) {
        sync_log("push: " + msg);
        update_manifest_from_push_state(store.manifest_path(), hash, spec, state);
        if (on_progress_) on_progress_(push_progress_message(state, baseline, upload_total));
    };

    sync_log(fmt::format("push: {} run {} from {} ({} file(s), line offset {})", dir.string(),
                         state.run_id, input_path.string(), files.size(), state.line_offset));

    size_t worker_count = std::max<size_t>(opts.workers, 1);
    const std::string& project_id = opts.object.object_name;
    size_t selected = state.items_done;
    size_t next_batch_index = 0;
    size_t next_commit_index = 0;
    std::map<size_t, PushBatchResult> pending;
    PushBatchWork batch;
    bool interrupted = false;

    {
        UploadPool pool(client_, worker_count, page_size, policy_, tracker_);

        auto dispatch = [&] {
            batch.batch_index = next_batch_index++;
            pool.submit(std::move(batch));
            batch = PushBatchWork{};
            while (pool.in_flight() >= worker_count) {
                PushBatchResult result = pool.next_result();
                pending[result.batch_index] = result;
                flush_ready_push_results(pending, next_commit_index, state,
                                         store.state_path(), on_commit);
            }
        };

        size_t global_index = 0;
        bool stop = false;
        for (const auto& path : files) {
            if (stop) break;
            auto in = open_input(path);
            std::string line;
            size_t line_number = 0;
            while (std::getline(in, line)) {
                if (cancel_.cancelled()) {
                    interrupted = true;
                    stop = true;
                    break;
                }
                size_t current = global_index++;
                line_number++;
                if (current < state.line_offset || is_blank(line)) continue;

                json row;
                try {
                    row = json::parse(line);
                } catch (const json::parse_error& e) {
                    throw std::runtime_error(fmt::format("invalid JSON in {} at line {}: {}",
                                                         path.string(), line_number, e.what()));
                }
                if (!row.is_object()) {
                    throw std::runtime_error(fmt::format("invalid JSON in {} at line {}: "
                                                         "expected an object",
                                                         path.string(), line_number));
                }

                if (opts.scope == Scope::Spans && opts.limit && selected >= *opts.limit) {
                    stop = true;
                    break;
                }
                std::string root = row_root_span_id(row).value_or(MISSING_ROOT_ID);
                if (opts.scope == Scope::Traces && opts.limit && !seen_roots.count(root) &&
                    seen_roots.size() >= *opts.limit) {
                    stop = true;
                    break;
                }
                if (!root.empty()) seen_roots.insert(root);

                prepare_row_for_upload(row, project_id, state.run_id, selected);
                selected++;
                batch.rows.push_back(std::move(row));
                batch.end_line_offset = current + 1;
                batch.distinct_roots_done = seen_roots.size();

                if (batch.rows.size() >= page_size) dispatch();
            }
        }

        if (!batch.rows.empty() && !interrupted) {
            batch.batch_index = next_batch_index++;
            pool.submit(std::move(batch));
        }
        while (pool.in_flight() > 0) {
            PushBatchResult result = pool.next_result();
            pending[result.batch_index] = result;
            flush_ready_push_results(pending, next_commit_index, state,
                                     store.state_path(), on_commit);
        }
    }

    if (!pending.empty() || next_commit_index != next_batch_index) {
        throw std::runtime_error(fmt::format("push checkpoint mismatch: committed {} of {} batch(es)",
                                             next_commit_index, next_batch_index));
    }

    state.updated_at = epoch_seconds();
    if (interrupted) {
        state.status = RunStatus::Interrupted;
        sync_log(fmt::format("push: interrupted at line offset {}", state.line_offset));
    } else {
        state.status = RunStatus::Completed;
        state.completed_at = state.updated_at;
    }
    store.save_checkpoint(state);

    fill_outcome();
    return outcome;
}
