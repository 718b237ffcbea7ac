#include "test_helpers.hpp"
#include <managers/push_engine.hpp>
#include <managers/state_store.hpp>
#include <managers/sync_spec.hpp>
#include <functional>
#include <mutex>
#include <set>

namespace {

// Records every uploaded row. Each row counts as 10 bytes.
class RecordingIngestClient : public IngestClient {
public:
    size_t upload_rows(const std::vector<json>& rows, size_t) override {
        std::function<void()> hook;
        bool fail = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            hook = on_upload;
            calls++;
            if (failures_left > 0) {
                failures_left--;
                fail = true;
            }
        }
        if (hook) hook();
        if (fail) throw RemoteError::http(fail_status, "ingest unavailable");

        std::lock_guard<std::mutex> lock(mutex_);
        uploaded.insert(uploaded.end(), rows.begin(), rows.end());
        return rows.size() * 10;
    }

    std::vector<std::string> uploaded_ids() {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<std::string> ids;
        for (const auto& row : uploaded) ids.push_back(row["id"].get<std::string>());
        return ids;
    }

    std::vector<json> uploaded;
    std::function<void()> on_upload;
    int fail_status = 503;
    int failures_left = 0;          // upcoming calls that throw fail_status
    int calls = 0;

private:
    std::mutex mutex_;
};

json row(const std::string& id, const std::string& root) {
    return json{{"id", id}, {"span_id", id}, {"root_span_id", root}};
}

RetryPolicy no_delay() {
    RetryPolicy p;
    p.base_delay_ms = 0;
    p.max_delay_ms = 0;
    return p;
}

} // namespace

class PushEngineTest : public TempDirTest {
protected:
    fs::path write_rows(const std::string& name, const std::vector<json>& rows) {
        std::string content;
        for (const auto& r : rows) content += r.dump() + "\n";
        fs::path path = test_dir / "input" / name;
        write_file(path, content);
        return path;
    }

    PushOptions options(const fs::path& input) {
        PushOptions opts;
        opts.object = {"project_logs", "proj-1"};
        opts.scope = Scope::All;
        opts.page_size = 2;
        opts.input = input;
        opts.root = test_dir / "root";
        opts.workers = 1;
        return opts;
    }

    RecordingIngestClient client;
};

TEST_F(PushEngineTest, UploadsAndRewritesRows) {
    json first = row("a", "r");
    first["_xact_id"] = "123";
    first["org_id"] = "org";
    first["created"] = "2024-01-01";
    fs::path input = write_rows("rows.jsonl", {first, json{{"span_id", "b"}}, json{{"input", "x"}}});

    CancelToken cancel;
    PushEngine engine(client, cancel);
    PushOutcome out = engine.run(options(input));

    EXPECT_EQ(out.status, RunStatus::Completed);
    EXPECT_EQ(out.items_done, 3u);
    EXPECT_EQ(out.pages_done, 2u);
    EXPECT_EQ(out.bytes_sent, 30u);
    EXPECT_EQ(out.distinct_roots_done, 3u);
    ASSERT_EQ(client.uploaded.size(), 3u);

    const json& a = client.uploaded[0];
    EXPECT_FALSE(a.contains("_xact_id"));
    EXPECT_FALSE(a.contains("org_id"));
    EXPECT_FALSE(a.contains("created"));
    EXPECT_EQ(a["project_id"], "proj-1");
    EXPECT_EQ(a["log_id"], "g");
    EXPECT_EQ(a["root_span_id"], "r");

    const json& b = client.uploaded[1];
    EXPECT_EQ(b["id"], "b");
    EXPECT_EQ(b["root_span_id"], "b");
    EXPECT_EQ(b["span_parents"], json::array());

    json state = read_json(out.spec_dir / "state.json");
    std::string run_id = state["run_id"].get<std::string>();
    EXPECT_EQ(client.uploaded[2]["id"], "sync-" + run_id + "-2");
    EXPECT_EQ(state["line_offset"], 3);
    EXPECT_EQ(state["status"], "completed");
    EXPECT_EQ(read_json(out.spec_dir / "manifest.json")["input_path"], input.string());
}

TEST_F(PushEngineTest, InterruptAndResumeWithoutDuplicates) {
    std::vector<json> rows;
    for (int i = 0; i < 6; i++) rows.push_back(row("s" + std::to_string(i), "r" + std::to_string(i / 2)));
    fs::path input = write_rows("rows.jsonl", rows);

    CancelToken first;
    client.on_upload = [&] { first.cancel(); };
    PushEngine engine(client, first);
    PushOutcome out = engine.run(options(input));

    EXPECT_EQ(out.status, RunStatus::Interrupted);
    EXPECT_EQ(out.items_done, 2u);
    json state = read_json(out.spec_dir / "state.json");
    EXPECT_EQ(state["line_offset"], 2);
    EXPECT_EQ(state["status"], "interrupted");

    client.on_upload = nullptr;
    CancelToken second;
    PushEngine resumed(client, second);
    PushOutcome done = resumed.run(options(input));

    EXPECT_EQ(done.status, RunStatus::Completed);
    EXPECT_EQ(done.items_done, 6u);
    EXPECT_EQ(done.distinct_roots_done, 3u);
    auto ids = client.uploaded_ids();
    EXPECT_EQ(ids.size(), 6u);
    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()).size(), 6u);
}

TEST_F(PushEngineTest, TracesLimitHoldsAcrossResumeWithIdlessRow) {
    fs::path input = write_rows("rows.jsonl", {json{{"input", 1}},
                                               json{{"root_span_id", "r2"}},
                                               json{{"root_span_id", "r3"}}});
    PushOptions opts = options(input);
    opts.scope = Scope::Traces;
    opts.limit = 2;
    opts.page_size = 1;

    CancelToken first;
    client.on_upload = [&] { first.cancel(); };
    PushEngine engine(client, first);
    PushOutcome out = engine.run(opts);
    ASSERT_EQ(out.status, RunStatus::Interrupted);
    EXPECT_EQ(out.items_done, 1u);

    client.on_upload = nullptr;
    CancelToken second;
    PushEngine resumed(client, second);
    PushOutcome done = resumed.run(opts);

    EXPECT_EQ(done.status, RunStatus::Completed);
    EXPECT_EQ(done.items_done, 2u);
    EXPECT_EQ(done.distinct_roots_done, 2u);
    ASSERT_EQ(client.uploaded.size(), 2u);
    EXPECT_EQ(client.uploaded[1]["root_span_id"], "r2");
}

TEST_F(PushEngineTest, CompletedSpecIsNoOp) {
    fs::path input = write_rows("rows.jsonl", {row("a", "r")});
    CancelToken cancel;
    PushEngine engine(client, cancel);
    engine.run(options(input));

    PushOutcome again = engine.run(options(input));
    EXPECT_TRUE(again.already_completed);
    EXPECT_EQ(client.uploaded.size(), 1u);
}

TEST_F(PushEngineTest, SpansLimit) {
    fs::path input = write_rows("rows.jsonl", {row("a", "r1"), row("b", "r1"), row("c", "r2")});
    PushOptions opts = options(input);
    opts.scope = Scope::Spans;
    opts.limit = 2;

    CancelToken cancel;
    PushEngine engine(client, cancel);
    PushOutcome out = engine.run(opts);
    EXPECT_EQ(out.items_done, 2u);
    EXPECT_EQ(client.uploaded_ids(), (std::vector<std::string>{"a", "b"}));
}

TEST_F(PushEngineTest, TracesLimitKeepsWholeTraces) {
    fs::path input = write_rows("rows.jsonl",
                                {row("a", "r1"), row("b", "r1"), row("c", "r2"), row("d", "r3")});
    PushOptions opts = options(input);
    opts.scope = Scope::Traces;
    opts.limit = 2;
    opts.workers = 3;

    CancelToken cancel;
    PushEngine engine(client, cancel);
    PushOutcome out = engine.run(opts);
    EXPECT_EQ(out.items_done, 3u);
    EXPECT_EQ(out.distinct_roots_done, 2u);
    auto ids = client.uploaded_ids();
    EXPECT_EQ(std::set<std::string>(ids.begin(), ids.end()),
              (std::set<std::string>{"a", "b", "c"}));
}

TEST_F(PushEngineTest, BlankLinesAreSkipped) {
    fs::path input = test_dir / "input" / "rows.jsonl";
    write_file(input, row("a", "r").dump() + "\n\n   \n" + row("b", "r").dump() + "\n");

    CancelToken cancel;
    PushEngine engine(client, cancel);
    PushOutcome out = engine.run(options(input));
    EXPECT_EQ(out.items_done, 2u);
    EXPECT_EQ(read_json(out.spec_dir / "state.json")["line_offset"], 4);
}

TEST_F(PushEngineTest, InvalidJsonNamesFileAndLine) {
    fs::path input = test_dir / "input" / "rows.jsonl";
    write_file(input, row("a", "r").dump() + "\nnot json\n");

    CancelToken cancel;
    PushEngine engine(client, cancel);
    try {
        engine.run(options(input));
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("rows.jsonl"), std::string::npos);
        EXPECT_NE(msg.find("line 2"), std::string::npos);
    }
}

TEST_F(PushEngineTest, TransientUploadErrorIsRetried) {
    fs::path input = write_rows("rows.jsonl", {row("a", "r"), row("b", "r")});
    PushOptions opts = options(input);
    opts.page_size = 1;
    client.failures_left = 1;

    CancelToken cancel;
    PushEngine engine(client, cancel, no_delay());
    PushOutcome out = engine.run(opts);

    EXPECT_EQ(out.status, RunStatus::Completed);
    EXPECT_EQ(out.items_done, 2u);
    EXPECT_EQ(client.calls, 3);
    EXPECT_EQ(client.uploaded_ids(), (std::vector<std::string>{"a", "b"}));
    EXPECT_EQ(out.retry_summary, std::string("upload retries: 1 (HTTP 503)"));
}

TEST_F(PushEngineTest, UploadFailurePropagatesAfterLastAttempt) {
    fs::path input = write_rows("rows.jsonl", {row("a", "r"), row("b", "r"), row("c", "r")});
    client.failures_left = 100;

    CancelToken cancel;
    PushEngine engine(client, cancel, no_delay());
    try {
        engine.run(options(input));
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("upload of batch 0 failed after 5 attempt(s)"),
                  std::string::npos);
    }
    EXPECT_EQ(client.calls, 5);
    EXPECT_TRUE(client.uploaded.empty());
}

TEST_F(PushEngineTest, PermanentUploadErrorIsNotRetried) {
    fs::path input = write_rows("rows.jsonl", {row("a", "r")});
    client.fail_status = 400;
    client.failures_left = 100;

    CancelToken cancel;
    PushEngine engine(client, cancel, no_delay());
    EXPECT_THROW(engine.run(options(input)), std::runtime_error);
    EXPECT_EQ(client.calls, 1);
}

TEST_F(PushEngineTest, ManifestFollowsEveryCommit) {
    std::vector<json> rows = {row("a", "r1"), row("b", "r2"), row("c", "r3")};
    fs::path input = write_rows("rows.jsonl", rows);
    PushOptions opts = options(input);
    opts.page_size = 1;

    SyncSpec spec = make_sync_spec(opts.object, Direction::Push, opts.scope, std::nullopt,
                                   opts.limit, opts.page_size);
    fs::path dir = spec_dir(opts.root, opts.object, spec_hash(spec));
    std::vector<json> seen;
    client.on_upload = [&] {
        json manifest = read_json(dir / "manifest.json");
        EXPECT_EQ(manifest["items_done"], read_json(dir / "state.json")["items_done"]);
        EXPECT_EQ(manifest["status"], "running");
        seen.push_back(manifest["items_done"]);
    };

    CancelToken cancel;
    PushEngine engine(client, cancel);
    PushOutcome out = engine.run(opts);
    ASSERT_EQ(out.spec_dir, dir);
    EXPECT_EQ(seen, (std::vector<json>{0, 1, 2}));
    EXPECT_EQ(read_json(dir / "manifest.json")["status"], "completed");
}

TEST_F(PushEngineTest, OnlyProjectLogs) {
    fs::path input = write_rows("rows.jsonl", {row("a", "r")});
    PushOptions opts = options(input);
    opts.object = {"dataset", "d1"};

    CancelToken cancel;
    PushEngine engine(client, cancel);
    EXPECT_THROW(engine.run(opts), std::invalid_argument);
}

TEST_F(PushEngineTest, DefaultInputIsNewestCompletedPull) {
    ObjectRef obj{"project_logs", "proj-1"};
    fs::path root = test_dir / "root";

    auto write_pull = [&](const std::string& hash, uint64_t updated_at, RunStatus status) {
        fs::path dir = spec_dir(root, obj, hash);
        write_file(dir / "data" / "part-000001.jsonl", row("x", "r").dump() + "\n");
        SyncManifest m;
        m.spec = make_sync_spec(obj, Direction::Pull, Scope::Traces, std::nullopt, size_t{1}, 1);
        m.status = status;
        m.output_path = (dir / "data").string();
        m.updated_at = updated_at;
        write_json_atomic(dir / "manifest.json", json(m));
        return dir;
    };
    write_pull(std::string(64, 'a'), 100, RunStatus::Completed);
    fs::path newest = write_pull(std::string(64, 'b'), 200, RunStatus::Completed);
    write_pull(std::string(64, 'c'), 300, RunStatus::Interrupted);

    EXPECT_EQ(resolve_default_push_input(root, obj), newest / "data");
    EXPECT_THROW(resolve_default_push_input(root, {"project_logs", "other"}), std::runtime_error);
}

TEST_F(PushEngineTest, InputFileResolution) {
    fs::path dir = test_dir / "input";
    write_file(dir / "b.jsonl", "{}\n");
    write_file(dir / "a.ndjson", "{}\n");
    write_file(dir / "c.txt", "{}\n");
    EXPECT_EQ(resolve_push_input_files(dir),
              (std::vector<fs::path>{dir / "a.ndjson", dir / "b.jsonl"}));
    EXPECT_EQ(resolve_push_input_files(dir / "c.txt"), (std::vector<fs::path>{dir / "c.txt"}));

    fs::path spec = test_dir / "spec";
    write_file(spec / "data" / "part-000001.jsonl", "{}\n");
    EXPECT_EQ(resolve_push_input_files(spec),
              (std::vector<fs::path>{spec / "data" / "part-000001.jsonl"}));

    fs::create_directories(test_dir / "empty");
    EXPECT_THROW(resolve_push_input_files(test_dir / "empty"), std::runtime_error);
}

TEST_F(PushEngineTest, SeenRootsRebuiltFromOffset) {
    fs::path input = test_dir / "rows.jsonl";
    write_file(input, row("a", "r1").dump() + "\n\n" + row("b", "r2").dump() + "\n" +
                      row("c", "r3").dump() + "\n");
    EXPECT_EQ(count_lines({input}), 4u);

    auto seen = collect_seen_roots_until_offset({input}, 3);
    EXPECT_EQ(seen, (std::unordered_set<std::string>{"r1", "r2"}));

    fs::path idless = test_dir / "idless.jsonl";
    write_file(idless, json{{"input", 1}}.dump() + "\n" + row("b", "r2").dump() + "\n");
    EXPECT_EQ(collect_seen_roots_until_offset({idless}, 2),
              (std::unordered_set<std::string>{"__missing__", "r2"}));
}

// ── Ordered commit ──────────────────────────────────────────

TEST_F(PushEngineTest, OutOfOrderResultsCommitInBatchOrder) {
    PushState state;
    fs::path state_path = test_dir / "state.json";
    std::map<size_t, PushBatchResult> pending;
    size_t next = 0;

    PushBatchResult second{1, 2, 20, 4, 2};
    pending[1] = second;
    flush_ready_push_results(pending, next, state, state_path);
    EXPECT_EQ(next, 0u);
    EXPECT_EQ(state.line_offset, 0u);
    EXPECT_FALSE(fs::exists(state_path));

    PushBatchResult first{0, 2, 20, 2, 1};
    pending[0] = first;
    std::vector<std::string> commits;
    flush_ready_push_results(pending, next, state, state_path,
                             [&](const std::string& msg) { commits.push_back(msg); });
    EXPECT_EQ(next, 2u);
    EXPECT_TRUE(pending.empty());
    EXPECT_EQ(state.items_done, 4u);
    EXPECT_EQ(state.pages_done, 2u);
    EXPECT_EQ(state.line_offset, 4u);
    EXPECT_EQ(commits.size(), 2u);
    EXPECT_EQ(read_json(state_path)["line_offset"], 4);
}

TEST(PushRows, PrepareRowDefaults) {
    json r = {{"input", "x"}, {"_pagination_key", "p"}, {"_async_scoring_state", {}}};
    prepare_row_for_upload(r, "proj", "run-1", 7);
    EXPECT_EQ(r["id"], "sync-run-1-7");
    EXPECT_EQ(r["span_id"], "sync-run-1-7");
    EXPECT_EQ(r["root_span_id"], "sync-run-1-7");
    EXPECT_FALSE(r.contains("_pagination_key"));
    EXPECT_FALSE(r.contains("_async_scoring_state"));

    json keep = {{"id", "i"}, {"span_id", "s"}, {"span_parents", {"p"}}};
    prepare_row_for_upload(keep, "proj", "run-1", 0);
    EXPECT_EQ(keep["id"], "i");
    EXPECT_EQ(keep["span_id"], "s");
    EXPECT_EQ(keep["root_span_id"], "s");
    EXPECT_EQ(keep["span_parents"], json::array({"p"}));
}
