#include "../tracesync_cli.hpp"
#include "../theme.hpp"
#include "../sync_args.hpp"
#include "../progress_line.hpp"
#include <core/utils.hpp>
#include <core/time_utils.hpp>
#include <managers/sync_spec.hpp>
#include <managers/push_engine.hpp>
#include <managers/http_clients.hpp>
#include <managers/progress.hpp>
#include <platform/interrupt.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <fmt/format.h>

static void print_push_result(const BaseCLI& cli, const PushOutcome& out) {
    if (cli.json_output) {
        json j;
        if (out.already_completed) {
            j = {{"status", "completed"},
                 {"message", "already completed for this spec"},
                 {"spec_dir", out.spec_dir.string()},
                 {"input_path", out.input_path},
                 {"items_done", out.items_done},
                 {"pages_done", out.pages_done}};
        } else {
            bool interrupted = out.status == RunStatus::Interrupted;
            j = {{"status", interrupted ? "interrupted" : "completed"},
                 {"spec_dir", out.spec_dir.string()},
                 {"input_path", out.input_path},
                 {"rows_uploaded", out.items_done},
                 {"pages_done", out.pages_done},
                 {"bytes_sent", out.bytes_sent}};
            if (interrupted) {
                j["message"] = "resume by rerunning the same command; use --fresh to restart";
            }
        }
        std::cout << j.dump(2) << "\n";
        return;
    }

    if (out.already_completed) {
        std::cout << theme::ok("Sync already completed for this spec.");
        std::cout << theme::kv("Input", out.input_path);
        std::cout << theme::kv("Items", format_commas(out.items_done));
        std::cout << theme::kv("Batches", format_commas(out.pages_done));
        return;
    }

    if (out.status == RunStatus::Interrupted) {
        std::cout << theme::section("Push interrupted");
        std::cout << theme::kv("Uploaded", fmt::format("{} rows, {} batches, {} bytes",
                                                       format_commas(out.items_done),
                                                       format_commas(out.pages_done),
                                                       format_commas(out.bytes_sent)));
        std::cout << theme::step("Resume: rerun the same command (use --fresh to restart)");
        return;
    }

    double elapsed = elapsed_seconds(out.started_at);
    std::cout << theme::section("Push complete");
    std::cout << theme::kv("Input", out.input_path);
    std::cout << theme::kv("Time", format_duration(static_cast<uint64_t>(elapsed)));
    std::cout << theme::kv("Traces", format_commas(out.distinct_roots_done));
    std::cout << theme::kv("Spans", format_commas(out.items_done));
    std::cout << theme::kv("Batches", format_commas(out.pages_done));
    std::cout << theme::kv("Data", fmt::format("{} ({} bytes)",
                                               format_bytes(static_cast<double>(out.bytes_sent)),
                                               format_commas(out.bytes_sent)));
    std::cout << theme::kv("Rates", fmt::format("{:.2f} traces/s | {:.2f} spans/s | {}/s",
                                                out.distinct_roots_done / elapsed,
                                                out.items_done / elapsed,
                                                format_bytes(out.bytes_sent / elapsed)));
    if (out.retry_summary) {
        std::cout << theme::kv("Uploads", *out.retry_summary);
    }
}

static int cmd_push(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_config()) return 1;

    auto parsed = parse_push_args(args, cli.config->defaults());
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return 1;
    }
    const PushArgs& a = parsed.value;

    auto object = parse_object_ref(a.object_ref);
    if (object.is_err()) {
        std::cout << theme::fail(object.error);
        return 1;
    }
    auto scope = resolve_push_scope(a.traces, a.spans);
    if (scope.is_err()) {
        std::cout << theme::fail(scope.error);
        return 1;
    }

    auto session = cli.require_session();
    if (!session) return 1;

    PushOptions opts;
    opts.object = object.value;
    opts.scope = scope.value.scope;
    opts.limit = scope.value.limit;
    opts.filter = a.filter;
    opts.page_size = a.page_size;
    opts.input = a.input;
    opts.fresh = a.fresh;
    opts.root = a.root;
    opts.workers = a.workers;

    HttpIngestClient client(*session);
    CancelToken cancel;
    ScopedInterruptHandler interrupt(cancel);
    PushEngine engine(client, cancel);

    ProgressLine progress(!cli.json_output && platform::stderr_is_terminal());
    engine.set_progress_callback([&](const std::string& msg) {
        progress.update(msg, progress_status_line(true, engine.retry_summary()));
    });

    PushOutcome outcome = engine.run(opts);
    progress.clear();
    print_push_result(cli, outcome);
    return 0;
}

void register_push_commands(BaseCLI& cli) {
    cli.add_command("push", cmd_push,
                    "Upload local JSONL rows into project logs, resuming from the last batch");
}
