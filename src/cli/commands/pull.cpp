#include "../tracesync_cli.hpp"
#include "../theme.hpp"
#include "../sync_args.hpp"
#include "../progress_line.hpp"
#include <core/utils.hpp>
#include <core/time_utils.hpp>
#include <managers/sync_spec.hpp>
#include <managers/pull_engine.hpp>
#include <managers/http_clients.hpp>
#include <managers/progress.hpp>
#include <platform/interrupt.hpp>
#include <platform/platform.hpp>
#include <iostream>
#include <fmt/format.h>

static std::string org_label(const SessionContext& session) {
    std::string org = session.org_name;
    trim(org);
    return org.empty() ? "(default)" : org;
}

static void print_pull_result(const BaseCLI& cli, const PullOutcome& out,
                              const std::string& object_ref, const SessionContext& session) {
    std::optional<std::string> warning;
    if (out.status == RunStatus::Completed && !out.already_completed && out.items_done == 0) {
        warning = fmt::format("no rows found for {} in org '{}'; verify object id and active credentials",
                              object_ref, org_label(session));
    }

    if (cli.json_output) {
        json j;
        if (out.already_completed) {
            j = {{"status", "completed"},
                 {"message", "already completed for this spec"},
                 {"spec_dir", out.spec_dir.string()},
                 {"output_path", out.output_path},
                 {"items_done", out.items_done},
                 {"pages_done", out.pages_done}};
        } else if (out.status == RunStatus::Interrupted) {
            j = {{"status", "interrupted"},
                 {"spec_dir", out.spec_dir.string()},
                 {"output_path", out.output_path},
                 {"items_done", out.items_done},
                 {"pages_done", out.pages_done},
                 {"bytes_written", out.bytes_written},
                 {"message", "resume by rerunning the same command; use --fresh to restart"}};
        } else {
            j = {{"status", "completed"},
                 {"spec_dir", out.spec_dir.string()},
                 {"output_path", out.output_path},
                 {"items_done", out.items_done},
                 {"pages_done", out.pages_done},
                 {"bytes_written", out.bytes_written},
                 {"scope", to_string(out.scope)},
                 {"limit", out.limit},
                 {"warning", warning ? json(*warning) : json(nullptr)}};
        }
        std::cout << j.dump(2) << "\n";
        return;
    }

    if (out.already_completed) {
        std::cout << theme::ok("Sync already completed for this spec.");
        std::cout << theme::kv("Output", out.output_path);
        std::cout << theme::kv("Items", format_commas(out.items_done));
        std::cout << theme::kv("Pages", format_commas(out.pages_done));
        return;
    }

    if (out.status == RunStatus::Interrupted) {
        std::cout << theme::section("Pull interrupted");
        std::cout << theme::kv("Output", out.output_path);
        std::cout << theme::kv("Spans", format_commas(out.items_done));
        std::cout << theme::kv("Pages", format_commas(out.pages_done));
        std::cout << theme::kv("Data", fmt::format("{} ({} bytes)",
                                                   format_bytes(static_cast<double>(out.bytes_written)),
                                                   format_commas(out.bytes_written)));
        std::cout << theme::step("Resume: rerun the same command (use --fresh to restart)");
        return;
    }

    if (warning) {
        std::cout << theme::warn("Warning: " + *warning + ".");
    }

    double elapsed = elapsed_seconds(out.started_at);
    std::cout << theme::section("Pull complete");
    std::cout << theme::kv("Output", out.output_path);
    std::cout << theme::kv("Time", format_duration(static_cast<uint64_t>(elapsed)));
    std::cout << theme::kv("Traces", format_commas(out.traces_done));
    std::cout << theme::kv("Spans", format_commas(out.items_done));
    std::cout << theme::kv("Pages", format_commas(out.pages_done));
    std::cout << theme::kv("Data", fmt::format("{} ({} bytes)",
                                               format_bytes(static_cast<double>(out.bytes_written)),
                                               format_commas(out.bytes_written)));
    std::cout << theme::kv("Rates", fmt::format("{:.2f} traces/s | {:.2f} spans/s | {}/s",
                                                out.traces_done / elapsed,
                                                out.items_done / elapsed,
                                                format_bytes(out.bytes_written / elapsed)));
    if (out.retry_summary) {
        std::cout << theme::kv("Query", *out.retry_summary);
    }
}

static int cmd_pull(BaseCLI& cli, const std::vector<std::string>& args) {
    if (!cli.require_config()) return 1;

    auto parsed = parse_pull_args(args, cli.config->defaults());
    if (parsed.is_err()) {
        std::cout << theme::fail(parsed.error);
        return 1;
    }
    const PullArgs& a = parsed.value;

    auto object = parse_object_ref(a.object_ref);
    if (object.is_err()) {
        std::cout << theme::fail(object.error);
        return 1;
    }
    auto scope = resolve_pull_scope(a.traces, a.spans);
    if (scope.is_err()) {
        std::cout << theme::fail(scope.error);
        return 1;
    }

    auto session = cli.require_session();
    if (!session) return 1;

    PullOptions opts;
    opts.object = object.value;
    opts.scope = scope.value.scope;
    opts.limit = scope.value.limit;
    opts.filter = a.filter;
    opts.page_size = a.page_size;
    opts.cursor = a.cursor;
    opts.fresh = a.fresh;
    opts.root = a.root;
    opts.workers = a.workers;

    HttpQueryClient client(*session);
    CancelToken cancel;
    ScopedInterruptHandler interrupt(cancel);
    PullEngine engine(client, cancel);

    ProgressLine progress(!cli.json_output && platform::stderr_is_terminal());
    engine.set_progress_callback([&](const std::string& msg) {
        progress.update(msg, progress_status_line(true, engine.retry_summary()));
    });

    PullOutcome outcome = engine.run(opts);
    progress.clear();
    print_pull_result(cli, outcome, opts.object.object_type + ":" + opts.object.object_name,
                      *session);
    return 0;
}

void register_pull_commands(BaseCLI& cli) {
    cli.add_command("pull", cmd_pull,
                    "Download spans or whole traces into a resumable local spec directory");
}
