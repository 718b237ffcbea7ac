#include "progress.hpp"
#include <core/utils.hpp>
#include <core/time_utils.hpp>
#include <fmt/format.h>
#include <algorithm>

template <typename T>
static T saturating_sub(T a, T b) {
    return a > b ? a - b : 0;
}

static std::string render(size_t traces, double traces_rate, size_t spans, double spans_rate,
                          uint64_t bytes, double bytes_rate, const std::string& eta) {
    return fmt::format("{} traces ({:.2f}/s) | {} spans ({:.2f}/s) | {} ({}/s) | ETA {}",
                       format_commas(traces), traces_rate,
                       format_commas(spans), spans_rate,
                       format_bytes(static_cast<double>(bytes)), format_bytes(bytes_rate),
                       eta);
}

std::string pull_spans_progress_message(const PullState& state, const ProgressBaseline& base) {
    double elapsed = elapsed_seconds(base.started_at);
    size_t traces = saturating_sub(state.root_ids.size(), base.roots_done);
    size_t spans = saturating_sub(state.items_done, base.items_done);
    uint64_t bytes = saturating_sub(state.bytes_written, base.bytes_done);
    double spans_rate = spans / elapsed;
    std::string eta = format_eta(std::min(state.items_done, state.limit), state.limit, spans_rate);
    return render(state.root_ids.size(), traces / elapsed, state.items_done, spans_rate,
                  state.bytes_written, bytes / elapsed, eta);
}

std::string pull_trace_progress_message(const PullState& state, const ProgressBaseline& base,
                                        size_t trace_progress_done) {
    double elapsed = elapsed_seconds(base.started_at);
    size_t traces = saturating_sub(trace_progress_done, base.roots_done);
    size_t total_traces = std::max(saturating_sub(state.limit, base.roots_done), traces);
    size_t spans = saturating_sub(state.items_done, base.items_done);
    uint64_t bytes = saturating_sub(state.bytes_written, base.bytes_done);
    double traces_rate = traces / elapsed;
    std::string eta = format_eta(traces, total_traces, traces_rate);
    return render(trace_progress_done, traces_rate, state.items_done, spans / elapsed,
                  state.bytes_written, bytes / elapsed, eta);
}

std::string push_progress_message(const PushState& state, const ProgressBaseline& base,
                                  std::optional<size_t> upload_total) {
    double elapsed = elapsed_seconds(base.started_at);
    size_t traces = saturating_sub(state.distinct_roots_done, base.roots_done);
    size_t spans = saturating_sub(state.items_done, base.items_done);
    uint64_t bytes = saturating_sub(state.bytes_sent, base.bytes_done);
    double traces_rate = traces / elapsed;
    double spans_rate = spans / elapsed;

    std::string eta = "--:--";
    if (upload_total) {
        eta = format_eta(std::min(state.items_done, *upload_total), *upload_total, spans_rate);
    } else if (state.scope == to_string(Scope::Traces) && state.limit) {
        size_t total_traces = std::max(saturating_sub(*state.limit, base.roots_done), traces);
        eta = format_eta(traces, total_traces, traces_rate);
    }
    return render(state.distinct_roots_done, traces_rate, state.items_done, spans_rate,
                  state.bytes_sent, bytes / elapsed, eta);
}

std::string progress_status_line(bool show_checkpoint_hint,
                                 const std::optional<std::string>& retry_summary) {
    std::string line;
    if (show_checkpoint_hint) {
        line = "Ctrl+C checkpoints; rerun same command to resume (--fresh restarts).";
    }
    if (retry_summary && !retry_summary->empty()) {
        if (!line.empty()) line += "  ";
        line += *retry_summary;
    }
    return line;
}
