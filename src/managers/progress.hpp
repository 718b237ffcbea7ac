#pragma once

#include <string>
#include <optional>
#include <cstdint>
#include "sync_types.hpp"

// Counters at the start of the current run; rates only count work done since.
struct ProgressBaseline {
    uint64_t started_at = 0;
    size_t roots_done = 0;
    size_t items_done = 0;
    uint64_t bytes_done = 0;
};

// "12 traces (0.40/s) | 1,024 spans (34.13/s) | 1.20 MB (40.96 KB/s) | ETA 00:12"
std::string pull_spans_progress_message(const PullState& state, const ProgressBaseline& base);

std::string pull_trace_progress_message(const PullState& state, const ProgressBaseline& base,
                                        size_t trace_progress_done);

// upload_total: span rows expected for spans/all scope, nullopt for traces scope.
std::string push_progress_message(const PushState& state, const ProgressBaseline& base,
                                  std::optional<size_t> upload_total);

// Second line under the progress line: checkpoint hint and retry summary.
std::string progress_status_line(bool show_checkpoint_hint,
                                 const std::optional<std::string>& retry_summary);
