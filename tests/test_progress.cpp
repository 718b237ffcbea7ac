#include <gtest/gtest.h>
#include <managers/progress.hpp>
#include <core/utils.hpp>

// A start time in the future clamps elapsed time to one second.
static ProgressBaseline baseline_now() {
    return {epoch_seconds() + 3600, 0, 0, 0};
}

TEST(Progress, PullSpansMessage) {
    PullState state;
    state.root_ids = {"r1", "r2"};
    state.items_done = 10;
    state.limit = 10;
    state.bytes_written = 2048;
    EXPECT_EQ(pull_spans_progress_message(state, baseline_now()),
              "2 traces (2.00/s) | 10 spans (10.00/s) | 2.00 KB (2.00 KB/s) | ETA 00:00");
}

TEST(Progress, PullTraceMessageEta) {
    PullState state;
    state.limit = 10;
    state.items_done = 40;
    state.bytes_written = 100;
    EXPECT_EQ(pull_trace_progress_message(state, baseline_now(), 4),
              "4 traces (4.00/s) | 40 spans (40.00/s) | 100.00 B (100.00 B/s) | ETA 00:02");
}

TEST(Progress, PushMessageWithoutTotal) {
    PushState state;
    state.scope = "all";
    state.items_done = 1500;
    state.distinct_roots_done = 3;
    EXPECT_EQ(push_progress_message(state, baseline_now(), std::nullopt),
              "3 traces (3.00/s) | 1,500 spans (1500.00/s) | 0.00 B (0.00 B/s) | ETA --:--");
}

TEST(Progress, PushMessageWithTotal) {
    PushState state;
    state.scope = "spans";
    state.items_done = 5;
    std::string msg = push_progress_message(state, baseline_now(), size_t{10});
    EXPECT_NE(msg.find("ETA 00:01"), std::string::npos);
}

TEST(Progress, StatusLine) {
    EXPECT_EQ(progress_status_line(false, std::nullopt), "");
    EXPECT_EQ(progress_status_line(false, std::string("query retries: 1 (HTTP 503)")),
              "query retries: 1 (HTTP 503)");
    std::string both = progress_status_line(true, std::string("query retries: 1 (HTTP 503)"));
    EXPECT_EQ(both.find("Ctrl+C checkpoints"), 0u);
    EXPECT_NE(both.find("  query retries"), std::string::npos);
}
