#pragma once

#include <string>
#include <map>
#include <mutex>
#include <atomic>
#include <optional>
#include <algorithm>
#include <stdexcept>
#include <core/constants.hpp>
#include <fmt/format.h>
#include "remote_client.hpp"

// Bounded exponential backoff. Delay before retry n (1-based) is
// base * multiplier^(n-1), jittered by +/- jitter, capped at max_delay_ms.
struct RetryPolicy {
    int max_attempts = QUERY_MAX_ATTEMPTS;
    int base_delay_ms = QUERY_RETRY_BASE_DELAY_MS;
    double multiplier = QUERY_BACKOFF_MULTIPLIER;
    double jitter = QUERY_BACKOFF_JITTER;
    int max_delay_ms = QUERY_MAX_BACKOFF_MS;

    int delay_ms(int retry_number, double unit_random) const;
};

// Counts retries by kind ("503", "413", "network"). Shared by all workers.
class RetryTracker {
public:
    explicit RetryTracker(std::string label = "query retries") : label_(std::move(label)) {}

    void record_status(int status);
    void record_network();

    size_t total() const { return total_.load(); }

    // "query retries: 3 (HTTP 503)" or
    // "query retries: 4 total (HTTP 503 2, network 1, HTTP 413 1)"
    std::optional<std::string> summary_line() const;

private:
    void record(const std::string& kind);

    std::string label_;
    std::atomic<size_t> total_{0};
    mutable std::mutex mutex_;
    std::map<std::string, size_t> counts_;
};

// Records the failure, logs it and sleeps for the backoff before retry
// number `attempt`.
void backoff_after_failure(const RetryPolicy& policy, RetryTracker* tracker,
                           const std::string& what, int attempt, const RemoteError& e);

// Calls fn until it returns. Retryable RemoteErrors are retried up to
// policy.max_attempts; anything else, or the last failure, becomes
// std::runtime_error("<what> failed after N attempt(s): <error><context>").
template <typename Fn>
auto run_with_retries(const RetryPolicy& policy, RetryTracker* tracker,
                      const std::string& what, const std::string& context, Fn&& fn)
    -> decltype(fn()) {
    int max_attempts = std::max(1, policy.max_attempts);
    for (int attempt = 1; ; attempt++) {
        try {
            return fn();
        } catch (const RemoteError& e) {
            if (!e.retryable() || attempt >= max_attempts) {
                throw std::runtime_error(fmt::format("{} failed after {} attempt(s): {}{}",
                                                     what, attempt, e.what(), context));
            }
            backoff_after_failure(policy, tracker, what, attempt, e);
        }
    }
}

// Runs queries through a QueryClient, retrying transient failures.
class QueryExecutor {
public:
    explicit QueryExecutor(QueryClient& client, RetryPolicy policy = {},
                           RetryTracker* tracker = nullptr);

    // Throws std::runtime_error naming the attempt count and the query once
    // a permanent error occurs or attempts run out.
    QueryResponse run(const std::string& query);

private:
    QueryClient& client_;
    RetryPolicy policy_;
    RetryTracker* tracker_;
};
