#include "query_executor.hpp"
#include <core/utils.hpp>
#include <platform/platform.hpp>
#include <managers/sync_log.hpp>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <algorithm>
#include <vector>
#include <random>
#include <cmath>
#include <cctype>
#include <stdexcept>

// ── RetryPolicy ─────────────────────────────────────────────

int RetryPolicy::delay_ms(int retry_number, double unit_random) const {
    double delay = base_delay_ms * std::pow(multiplier, std::max(0, retry_number - 1));
    delay = std::min(delay, static_cast<double>(max_delay_ms));
    double factor = 1.0 + jitter * (2.0 * unit_random - 1.0);
    delay = std::min(delay * factor, static_cast<double>(max_delay_ms));
    return std::max(0, static_cast<int>(delay));
}

// ── RetryTracker ────────────────────────────────────────────

static std::string retry_kind_label(const std::string& kind) {
    if (kind == "network") return kind;
    bool digits = !kind.empty() &&
        std::all_of(kind.begin(), kind.end(), [](unsigned char c) { return std::isdigit(c); });
    return digits ? "HTTP " + kind : kind;
}

void RetryTracker::record_status(int status) {
    record(std::to_string(status));
}

void RetryTracker::record_network() {
    record("network");
}

void RetryTracker::record(const std::string& kind) {
    total_.fetch_add(1);
    std::lock_guard<std::mutex> lock(mutex_);
    counts_[kind]++;
}

std::optional<std::string> RetryTracker::summary_line() const {
    size_t total = total_.load();
    if (total == 0) return std::nullopt;

    std::vector<std::pair<std::string, size_t>> entries;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries.assign(counts_.begin(), counts_.end());
    }
    std::sort(entries.begin(), entries.end(), [](const auto& a, const auto& b) {
        if (a.second != b.second) return a.second > b.second;
        return a.first < b.first;
    });

    if (entries.size() == 1) {
        return fmt::format("{}: {} ({})", label_, format_commas(entries[0].second),
                           retry_kind_label(entries[0].first));
    }

    std::vector<std::string> detail;
    for (size_t i = 0; i < entries.size() && i < 3; i++) {
        detail.push_back(fmt::format("{} {}", retry_kind_label(entries[i].first),
                                     format_commas(entries[i].second)));
    }
    return fmt::format("{}: {} total ({})", label_, format_commas(total),
                       fmt::join(detail, ", "));
}

// ── Retry loop ──────────────────────────────────────────────

void backoff_after_failure(const RetryPolicy& policy, RetryTracker* tracker,
                           const std::string& what, int attempt, const RemoteError& e) {
    thread_local std::mt19937 rng{std::random_device{}()};
    std::uniform_real_distribution<double> unit(0.0, 1.0);

    if (tracker) {
        if (e.kind() == RemoteError::Kind::Network) tracker->record_network();
        else tracker->record_status(e.status());
    }
    int delay = policy.delay_ms(attempt, unit(rng));
    sync_log(fmt::format("{} retry {}/{} in {}ms: {}",
                         what, attempt, std::max(1, policy.max_attempts), delay, e.what()));
    if (delay > 0) platform::sleep_ms(delay);
}

// ── QueryExecutor ───────────────────────────────────────────

QueryExecutor::QueryExecutor(QueryClient& client, RetryPolicy policy, RetryTracker* tracker)
    : client_(client), policy_(policy), tracker_(tracker) {}

QueryResponse QueryExecutor::run(const std::string& query) {
    return run_with_retries(policy_, tracker_, "query", "\nquery: " + query,
                            [&] { return client_.execute_query(query); });
}
