#include "time_utils.hpp"
#include "utils.hpp"
#include <fmt/format.h>
#include <cmath>

std::string format_duration(uint64_t total_secs) {
    uint64_t hours = total_secs / 3600;
    uint64_t mins = (total_secs % 3600) / 60;
    uint64_t secs = total_secs % 60;

    if (hours > 0) {
        return fmt::format("{:02}:{:02}:{:02}", hours, mins, secs);
    }
    return fmt::format("{:02}:{:02}", mins, secs);
}

std::string format_eta(uint64_t done, uint64_t total, double rate_per_sec) {
    if (done >= total) return "00:00";
    if (rate_per_sec <= 0.0) return "--:--";

    uint64_t remaining = total - done;
    auto eta_secs = static_cast<uint64_t>(std::ceil(static_cast<double>(remaining) / rate_per_sec));
    return format_duration(eta_secs);
}

double elapsed_seconds(uint64_t started_at) {
    uint64_t now = epoch_seconds();
    uint64_t elapsed = now > started_at ? now - started_at : 0;
    if (elapsed < 1) elapsed = 1;
    return static_cast<double>(elapsed);
}
