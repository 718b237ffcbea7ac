#pragma once

#include <string>
#include <cstdint>

// Format a span of seconds as "MM:SS", or "HH:MM:SS" once it reaches an hour.
std::string format_duration(uint64_t total_secs);

// Remaining time at the given rate. "00:00" when nothing remains,
// "--:--" when the rate is unknown (zero or negative).
std::string format_eta(uint64_t done, uint64_t total, double rate_per_sec);

// Seconds elapsed since started_at (epoch seconds), never less than 1 so it
// can be used as a rate denominator.
double elapsed_seconds(uint64_t started_at);
