#pragma once

#include <string>
#include <optional>
#include <cstdint>

// Seconds since the Unix epoch.
uint64_t epoch_seconds();

// Parse a non-negative decimal integer. Returns nullopt on any trailing garbage,
// sign, or overflow.
std::optional<size_t> parse_size(const std::string& s);

// Trim leading and trailing whitespace in-place.
inline void trim(std::string& s) {
    auto start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) { s.clear(); return; }
    s.erase(0, start);
    s.erase(s.find_last_not_of(" \t\r\n") + 1);
}

// Trimmed copy, or nullopt if the value is missing or blank.
std::optional<std::string> trim_optional(const std::optional<std::string>& value);

// "1234567" -> "1,234,567"
std::string format_commas(uint64_t value);

// Human-readable byte size with two decimals: "12.00 KB", "3.50 GB".
std::string format_bytes(double bytes);
