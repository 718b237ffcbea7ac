#include "utils.hpp"
#include <fmt/format.h>
#include <chrono>
#include <limits>

uint64_t epoch_seconds() {
    auto now = std::chrono::system_clock::now();
    auto secs = std::chrono::duration_cast<std::chrono::seconds>(now.time_since_epoch());
    return secs.count() < 0 ? 0 : static_cast<uint64_t>(secs.count());
}

std::optional<size_t> parse_size(const std::string& s) {
    if (s.empty()) return std::nullopt;

    size_t value = 0;
    for (char c : s) {
        if (c < '0' || c > '9') return std::nullopt;
        size_t digit = static_cast<size_t>(c - '0');
        if (value > (std::numeric_limits<size_t>::max() - digit) / 10) {
            return std::nullopt;
        }
        value = value * 10 + digit;
    }
    return value;
}

std::optional<std::string> trim_optional(const std::optional<std::string>& value) {
    if (!value) return std::nullopt;
    std::string s = *value;
    trim(s);
    if (s.empty()) return std::nullopt;
    return s;
}

std::string format_commas(uint64_t value) {
    std::string digits = std::to_string(value);
    std::string out;
    out.reserve(digits.size() + digits.size() / 3);

    for (size_t i = 0; i < digits.size(); ++i) {
        if (i > 0 && (digits.size() - i) % 3 == 0) out += ',';
        out += digits[i];
    }
    return out;
}

std::string format_bytes(double bytes) {
    static const char* UNITS[] = {"B", "KB", "MB", "GB", "TB", "PB"};
    constexpr size_t UNIT_COUNT = sizeof(UNITS) / sizeof(UNITS[0]);

    double value = bytes < 0.0 ? 0.0 : bytes;
    size_t unit = 0;
    while (value >= 1024.0 && unit < UNIT_COUNT - 1) {
        value /= 1024.0;
        ++unit;
    }
    return fmt::format("{:.2f} {}", value, UNITS[unit]);
}
