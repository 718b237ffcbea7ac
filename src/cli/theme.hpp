#pragma once

#include <string>
#include <fmt/format.h>

#ifndef TRACESYNC_VERSION
#define TRACESYNC_VERSION "0.1.0"
#endif

namespace theme {

// ANSI palette. Blue #3E78B2 for names, brown #80633A for headings.
namespace color {
    const std::string BLUE      = "\033[38;2;62;120;178m";
    const std::string BROWN     = "\033[38;2;128;99;58m";
    const std::string RED       = "\033[91m";
    const std::string GREEN     = "\033[92m";
    const std::string YELLOW    = "\033[93m";
    const std::string BOLD      = "\033[1m";
    const std::string DIM       = "\033[2m";
    const std::string RESET     = "\033[0m";
}

inline std::string dim(const std::string& s) { return color::DIM + s + color::RESET; }

// Usage screen header
inline std::string banner() {
    std::string line;
    for (int i = 0; i < 40; i++) line += "\xe2\x94\x80";
    return "\n" + color::BLUE + color::BOLD + "  tracesync" + color::RESET
        + color::DIM + "  v" TRACESYNC_VERSION "\n"
        + "  Resumable trace and span sync\n\n"
        + "  " + line + color::RESET + "\n";
}

inline std::string section(const std::string& title) {
    return "\n" + color::BROWN + color::BOLD + "  " + title + color::RESET + "\n\n";
}

// ── Result lines ────────────────────────────────────────────

inline std::string ok(const std::string& msg) {
    return color::GREEN + "    + " + color::RESET + msg + "\n";
}

inline std::string fail(const std::string& msg) {
    return color::RED + "    x " + color::RESET + msg + "\n";
}

inline std::string warn(const std::string& msg) {
    return color::YELLOW + "    ! " + color::RESET + msg + "\n";
}

// Follow-up hint under a result
inline std::string step(const std::string& msg) {
    return color::BROWN + "    > " + color::RESET + msg + "\n";
}

// Aligned "key  value" row of a result panel
inline std::string kv(const std::string& key, const std::string& value) {
    return color::DIM + fmt::format("    {:<10}", key) + color::RESET + value + "\n";
}

} // namespace theme
