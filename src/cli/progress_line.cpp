#include "progress_line.hpp"
#include "theme.hpp"
#include <iostream>

void ProgressLine::update(const std::string& message, const std::string& status) {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);

    std::string out;
    if (lines_ == 2) out += "\033[1A";
    out += "\r\033[K  " + message;
    if (!status.empty()) {
        out += "\n\r\033[K" + theme::dim("  " + status);
        lines_ = 2;
    } else {
        lines_ = 1;
    }
    std::cerr << out << std::flush;
}

void ProgressLine::clear() {
    if (!enabled_) return;
    std::lock_guard<std::mutex> lock(mutex_);
    if (lines_ == 0) return;

    std::string out = "\r\033[K";
    if (lines_ == 2) out += "\033[1A\r\033[K";
    lines_ = 0;
    std::cerr << out << std::flush;
}
