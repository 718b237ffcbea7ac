#pragma once

#include <string>
#include <mutex>

// Live two-line progress display on stderr: the progress message and a dim
// status line beneath it. Draws nothing unless enabled; clear() erases both
// lines before final output is printed.
class ProgressLine {
public:
    explicit ProgressLine(bool enabled) : enabled_(enabled) {}
    ~ProgressLine() { clear(); }

    ProgressLine(const ProgressLine&) = delete;
    ProgressLine& operator=(const ProgressLine&) = delete;

    bool enabled() const { return enabled_; }

    void update(const std::string& message, const std::string& status = "");
    void clear();

private:
    bool enabled_;
    int lines_ = 0;
    std::mutex mutex_;
};
