#pragma once

#include <atomic>

// Cooperative cancellation flag handed to the sync engines. Engines poll it
// at page / row granularity; nothing is ever aborted mid-request.
class CancelToken {
public:
    CancelToken() = default;
    CancelToken(const CancelToken&) = delete;
    CancelToken& operator=(const CancelToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_release); }
    bool cancelled() const { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

// RAII SIGINT hook. While alive, Ctrl+C trips the given token instead of
// killing the process; the previous handler is restored on destruction.
// Only one may be active at a time.
class ScopedInterruptHandler {
public:
    explicit ScopedInterruptHandler(CancelToken& token);
    ~ScopedInterruptHandler();

    ScopedInterruptHandler(const ScopedInterruptHandler&) = delete;
    ScopedInterruptHandler& operator=(const ScopedInterruptHandler&) = delete;

private:
    void (*previous_)(int) = nullptr;
};
