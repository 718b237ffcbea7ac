#include "interrupt.hpp"
#include <csignal>
#include <stdexcept>

// std::signal handlers can only reach lock-free atomics with static storage.
static std::atomic<CancelToken*> g_active_token{nullptr};

extern "C" void tracesync_on_sigint(int) {
    CancelToken* token = g_active_token.load();
    if (token) token->cancel();
}

ScopedInterruptHandler::ScopedInterruptHandler(CancelToken& token) {
    CancelToken* expected = nullptr;
    if (!g_active_token.compare_exchange_strong(expected, &token)) {
        throw std::logic_error("an interrupt handler is already installed");
    }
    previous_ = std::signal(SIGINT, tracesync_on_sigint);
    if (previous_ == SIG_ERR) previous_ = SIG_DFL;
}

ScopedInterruptHandler::~ScopedInterruptHandler() {
    std::signal(SIGINT, previous_);
    g_active_token.store(nullptr);
}
