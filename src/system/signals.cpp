// signals.cpp - SIGINT/SIGTERM turn into a cooperative cancel request.

#include "diagpack/system/signals.hpp"

#include <csignal>
#include <unistd.h>

namespace diagpack {

std::atomic_bool g_cancel{false};
std::atomic_int g_cancel_signal{0};

static void HandleSignal(int sig) {
    if (g_cancel.exchange(true, std::memory_order_relaxed)) {
        // Already cancelling and still not done: give up immediately.
        ::_exit(128 + sig);
    }
    g_cancel_signal.store(sig, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    sa.sa_flags = SA_RESTART;
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
}

} // namespace diagpack
