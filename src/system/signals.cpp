// signals.cpp - Signal handling and shared cancel flag.

#include "selfupdate/system/signals.hpp"

#include <csignal>
#include <thread>

namespace selfupdate {

std::atomic_bool g_cancel{false};

static void HandleSignal(int) {
    g_cancel.store(true, std::memory_order_relaxed);
}

void InstallSignalHandlers() {
    struct sigaction sa{};
    sa.sa_handler = HandleSignal;
    sigemptyset(&sa.sa_mask);
    ::sigaction(SIGINT, &sa, nullptr);
    ::sigaction(SIGTERM, &sa, nullptr);
}

bool WaitForCancel(std::chrono::milliseconds timeout) {
    using namespace std::chrono;
    const auto deadline = steady_clock::now() + timeout;
    while (!g_cancel.load(std::memory_order_relaxed)) {
        const auto now = steady_clock::now();
        if (now >= deadline) return false;
        std::this_thread::sleep_for(std::min<steady_clock::duration>(milliseconds(200), deadline - now));
    }
    return true;
}

} // namespace selfupdate
