#include "app/ShutdownSignal.hpp"

#include <atomic>
#include <csignal>
#include <thread>

namespace logicchat::app {

namespace {

std::atomic<bool> g_shutdownRequested{false};
static_assert(std::atomic<bool>::is_always_lock_free, "signal handler needs a lock-free flag");

void OnShutdownSignal(int) {
    g_shutdownRequested.store(true);
}

} // namespace

void InstallShutdownHandlers() {
    std::signal(SIGINT, OnShutdownSignal);
    std::signal(SIGTERM, OnShutdownSignal);
}

void RequestShutdown() {
    g_shutdownRequested.store(true);
}

bool ShutdownRequested() {
    return g_shutdownRequested.load();
}

void ResetShutdown() {
    g_shutdownRequested.store(false);
}

void WaitForShutdown(std::chrono::milliseconds pollInterval) {
    while (!g_shutdownRequested.load()) {
        std::this_thread::sleep_for(pollInterval);
    }
}

} // namespace logicchat::app
