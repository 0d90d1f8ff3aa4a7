#include "ShutdownSignal.hpp"
#include <atomic>
#include <csignal>

namespace {

std::atomic<bool> g_shutdown{false};

void signalHandler(int) {
    g_shutdown.store(true);
}

}

void installShutdownHandlers() {
    std::signal(SIGINT, signalHandler);
    std::signal(SIGTERM, signalHandler);
    std::signal(SIGHUP, signalHandler);
}

bool shutdownRequested() { return g_shutdown.load(); }
void requestShutdown() { g_shutdown.store(true); }
void clearShutdownRequest() { g_shutdown.store(false); }
