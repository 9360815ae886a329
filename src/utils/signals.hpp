#pragma once
#include <atomic>
#include <chrono>
#include <csignal>
#include <functional>
#include <thread>
#include "logging.hpp"

namespace signals
{
    // Set from the handler, polled by the main thread
    inline std::atomic<bool> shutdownRequested{false};
    inline std::atomic<int> lastSignal{0};

    inline void signalHandler(int signal)
    {
        lastSignal = signal;
        shutdownRequested = true;
    }

    // Register SIGINT/SIGTERM; the main loop calls waitForShutdown()
    inline void setupSignalHandlers()
    {
        shutdownRequested = false;
        signal(SIGINT, signalHandler);
        signal(SIGTERM, signalHandler);
        log_info("Signal handlers registered for graceful shutdown");
    }

    // Block the calling thread until a signal arrives, then run the callback
    inline void waitForShutdown(const std::function<void()> &callback, int poll_ms = 100)
    {
        while (!shutdownRequested)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(poll_ms));
        }

        log_warning("Received signal " + std::to_string(lastSignal.load()) + ", shutting down...");

        if (callback)
        {
            callback();
        }
    }

} // namespace signals
