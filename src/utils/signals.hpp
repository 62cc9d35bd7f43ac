#pragma once
#include <atomic>
#include <csignal>
#include <cstdlib>
#include "logging.hpp"

namespace signals
{

    // Set by the handler, polled by the foreground loop
    inline std::atomic<int> lastSignal{0};

    inline void signalHandler(int signal)
    {
        // Second signal while shutting down: give up waiting
        if (lastSignal.exchange(signal) != 0)
        {
            std::_Exit(128 + signal);
        }
    }

    inline void setupSignalHandlers()
    {
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);
        log_info("Signal handlers registered for graceful shutdown");
    }

    inline int receivedSignal()
    {
        return lastSignal.load();
    }

} // namespace signals
