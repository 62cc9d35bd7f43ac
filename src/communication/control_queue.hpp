#pragma once
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>

enum class ControlSignal
{
    StartScanning,
    StopScanning,
    ShowOverlay,
    HideOverlay,
    Terminate
};

std::string toString(ControlSignal signal);

// Signals raised on HTTP threads, handed to the foreground loop. Not for use
// inside a POSIX signal handler (it locks).
class ControlQueue
{
public:
    void push(ControlSignal signal);
    bool tryPop(ControlSignal &signal);
    bool pop(ControlSignal &signal, int timeout_ms = 100);
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::queue<ControlSignal> queue_;
};
