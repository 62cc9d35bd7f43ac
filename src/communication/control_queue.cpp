#include "control_queue.hpp"

std::string toString(ControlSignal signal)
{
    switch (signal)
    {
    case ControlSignal::StartScanning:
        return "start";
    case ControlSignal::StopScanning:
        return "stop";
    case ControlSignal::ShowOverlay:
        return "show";
    case ControlSignal::HideOverlay:
        return "hide";
    case ControlSignal::Terminate:
        return "terminate";
    }
    return "unknown";
}

void ControlQueue::push(ControlSignal signal)
{
    std::lock_guard<std::mutex> lock(mutex_);
    queue_.push(signal);
    condition_.notify_one();
}

bool ControlQueue::tryPop(ControlSignal &signal)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
        return false;
    signal = queue_.front();
    queue_.pop();
    return true;
}

bool ControlQueue::pop(ControlSignal &signal, int timeout_ms)
{
    std::unique_lock<std::mutex> lock(mutex_);

    if (condition_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this]
                            { return !queue_.empty(); }))
    {
        signal = queue_.front();
        queue_.pop();
        return true;
    }
    return false;
}

size_t ControlQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}
