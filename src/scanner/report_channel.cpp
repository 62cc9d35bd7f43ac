#include "report_channel.hpp"
#include "utils/logging.hpp"

ReportChannel::ReportChannel(size_t capacity) : capacity_(capacity > 0 ? capacity : 1)
{
}

bool ReportChannel::push(ScanReport report)
{
    bool kept_all = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (queue_.size() >= capacity_)
        {
            queue_.pop_front();
            dropped_++;
            kept_all = false;
        }
        queue_.push_back(std::move(report));
    }
    condition_.notify_one();

    if (!kept_all)
        log_debug("Report channel full, dropped oldest report");
    return kept_all;
}

bool ReportChannel::tryPop(ScanReport &report)
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty())
        return false;

    report = std::move(queue_.front());
    queue_.pop_front();
    return true;
}

bool ReportChannel::pop(ScanReport &report, int timeout_ms)
{
    std::unique_lock<std::mutex> lock(mutex_);

    if (condition_.wait_for(lock, std::chrono::milliseconds(timeout_ms),
                            [this]
                            { return !queue_.empty(); }))
    {
        report = std::move(queue_.front());
        queue_.pop_front();
        return true;
    }
    return false;
}

size_t ReportChannel::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t ReportChannel::dropped() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_;
}
