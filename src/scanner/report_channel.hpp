#pragma once
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include "scan_report.hpp"

// Scan loop -> foreground hand-off. One producer, one consumer, whole reports
// only. Bounded: when the consumer falls behind the oldest report is dropped.
class ReportChannel
{
public:
    explicit ReportChannel(size_t capacity = 32);

    // Returns false if an old report had to be dropped to make room
    bool push(ScanReport report);

    // Non-blocking; false means "no update yet"
    bool tryPop(ScanReport &report);

    // Blocks up to timeout_ms for a report
    bool pop(ScanReport &report, int timeout_ms = 100);

    size_t size() const;
    size_t capacity() const { return capacity_; }
    size_t dropped() const;

private:
    const size_t capacity_;
    mutable std::mutex mutex_;
    std::condition_variable condition_;
    std::deque<ScanReport> queue_;
    size_t dropped_ = 0;
};
