#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include "scanner/scan_report.hpp"

// Presentation side of the scanner. Keeps the latest report and whether it
// should be shown. Updated from the foreground loop, read by HTTP handlers.
class PriceOverlay
{
public:
    void show();
    void hide();
    bool visible() const;

    // Error reports only bump the error counter, the last item list stays up
    void update(const ScanReport &report);
    void clear();

    int64_t totalValue() const;
    uint64_t errorCount() const;
    std::optional<ScanReport> latest() const;

    // Item table for the console, empty when hidden
    std::string render() const;

    // {"visible", "total", "errors", "report"}
    std::string toJson() const;

private:
    mutable std::mutex mutex_;
    bool visible_ = false;
    std::optional<ScanReport> latest_;
    std::optional<std::string> last_error_;
    uint64_t errors_ = 0;
};
