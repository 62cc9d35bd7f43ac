#pragma once

#include <chrono>
#include <string>
#include <vector>

// Every tuned constant of the scanner in one place. The defaults match the
// stock inventory theme; the detection thresholds are empirical and only hold
// for that theme.
struct ScannerConfig
{
    // Capture
    std::string display_name = ""; // Empty = $DISPLAY
    int region_x = 0;              // Capture region override, width/height 0 = whole screen
    int region_y = 0;
    int region_width = 0;
    int region_height = 0;

    // Region locator
    int dark_threshold = 50;
    int min_region_width = 400;
    int min_region_height = 400;
    double min_aspect_ratio = 0.8;
    double max_aspect_ratio = 1.5;

    // Slot segmenter
    int slot_size = 63;
    double empty_mean_min = 40.0;
    double empty_mean_max = 80.0;
    double empty_variance_max = 100.0;

    // Item matcher
    std::string templates_dir = "data/items";
    double confidence_threshold = 0.8;

    // Prices
    std::string catalog_url = "https://api.tarkov.dev";
    std::string catalog_cache_file = "data/cache/all_items.json";
    std::string price_cache_file = "data/cache/price_cache.json";
    double price_cache_hours = 6.0;
    int request_timeout_s = 10;
    int request_attempts = 3;

    // Scheduling
    int scan_interval_ms = 1000;
    int poll_interval_ms = 100;
    int shutdown_grace_ms = 2000;
    int report_queue_capacity = 32;

    // Control surface
    int control_port = 13521;
    bool autostart = false;

    // Diagnostics
    bool debug = false;
    bool quiet = false;
    std::string log_file = "";
};

namespace config
{
    // Merge a JSON file into cfg. Unknown keys are ignored, keys with a wrong
    // type are reported and skipped. Returns false if the file cannot be read
    // or parsed (cfg is left untouched in that case).
    bool loadFile(const std::string &path, ScannerConfig &cfg);

    // Apply command line overrides on top of cfg
    void applyArgs(int argc, char **argv, ScannerConfig &cfg);

    // Checks ranges, logs every problem. Returns false if any value is unusable.
    bool validate(const ScannerConfig &cfg);

    // price_cache_hours as a duration, rounded to whole seconds and never zero
    std::chrono::seconds priceCacheDuration(const ScannerConfig &cfg);

    // Parse "x,y,w,h"
    bool parseRegion(const std::string &text, ScannerConfig &cfg);

    std::string toJson(const ScannerConfig &cfg);

} // namespace config
