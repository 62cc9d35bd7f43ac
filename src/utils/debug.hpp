#pragma once
#include <cstdlib>
#include <filesystem>
#include <iostream>
#include <string>
#include "config.hpp"
#include "logging.hpp"

namespace debug
{

    // Directory for debug images and the debug log
    inline const std::string DEBUG_DIR = "debug_frames";

    // Print application startup banner
    inline void printStartup(const std::string &appName, const std::string &version)
    {
        std::cout << "=====================================\n";
        std::cout << "  " << appName << " v" << version << " starting...\n";
        std::cout << "=====================================\n";
    }

    // Print configuration details
    inline void printConfig(const ScannerConfig &cfg)
    {
        std::cout << "Configuration:\n";
        std::cout << "  - Display: " << (cfg.display_name.empty() ? "$DISPLAY" : cfg.display_name) << "\n";
        if (cfg.region_width > 0 && cfg.region_height > 0)
            std::cout << "  - Region: " << cfg.region_width << "x" << cfg.region_height
                      << " at " << cfg.region_x << "," << cfg.region_y << "\n";
        else
            std::cout << "  - Region: full screen\n";
        std::cout << "  - Templates: " << cfg.templates_dir << "\n";
        std::cout << "  - Threshold: " << cfg.confidence_threshold << "\n";
        std::cout << "  - Interval: " << cfg.scan_interval_ms << " ms\n";
        std::cout << "  - Catalog: " << (cfg.catalog_url.empty() ? "offline" : cfg.catalog_url) << "\n";
        std::cout << "  - Price cache: " << cfg.price_cache_file << "\n";
        if (cfg.control_port > 0)
            std::cout << "  - Control: http://127.0.0.1:" << cfg.control_port << "\n";
        else
            std::cout << "  - Control: disabled\n";
        std::cout << "-------------------------------------" << std::endl;
    }

    // Print version information and exit
    inline void printVersionAndExit(const std::string &version)
    {
        std::cout << "StashScan version: " << version << std::endl;
        std::exit(0);
    }

    // Print help message and exit
    inline void printHelpAndExit()
    {
        std::cout << "Usage: stashscan [options]\n";
        std::cout << "Options:\n";
        std::cout << "  --config <path>        JSON configuration file\n";
        std::cout << "  --templates <dir>      Item template directory (default: data/items)\n";
        std::cout << "  --interval <seconds>   Pause between scans (default: 1)\n";
        std::cout << "  --threshold <0..1>     Minimum match confidence (default: 0.8)\n";
        std::cout << "  --region <x,y,w,h>     Capture this screen area instead of the whole screen\n";
        std::cout << "  --display <name>       X display to capture (default: $DISPLAY)\n";
        std::cout << "  --catalog-url <url>    Price catalog base URL, empty for offline (default: https://api.tarkov.dev)\n";
        std::cout << "  --price-cache <path>   Price cache file (default: data/cache/price_cache.json)\n";
        std::cout << "  --port <port>          Control service port, 0 to disable (default: 13521)\n";
        std::cout << "  --autostart            Start scanning right away\n";
        std::cout << "  --log-file <path>      Also write the log to this file\n";
        std::cout << "  --debug, -d            Enable debug mode (saves frames to debug_frames/ directory)\n";
        std::cout << "  --quiet, -q            Quiet mode (only show errors)\n";
        std::cout << "  --version              Show version information\n";
        std::cout << "  --help                 Show this help message\n";
        std::exit(0);
    }

    // Create debug_frames/<module> (or debug_frames itself) and return its path
    inline std::string ensureDebugDir(const std::string &module = "")
    {
        std::string path = module.empty() ? DEBUG_DIR : DEBUG_DIR + "/" + module;
        std::error_code ec;
        std::filesystem::create_directories(path, ec);
        if (ec)
            log_warning("Cannot create " + path + ": " + ec.message());
        return path;
    }

} // namespace debug
