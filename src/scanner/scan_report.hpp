#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>
#include "price/price_source.hpp"

struct RecognizedItem
{
    std::string id;
    std::string name;
    std::string short_name;
    double confidence = 0.0;
    std::optional<PriceRecord> price; // Absent when no source knows the item
    int row = 0;                      // Slot grid coordinate
    int col = 0;
    cv::Point origin;                 // Slot top-left in frame pixels
};

// Everything one scan cycle produced. Either an item list (possibly empty,
// e.g. inventory closed) or an error marker.
struct ScanReport
{
    uint64_t cycle = 0;
    std::chrono::system_clock::time_point timestamp;
    bool inventory_found = false;
    int slots_total = 0;
    int slots_occupied = 0;
    std::vector<RecognizedItem> items;
    std::optional<std::string> error;

    bool hasError() const { return error.has_value(); }

    // Sum of the known prices
    int64_t totalValue() const;

    std::string toJson() const;

    static ScanReport failure(uint64_t cycle, const std::string &message);
};
