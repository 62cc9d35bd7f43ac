#pragma once

#include <opencv2/core.hpp>
#include <optional>

namespace region_locator
{
    // Tuned for the stock inventory theme, not a general detector
    struct LocatorParams
    {
        int darkThreshold = 50;      // Gray levels at or below this count as inventory background
        int minWidth = 400;          // Strictly greater than
        int minHeight = 400;         // Strictly greater than
        double minAspectRatio = 0.8; // width / height, exclusive
        double maxAspectRatio = 1.5; // width / height, exclusive
    };

    // Bounding box of the inventory grid, or nullopt.
    // Scans the dark blobs in contour order and returns the FIRST one of the
    // right size and shape, not the best one, so any large dark rectangle on
    // screen can win. Callers treat nullopt as "inventory not open".
    std::optional<cv::Rect> locate(
        const cv::Mat &frame,
        bool debug_mode = false,
        const LocatorParams &params = LocatorParams());

    // Size and shape test applied to every candidate rectangle
    bool isInventoryCandidate(const cv::Rect &rect, const LocatorParams &params = LocatorParams());

} // namespace region_locator
