#pragma once

#include <opencv2/core.hpp>
#include <vector>

namespace slot_segmenter
{
    // Slot geometry and the "empty slot" look of the stock theme.
    // Fixed thresholds, no adaptation: same input, same answer.
    struct SegmentParams
    {
        int slotSize = 63;                // Square slot edge in pixels
        double emptyMeanMin = 40.0;       // Every channel mean must be above...
        double emptyMeanMax = 80.0;       // ...and below these (exclusive)
        double emptyVarianceMax = 100.0;  // Every channel variance must be below this
    };

    struct Slot
    {
        cv::Mat image;  // slotSize x slotSize view into the frame
        int row = 0;    // Grid coordinate
        int col = 0;
        cv::Point origin; // Top-left pixel in the frame
        bool empty = false;
    };

    // Row-major grid of floor(w/size) x floor(h/size) slots starting at the
    // region's top-left corner. Right and bottom remainders are dropped.
    // Returns nothing if the region is not inside the frame.
    std::vector<Slot> segment(
        const cv::Mat &frame,
        const cv::Rect &region,
        const SegmentParams &params = SegmentParams());

    // Uniform gray: all channel means in (emptyMeanMin, emptyMeanMax) and
    // all channel variances below emptyVarianceMax
    bool isEmpty(const cv::Mat &slot_image, const SegmentParams &params = SegmentParams());

} // namespace slot_segmenter
