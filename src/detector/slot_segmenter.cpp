#include "slot_segmenter.hpp"
#include "utils/logging.hpp"

using namespace cv;
using namespace std;

namespace slot_segmenter
{
    bool isEmpty(const Mat &slot_image, const SegmentParams &params)
    {
        if (slot_image.empty())
            return false;

        // Population statistics per channel
        Scalar mean, stddev;
        meanStdDev(slot_image, mean, stddev);

        for (int c = 0; c < slot_image.channels(); c++)
        {
            double variance = stddev[c] * stddev[c];
            if (!(mean[c] > params.emptyMeanMin && mean[c] < params.emptyMeanMax))
                return false;
            if (!(variance < params.emptyVarianceMax))
                return false;
        }
        return true;
    }

    vector<Slot> segment(const Mat &frame, const Rect &region, const SegmentParams &params)
    {
        vector<Slot> slots;

        Rect frameRect(0, 0, frame.cols, frame.rows);
        if (region.width <= 0 || region.height <= 0 || (region & frameRect) != region)
        {
            log_warning("Region outside frame, nothing to segment");
            return slots;
        }

        const int size = params.slotSize;
        const int cols = region.width / size;
        const int rows = region.height / size;

        log_debug("Extracting " + log_string(rows) + "x" + log_string(cols) + " grid of slots");

        slots.reserve(static_cast<size_t>(rows) * cols);
        for (int row = 0; row < rows; row++)
        {
            for (int col = 0; col < cols; col++)
            {
                Slot slot;
                slot.row = row;
                slot.col = col;
                slot.origin = Point(region.x + col * size, region.y + row * size);
                slot.image = frame(Rect(slot.origin.x, slot.origin.y, size, size));
                slot.empty = isEmpty(slot.image, params);
                slots.push_back(slot);
            }
        }

        return slots;
    }

} // namespace slot_segmenter
