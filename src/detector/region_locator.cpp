#include "region_locator.hpp"
#include "utils/debug.hpp"
#include "utils/logging.hpp"
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <vector>

using namespace cv;
using namespace std;

namespace region_locator
{
    bool isInventoryCandidate(const Rect &rect, const LocatorParams &params)
    {
        if (rect.width <= params.minWidth || rect.height <= params.minHeight)
            return false;

        double aspectRatio = static_cast<double>(rect.width) / rect.height;
        return aspectRatio > params.minAspectRatio && aspectRatio < params.maxAspectRatio;
    }

    optional<Rect> locate(const Mat &frame, bool debug_mode, const LocatorParams &params)
    {
        if (frame.empty())
            return nullopt;

        Mat gray;
        if (frame.channels() == 3)
            cvtColor(frame, gray, COLOR_BGR2GRAY);
        else if (frame.channels() == 4)
            cvtColor(frame, gray, COLOR_BGRA2GRAY);
        else
            gray = frame;

        // Inverse threshold: dark inventory background becomes white
        Mat mask;
        threshold(gray, mask, params.darkThreshold, 255, THRESH_BINARY_INV);

        vector<vector<Point>> contours;
        findContours(mask, contours, RETR_EXTERNAL, CHAIN_APPROX_SIMPLE);

        optional<Rect> found;
        for (const auto &contour : contours)
        {
            Rect box = boundingRect(contour);
            if (isInventoryCandidate(box, params))
            {
                log_debug("Found potential inventory at (" + log_string(box.x) + ", " + log_string(box.y) +
                          "), size: " + log_string(box.width) + "x" + log_string(box.height));
                found = box;
                break;
            }
        }

        if (debug_mode)
        {
            Mat visualization = frame.clone();
            for (const auto &contour : contours)
            {
                Rect box = boundingRect(contour);
                if (box.area() > 2500)
                    rectangle(visualization, box, Scalar(0, 165, 255), 1);
            }
            if (found)
                rectangle(visualization, *found, Scalar(0, 255, 0), 3);

            string dir = debug::ensureDebugDir("region_locator");
            imwrite(dir + "/threshold.jpg", mask);
            imwrite(dir + "/candidates.jpg", visualization);
        }

        return found;
    }

} // namespace region_locator
