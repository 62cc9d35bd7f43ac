#include "item_matcher.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <cmath>
#include <opencv2/imgproc.hpp>

using namespace cv;
using namespace std;

ItemMatcher::ItemMatcher(const TemplateLibrary &library) : library_(library)
{
}

double ItemMatcher::score(const Mat &slot_image, const Mat &icon)
{
    if (slot_image.empty() || icon.empty() || slot_image.type() != icon.type())
        return 0.0;

    Mat candidate = slot_image;
    if (slot_image.size() != icon.size())
        resize(slot_image, candidate, icon.size());

    Mat response;
    matchTemplate(candidate, icon, response, TM_CCOEFF_NORMED);

    double maxVal = 0.0;
    minMaxLoc(response, nullptr, &maxVal);
    if (!std::isfinite(maxVal))
        return 0.0;
    return std::clamp(maxVal, 0.0, 1.0);
}

optional<MatchResult> ItemMatcher::bestCandidate(const Mat &slot_image) const
{
    if (slot_image.empty() || library_.empty())
        return nullopt;

    MatchResult best;
    best.confidence = -1.0;

    for (const auto &item : library_.templates())
    {
        double s = score(slot_image, item.icon);
        // Strictly greater: first template wins ties
        if (s > best.confidence)
        {
            best.confidence = s;
            best.id = item.id;
            best.item = &item;
        }
    }

    return best;
}

optional<MatchResult> ItemMatcher::recognize(const Mat &slot_image, double confidence_threshold) const
{
    optional<MatchResult> best = bestCandidate(slot_image);
    if (!best || best->confidence < confidence_threshold)
        return nullopt;

    log_debug("Recognized " + best->id + " with confidence " + log_string(best->confidence));
    return best;
}
