#pragma once
#include <optional>
#include <string>
#include <opencv2/core.hpp>
#include "template_library.hpp"

struct MatchResult
{
    std::string id;          // Template id
    double confidence = 0.0; // Normalized cross-correlation, [0, 1]
    const ItemTemplate *item = nullptr;
};

// Exhaustive template matcher: every slot is compared against every template
// in library order, no index and no early exit. Holds no per-call state, so a
// single instance can serve several threads.
class ItemMatcher
{
public:
    static constexpr double DEFAULT_THRESHOLD = 0.8;

    explicit ItemMatcher(const TemplateLibrary &library);

    // Best scoring template if its score reaches the threshold. Equal scores
    // keep the template that comes first in the library.
    std::optional<MatchResult> recognize(const cv::Mat &slot_image, double confidence_threshold = DEFAULT_THRESHOLD) const;

    // Best candidate regardless of threshold (nullopt only for an empty library or image)
    std::optional<MatchResult> bestCandidate(const cv::Mat &slot_image) const;

    // TM_CCOEFF_NORMED peak of slot against one template; the slot is resized
    // to the template when the sizes differ. Non-finite results count as 0.
    static double score(const cv::Mat &slot_image, const cv::Mat &icon);

    const TemplateLibrary &library() const { return library_; }

private:
    const TemplateLibrary &library_;
};
