#pragma once
#include <cstdint>
#include <memory>
#include "capture/frame.hpp"
#include "detector/region_locator.hpp"
#include "detector/slot_segmenter.hpp"
#include "price/price_resolver.hpp"
#include "recognizer/item_matcher.hpp"
#include "recognizer/template_library.hpp"
#include "scan_report.hpp"

struct PipelineOptions
{
    region_locator::LocatorParams locator;
    slot_segmenter::SegmentParams segmenter;
    double confidence_threshold = ItemMatcher::DEFAULT_THRESHOLD;
    bool debug_mode = false;
};

// One scan cycle: capture -> locate -> segment -> recognize -> price.
// Runs synchronously on the scan loop's thread. Keeps the library and the
// resolver alive for as long as a loop holds the pipeline.
class ScanPipeline
{
public:
    ScanPipeline(std::shared_ptr<const TemplateLibrary> library,
                 std::shared_ptr<PriceResolver> resolver,
                 PipelineOptions options = PipelineOptions());

    // Whole cycle; never throws. Capture failures and exceptions come back
    // as error reports.
    ScanReport runCycle(FrameSource &source, uint64_t cycle);

    // Everything after capture. A missing inventory gives an empty report.
    ScanReport processFrame(const Frame &frame, uint64_t cycle);

    const PipelineOptions &options() const { return options_; }

private:
    std::shared_ptr<const TemplateLibrary> library_;
    ItemMatcher matcher_;
    std::shared_ptr<PriceResolver> resolver_;
    PipelineOptions options_;
};
