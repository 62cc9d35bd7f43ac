#include "scan_pipeline.hpp"
#include "utils/debug.hpp"
#include "utils/logging.hpp"
#include <opencv2/imgcodecs.hpp>

using namespace std;

ScanPipeline::ScanPipeline(shared_ptr<const TemplateLibrary> library,
                           shared_ptr<PriceResolver> resolver,
                           PipelineOptions options)
    : library_(std::move(library)), matcher_(*library_), resolver_(std::move(resolver)), options_(options)
{
}

ScanReport ScanPipeline::processFrame(const Frame &frame, uint64_t cycle)
{
    ScanReport report;
    report.cycle = cycle;

    optional<cv::Rect> region = region_locator::locate(frame.image, options_.debug_mode, options_.locator);
    if (!region)
    {
        // Inventory closed, the usual case
        report.timestamp = chrono::system_clock::now();
        return report;
    }
    report.inventory_found = true;

    vector<slot_segmenter::Slot> slots = slot_segmenter::segment(frame.image, *region, options_.segmenter);
    report.slots_total = static_cast<int>(slots.size());

    for (const auto &slot : slots)
    {
        if (slot.empty)
            continue;
        report.slots_occupied++;

        optional<MatchResult> match = matcher_.recognize(slot.image, options_.confidence_threshold);
        if (!match)
        {
            if (options_.debug_mode)
            {
                // Unknown icons, handy for growing the template library
                string dir = debug::ensureDebugDir("unmatched");
                cv::imwrite(dir + "/slot_" + to_string(slot.row) + "_" + to_string(slot.col) + ".png", slot.image);
            }
            continue;
        }

        RecognizedItem item;
        item.id = match->id;
        item.name = match->item->metadata.name;
        item.short_name = match->item->metadata.short_name;
        item.confidence = match->confidence;
        item.row = slot.row;
        item.col = slot.col;
        item.origin = slot.origin;
        if (resolver_)
            item.price = resolver_->getPrice(match->id);
        report.items.push_back(std::move(item));
    }

    if (!report.items.empty())
        log_info("Detected " + log_string(report.items.size()) + " items in " + log_string(report.slots_occupied) + " occupied slots");

    report.timestamp = chrono::system_clock::now();
    return report;
}

ScanReport ScanPipeline::runCycle(FrameSource &source, uint64_t cycle)
{
    try
    {
        CaptureResult capture = source.capture();
        if (!capture)
        {
            log_warning("Cycle " + log_string(cycle) + ": " + capture.error);
            return ScanReport::failure(cycle, capture.error);
        }

        return processFrame(capture.frame, cycle);
    }
    catch (const exception &e)
    {
        log_error("Cycle " + log_string(cycle) + " failed: " + string(e.what()));
        return ScanReport::failure(cycle, e.what());
    }
}
