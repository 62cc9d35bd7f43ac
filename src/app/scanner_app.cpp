#include "scanner_app.hpp"
#include "capture/screen_capturer.hpp"
#include "price/catalog_client.hpp"
#include "scanner/scan_pipeline.hpp"
#include "utils/logging.hpp"
#include "utils/signals.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

ScannerApp::ScannerApp(const ScannerConfig &config, SessionFactory session_factory)
    : config_(config), session_factory_(std::move(session_factory)),
      control_queue_(make_shared<ControlQueue>()), overlay_(make_shared<PriceOverlay>())
{
}

ScannerApp::~ScannerApp()
{
    if (!terminated_)
        shutdown();
}

bool ScannerApp::initialize()
{
    // Templates
    library_ = make_shared<TemplateLibrary>();
    if (!library_->loadDirectory(config_.templates_dir))
        log_warning("No item templates loaded from " + config_.templates_dir + ", nothing will be recognized");
    else
        log_info("Loaded " + to_string(library_->size()) + " item templates");

    // Prices
    shared_ptr<PriceSource> source;
    if (!config_.catalog_url.empty())
    {
        CatalogClient::Options options;
        options.base_url = config_.catalog_url;
        options.cache_file = config_.catalog_cache_file;
        options.cache_max_age = config::priceCacheDuration(config_);
        options.timeout_s = config_.request_timeout_s;
        options.attempts = config_.request_attempts;
        source = make_shared<CatalogClient>(options);
    }
    else
    {
        log_info("No catalog URL, prices come from cache and built-in table only");
    }

    resolver_ = make_shared<PriceResolver>(source, config::priceCacheDuration(config_), config_.request_attempts);
    if (!config_.price_cache_file.empty() && resolver_->loadCache(config_.price_cache_file))
        log_info("Price cache restored with " + to_string(resolver_->cacheSize()) + " entries");

    // Pipeline
    PipelineOptions pipeline_options;
    pipeline_options.locator.darkThreshold = config_.dark_threshold;
    pipeline_options.locator.minWidth = config_.min_region_width;
    pipeline_options.locator.minHeight = config_.min_region_height;
    pipeline_options.locator.minAspectRatio = config_.min_aspect_ratio;
    pipeline_options.locator.maxAspectRatio = config_.max_aspect_ratio;
    pipeline_options.segmenter.slotSize = config_.slot_size;
    pipeline_options.segmenter.emptyMeanMin = config_.empty_mean_min;
    pipeline_options.segmenter.emptyMeanMax = config_.empty_mean_max;
    pipeline_options.segmenter.emptyVarianceMax = config_.empty_variance_max;
    pipeline_options.confidence_threshold = config_.confidence_threshold;
    pipeline_options.debug_mode = config_.debug;

    auto pipeline = make_shared<ScanPipeline>(library_, resolver_, pipeline_options);

    SessionFactory sessions = session_factory_;
    if (!sessions)
    {
        CaptureRegion region;
        region.left = config_.region_x;
        region.top = config_.region_y;
        region.width = config_.region_width;
        region.height = config_.region_height;
        auto capturer = make_shared<ScreenCapturer>(config_.display_name, region);
        sessions = [capturer]() -> unique_ptr<FrameSource>
        { return capturer->openSession(); };
    }

    channel_ = make_shared<ReportChannel>(static_cast<size_t>(config_.report_queue_capacity));

    CoordinatorOptions coordinator_options;
    coordinator_options.interval = chrono::milliseconds(config_.scan_interval_ms);
    coordinator_options.shutdown_grace = chrono::milliseconds(config_.shutdown_grace_ms);
    coordinator_ = make_unique<ScanCoordinator>(pipeline, sessions, channel_, coordinator_options);

    // Control surface
    if (config_.control_port > 0)
    {
        control_service_ = make_unique<ControlService>(
            control_queue_, overlay_, [this]()
            { return statusJson(); },
            config_.control_port);
        if (!control_service_->start())
        {
            log_error("Control service unavailable, use signals to stop the scanner");
            control_service_.reset();
        }
    }

    return true;
}

void ScannerApp::dispatch(ControlSignal signal)
{
    if (!coordinator_)
    {
        log_error("Scanner not initialized, ignoring " + toString(signal));
        return;
    }
    log_debug("Dispatching " + toString(signal));

    switch (signal)
    {
    case ControlSignal::StartScanning:
        if (coordinator_->start())
            overlay_->show();
        break;
    case ControlSignal::StopScanning:
        coordinator_->stop();
        break;
    case ControlSignal::ShowOverlay:
        overlay_->show();
        shown_total_ = -1;
        break;
    case ControlSignal::HideOverlay:
        overlay_->hide();
        break;
    case ControlSignal::Terminate:
        shutdown();
        break;
    }
}

void ScannerApp::drainReports()
{
    if (!channel_)
        return;

    ScanReport report;
    while (channel_->tryPop(report))
    {
        if (report.hasError())
            log_debug("Cycle " + log_string(report.cycle) + " error: " + *report.error);

        overlay_->update(report);
        if (report.hasError() || !overlay_->visible())
            continue;

        // Only reprint when something changed
        int64_t total = report.totalValue();
        if (total != shown_total_ || report.items.size() != shown_items_)
        {
            shown_total_ = total;
            shown_items_ = report.items.size();
            log_info("\n" + overlay_->render());
        }
    }
}

bool ScannerApp::processOnce()
{
    if (terminated_)
        return false;

    if (signals::receivedSignal() != 0)
    {
        log_info("Received signal " + to_string(signals::receivedSignal()) + ", shutting down");
        control_queue_->push(ControlSignal::Terminate);
    }

    ControlSignal signal;
    while (!terminated_ && control_queue_->tryPop(signal))
        dispatch(signal);

    drainReports();
    return !terminated_;
}

int ScannerApp::run()
{
    if (!coordinator_)
    {
        log_error("Scanner not initialized");
        return 1;
    }

    log_info("Scanner ready");
    while (processOnce())
    {
        // Wakes early when a control signal arrives
        ControlSignal signal;
        if (control_queue_->pop(signal, config_.poll_interval_ms))
            dispatch(signal);
    }

    return 0;
}

void ScannerApp::shutdown()
{
    if (terminated_.exchange(true))
        return;

    log_info("Shutting down...");
    bool clean = true;
    if (coordinator_)
        clean = coordinator_->terminate();
    clean_shutdown_ = clean;

    if (control_service_)
        control_service_->stop();

    drainReports();

    // A loop left behind may still be writing the cache
    if (clean && resolver_ && !config_.price_cache_file.empty())
    {
        if (resolver_->saveCache(config_.price_cache_file))
            log_info("Price cache saved to " + config_.price_cache_file);
    }
    else if (!clean)
    {
        log_warning("Price cache not saved, scan loop still busy");
    }
}

string ScannerApp::statusJson() const
{
    json j;
    j["state"] = coordinator_ ? toString(coordinator_->state()) : "uninitialized";
    j["terminated"] = terminated_.load();
    j["cycles"] = coordinator_ ? coordinator_->cyclesCompleted() : 0;
    j["overlay_visible"] = overlay_->visible();
    j["templates"] = library_ ? library_->size() : 0;
    j["reports_dropped"] = channel_ ? channel_->dropped() : 0;
    return j.dump();
}
