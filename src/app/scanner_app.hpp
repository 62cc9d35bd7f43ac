#pragma once
#include <atomic>
#include <memory>
#include <string>
#include "communication/control_queue.hpp"
#include "communication/control_service.hpp"
#include "overlay/price_overlay.hpp"
#include "price/price_resolver.hpp"
#include "recognizer/template_library.hpp"
#include "scanner/report_channel.hpp"
#include "scanner/scan_coordinator.hpp"
#include "utils/config.hpp"

// Owns every component and runs the foreground loop: control signals in,
// reports out to the overlay. All coordinator transitions happen here.
class ScannerApp
{
public:
    // session_factory replaces screen capture when set
    explicit ScannerApp(const ScannerConfig &config, SessionFactory session_factory = nullptr);
    ~ScannerApp();

    ScannerApp(const ScannerApp &) = delete;
    ScannerApp &operator=(const ScannerApp &) = delete;

    // Loads templates and caches, builds the pipeline, starts the control
    // service (port 0 = no control service). False on an unusable setup.
    bool initialize();

    // Foreground loop, returns once terminated
    int run();

    // One foreground tick: dispatch pending signals, drain reports.
    // Returns false once terminated.
    bool processOnce();

    void dispatch(ControlSignal signal);

    std::string statusJson() const;

    std::shared_ptr<ControlQueue> controlQueue() const { return control_queue_; }
    const PriceOverlay &overlay() const { return *overlay_; }
    const ScanCoordinator *coordinator() const { return coordinator_.get(); }
    bool isTerminated() const { return terminated_; }

    // False when shutdown had to leave a scan cycle running
    bool shutdownWasClean() const { return clean_shutdown_; }

private:
    void shutdown();
    void drainReports();

    ScannerConfig config_;
    SessionFactory session_factory_;

    std::shared_ptr<TemplateLibrary> library_;
    std::shared_ptr<PriceResolver> resolver_;
    std::shared_ptr<ReportChannel> channel_;
    std::shared_ptr<ControlQueue> control_queue_;
    std::shared_ptr<PriceOverlay> overlay_;
    std::unique_ptr<ScanCoordinator> coordinator_;
    std::unique_ptr<ControlService> control_service_;

    std::atomic<bool> terminated_{false};
    std::atomic<bool> clean_shutdown_{true};
    int64_t shown_total_ = -1;
    size_t shown_items_ = 0;
};
