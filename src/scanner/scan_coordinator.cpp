#include "scan_coordinator.hpp"
#include "utils/logging.hpp"

using namespace std;

string toString(ScanState state)
{
    switch (state)
    {
    case ScanState::Idle:
        return "idle";
    case ScanState::Running:
        return "running";
    case ScanState::Stopping:
        return "stopping";
    }
    return "unknown";
}

ScanCoordinator::ScanCoordinator(shared_ptr<ScanPipeline> pipeline,
                                 SessionFactory session_factory,
                                 shared_ptr<ReportChannel> channel,
                                 CoordinatorOptions options)
    : pipeline_(std::move(pipeline)),
      session_factory_(std::move(session_factory)),
      channel_(std::move(channel)),
      options_(options),
      cycles_(make_shared<atomic<uint64_t>>(0))
{
}

ScanCoordinator::~ScanCoordinator()
{
    if (!terminated_)
        terminate();
}

void ScanCoordinator::loop(shared_ptr<LoopControl> control,
                           shared_ptr<ScanPipeline> pipeline,
                           SessionFactory session_factory,
                           shared_ptr<ReportChannel> channel,
                           shared_ptr<atomic<uint64_t>> cycles,
                           chrono::milliseconds interval)
{
    log_info("Scan loop started");

    auto keepGoing = [&control]()
    {
        return control->scanning && control->running;
    };

    // Opened on this thread, closed when the loop ends
    unique_ptr<FrameSource> source;
    uint64_t cycle = cycles->load();

    while (true)
    {
        {
            lock_guard<mutex> lock(control->mutex);
            if (!keepGoing())
                break;
        }

        cycle++;
        ScanReport report;
        try
        {
            if (!source)
                source = session_factory();
            if (source)
                report = pipeline->runCycle(*source, cycle);
            else
                report = ScanReport::failure(cycle, "no capture session available");
        }
        catch (const exception &e)
        {
            log_error("Cannot open capture session: " + string(e.what()));
            report = ScanReport::failure(cycle, string("capture session: ") + e.what());
        }

        channel->push(std::move(report));
        cycles->fetch_add(1);

        // Same pause whether or not the cycle found anything
        unique_lock<mutex> lock(control->mutex);
        control->wake.wait_for(lock, interval, [&keepGoing]()
                               { return !keepGoing(); });
    }

    source.reset();
    log_info("Scan loop ended");

    {
        lock_guard<mutex> lock(control->mutex);
        control->exited = true;
    }
    control->wake.notify_all();
}

bool ScanCoordinator::waitForExit(chrono::milliseconds timeout)
{
    if (!control_)
        return true;

    bool exited;
    {
        unique_lock<mutex> lock(control_->mutex);
        exited = control_->wake.wait_for(lock, timeout, [this]()
                                         { return control_->exited; });
    }

    if (worker_.joinable())
    {
        if (exited)
        {
            worker_.join();
        }
        else
        {
            log_warning("Scan loop did not stop within " + log_string(timeout.count()) + " ms, leaving it behind");
            worker_.detach();
        }
    }
    if (exited)
        control_.reset();
    return exited;
}

bool ScanCoordinator::start()
{
    lock_guard<mutex> guard(mutex_);

    if (terminated_)
    {
        log_warning("Scanner is shut down, ignoring start");
        return false;
    }
    if (state_ == ScanState::Running)
        return true;

    // A stopped loop may still be finishing its last cycle; only one producer at a time
    if (control_ && !waitForExit(options_.shutdown_grace))
    {
        log_error("Previous scan loop still busy, not starting");
        return false;
    }

    log_info("Starting scanner...");
    control_ = make_shared<LoopControl>();
    worker_ = thread(&ScanCoordinator::loop, control_, pipeline_, session_factory_, channel_, cycles_, options_.interval);
    state_ = ScanState::Running;
    return true;
}

void ScanCoordinator::stop()
{
    lock_guard<mutex> guard(mutex_);

    if (state_ != ScanState::Running)
        return;

    log_info("Stopping scanner...");
    {
        lock_guard<mutex> lock(control_->mutex);
        control_->scanning = false;
    }
    control_->wake.notify_all();
    state_ = ScanState::Idle;
}

bool ScanCoordinator::terminate()
{
    lock_guard<mutex> guard(mutex_);

    if (terminated_)
        return true;
    terminated_ = true;

    bool clean = true;
    if (control_)
    {
        state_ = ScanState::Stopping;
        {
            lock_guard<mutex> lock(control_->mutex);
            control_->scanning = false;
            control_->running = false;
        }
        control_->wake.notify_all();
        clean = waitForExit(options_.shutdown_grace);
    }

    state_ = ScanState::Idle;
    log_info(clean ? "Scanner shut down" : "Scanner shut down, abandoned a stuck cycle");
    return clean;
}
