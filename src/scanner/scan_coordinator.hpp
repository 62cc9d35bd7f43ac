#pragma once
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "capture/frame.hpp"
#include "report_channel.hpp"
#include "scan_pipeline.hpp"

enum class ScanState
{
    Idle,
    Running,
    Stopping
};

std::string toString(ScanState state);

// Called on the scan thread when the loop starts; the source lives until the
// loop exits, so per-thread capture contexts are created and released there.
using SessionFactory = std::function<std::unique_ptr<FrameSource>()>;

struct CoordinatorOptions
{
    std::chrono::milliseconds interval{1000};       // Pause between cycles
    std::chrono::milliseconds shutdown_grace{2000}; // Max wait for the loop on terminate
};

// Drives the pipeline on one background thread.
//
//   Idle --start--> Running --stop--> Idle
//   Running --terminate--> Stopping --(loop exits or grace expires)--> Idle
//
// start/stop/terminate are meant to be called from the foreground thread.
// The loop looks at the flags before every cycle and while sleeping, it never
// abandons a capture halfway. Every finished cycle pushes exactly one report.
class ScanCoordinator
{
public:
    ScanCoordinator(std::shared_ptr<ScanPipeline> pipeline,
                    SessionFactory session_factory,
                    std::shared_ptr<ReportChannel> channel,
                    CoordinatorOptions options = CoordinatorOptions());
    ~ScanCoordinator();

    ScanCoordinator(const ScanCoordinator &) = delete;
    ScanCoordinator &operator=(const ScanCoordinator &) = delete;

    // false if terminated or the previous loop is still finishing a cycle
    bool start();
    void stop();

    // Returns true if the loop exited within the grace period. Otherwise the
    // thread is left to finish on its own and anything it produces is ignored.
    bool terminate();

    ScanState state() const { return state_.load(); }
    bool isTerminated() const { return terminated_.load(); }
    uint64_t cyclesCompleted() const { return cycles_->load(); }

private:
    // Shared with the loop thread so a detached loop never touches a dead coordinator
    struct LoopControl
    {
        std::mutex mutex;
        std::condition_variable wake;
        bool scanning = true;
        bool running = true;
        bool exited = false;
    };

    static void loop(std::shared_ptr<LoopControl> control,
                     std::shared_ptr<ScanPipeline> pipeline,
                     SessionFactory session_factory,
                     std::shared_ptr<ReportChannel> channel,
                     std::shared_ptr<std::atomic<uint64_t>> cycles,
                     std::chrono::milliseconds interval);

    bool waitForExit(std::chrono::milliseconds timeout);

    std::shared_ptr<ScanPipeline> pipeline_;
    SessionFactory session_factory_;
    std::shared_ptr<ReportChannel> channel_;
    CoordinatorOptions options_;

    std::mutex mutex_; // Serializes start/stop/terminate
    std::shared_ptr<LoopControl> control_;
    std::thread worker_;
    std::atomic<ScanState> state_{ScanState::Idle};
    std::atomic<bool> terminated_{false};
    std::shared_ptr<std::atomic<uint64_t>> cycles_; // Across all loops
};
