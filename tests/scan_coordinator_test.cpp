#include <gtest/gtest.h>
#include <stdexcept>
#include <thread>
#include "scanner/scan_coordinator.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;
using namespace std::chrono;

namespace
{
    class ScanCoordinatorTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            pipeline = std::make_shared<ScanPipeline>(std::make_shared<TemplateLibrary>(), nullptr);
            channel = std::make_shared<ReportChannel>(64);
        }

        std::unique_ptr<ScanCoordinator> makeCoordinator(FakeFrameSource::CaptureFn capture,
                                                         milliseconds interval = milliseconds(10),
                                                         milliseconds grace = milliseconds(2000))
        {
            CoordinatorOptions options;
            options.interval = interval;
            options.shutdown_grace = grace;
            auto factory = [capture, this]() -> std::unique_ptr<FrameSource>
            {
                sessions_opened++;
                return std::make_unique<FakeFrameSource>(capture);
            };
            return std::make_unique<ScanCoordinator>(pipeline, factory, channel, options);
        }

        std::vector<ScanReport> collect(size_t count, int timeout_ms = 3000)
        {
            std::vector<ScanReport> reports;
            auto deadline = steady_clock::now() + milliseconds(timeout_ms);
            ScanReport report;
            while (reports.size() < count && steady_clock::now() < deadline)
            {
                if (channel->pop(report, 50))
                    reports.push_back(report);
            }
            return reports;
        }

        std::shared_ptr<ScanPipeline> pipeline;
        std::shared_ptr<ReportChannel> channel;
        std::atomic<int> sessions_opened{0};
    };
}

TEST_F(ScanCoordinatorTest, StartsIdle)
{
    auto coordinator = makeCoordinator([]()
                                       { return frameResult(makeScreen(640, 480)); });
    EXPECT_EQ(coordinator->state(), ScanState::Idle);
    EXPECT_EQ(toString(coordinator->state()), "idle");
    EXPECT_EQ(coordinator->cyclesCompleted(), 0u);
    EXPECT_EQ(channel->size(), 0u);
}

TEST_F(ScanCoordinatorTest, NoInventoryGivesEmptyReports)
{
    auto coordinator = makeCoordinator([]()
                                       { return frameResult(makeScreen(640, 480)); });
    ASSERT_TRUE(coordinator->start());
    EXPECT_EQ(coordinator->state(), ScanState::Running);

    auto reports = collect(3);
    ASSERT_EQ(reports.size(), 3u);
    for (size_t i = 0; i < reports.size(); i++)
    {
        EXPECT_FALSE(reports[i].hasError());
        EXPECT_FALSE(reports[i].inventory_found);
        EXPECT_TRUE(reports[i].items.empty());
        EXPECT_EQ(reports[i].cycle, i + 1);
    }
    EXPECT_TRUE(coordinator->terminate());
}

TEST_F(ScanCoordinatorTest, StopDuringSleepEndsReports)
{
    auto coordinator = makeCoordinator([]()
                                       { return frameResult(makeScreen(640, 480)); },
                                       seconds(30));
    ASSERT_TRUE(coordinator->start());
    ASSERT_EQ(collect(1).size(), 1u);

    auto before = steady_clock::now();
    coordinator->stop();
    EXPECT_EQ(coordinator->state(), ScanState::Idle);

    std::this_thread::sleep_for(milliseconds(200));
    ScanReport report;
    EXPECT_FALSE(channel->tryPop(report));
    EXPECT_EQ(coordinator->cyclesCompleted(), 1u);

    // The sleeping loop wakes up right away
    EXPECT_TRUE(coordinator->terminate());
    EXPECT_LT(steady_clock::now() - before, seconds(5));
}

TEST_F(ScanCoordinatorTest, RepeatedCaptureFailuresKeepRunning)
{
    auto coordinator = makeCoordinator([]()
                                       { return CaptureResult::failure("capture failed: both backends"); });
    ASSERT_TRUE(coordinator->start());

    auto reports = collect(5);
    ASSERT_EQ(reports.size(), 5u);
    for (const auto &report : reports)
    {
        ASSERT_TRUE(report.hasError());
        EXPECT_EQ(*report.error, "capture failed: both backends");
    }
    EXPECT_EQ(coordinator->state(), ScanState::Running);
    EXPECT_EQ(sessions_opened.load(), 1);
    EXPECT_TRUE(coordinator->terminate());
}

TEST_F(ScanCoordinatorTest, ThrowingCaptureKeepsRunning)
{
    auto coordinator = makeCoordinator([]() -> CaptureResult
                                       { throw std::runtime_error("backend crashed"); });
    ASSERT_TRUE(coordinator->start());

    auto reports = collect(5);
    ASSERT_EQ(reports.size(), 5u);
    for (const auto &report : reports)
    {
        ASSERT_TRUE(report.hasError());
        EXPECT_EQ(*report.error, "backend crashed");
    }
    EXPECT_EQ(coordinator->state(), ScanState::Running);
    EXPECT_TRUE(coordinator->terminate());
}

TEST_F(ScanCoordinatorTest, SessionFactoryFailureIsReported)
{
    CoordinatorOptions options;
    options.interval = milliseconds(10);
    ScanCoordinator coordinator(
        pipeline, []() -> std::unique_ptr<FrameSource>
        { throw std::runtime_error("cannot open display"); },
        channel, options);

    ASSERT_TRUE(coordinator.start());
    auto reports = collect(2);
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_TRUE(reports[0].hasError());
    EXPECT_NE(reports[0].error->find("cannot open display"), std::string::npos);
    EXPECT_TRUE(coordinator.terminate());
}

TEST_F(ScanCoordinatorTest, RestartAfterStop)
{
    auto coordinator = makeCoordinator([]()
                                       { return frameResult(makeScreen(640, 480)); },
                                       milliseconds(20));
    ASSERT_TRUE(coordinator->start());
    ASSERT_EQ(collect(2).size(), 2u);
    coordinator->stop();

    ASSERT_TRUE(coordinator->start());
    EXPECT_EQ(coordinator->state(), ScanState::Running);
    auto reports = collect(2);
    ASSERT_EQ(reports.size(), 2u);
    EXPECT_GT(reports[0].cycle, 1u); // Cycle numbers keep counting
    EXPECT_EQ(sessions_opened.load(), 2);
    EXPECT_TRUE(coordinator->terminate());
}

TEST_F(ScanCoordinatorTest, StartTwiceIsHarmless)
{
    auto coordinator = makeCoordinator([]()
                                       { return frameResult(makeScreen(640, 480)); });
    EXPECT_TRUE(coordinator->start());
    EXPECT_TRUE(coordinator->start());
    EXPECT_TRUE(coordinator->terminate());
    EXPECT_EQ(sessions_opened.load(), 1);
}

TEST_F(ScanCoordinatorTest, TerminateIsFinal)
{
    auto coordinator = makeCoordinator([]()
                                       { return frameResult(makeScreen(640, 480)); });
    EXPECT_TRUE(coordinator->terminate()); // Never started
    EXPECT_TRUE(coordinator->isTerminated());
    EXPECT_EQ(coordinator->state(), ScanState::Idle);
    EXPECT_FALSE(coordinator->start());
    EXPECT_TRUE(coordinator->terminate());
}

TEST_F(ScanCoordinatorTest, TerminateWaitsAtMostTheGracePeriod)
{
    auto gate = std::make_shared<Gate>();

    // Capture hangs until the gate opens, the source reports its destruction
    struct StuckSource : FrameSource
    {
        explicit StuckSource(std::shared_ptr<Gate> g) : gate(std::move(g)) {}
        ~StuckSource() override { gate->destroyed = true; }
        CaptureResult capture() override
        {
            gate->wait();
            return CaptureResult::failure("late");
        }
        std::shared_ptr<Gate> gate;
    };

    CoordinatorOptions options;
    options.interval = milliseconds(10);
    options.shutdown_grace = milliseconds(200);
    ScanCoordinator coordinator(
        pipeline, [gate]() -> std::unique_ptr<FrameSource>
        { return std::make_unique<StuckSource>(gate); },
        channel, options);

    ASSERT_TRUE(coordinator.start());
    auto deadline = steady_clock::now() + seconds(3);
    while (!gate->entered && steady_clock::now() < deadline)
        std::this_thread::sleep_for(milliseconds(5));
    ASSERT_TRUE(gate->entered);

    auto before = steady_clock::now();
    EXPECT_FALSE(coordinator.terminate());
    auto waited = steady_clock::now() - before;
    EXPECT_GE(waited, milliseconds(150));
    EXPECT_LT(waited, milliseconds(1500));
    EXPECT_EQ(coordinator.state(), ScanState::Idle);
    EXPECT_TRUE(coordinator.isTerminated());

    // Let the abandoned loop run out before the test ends
    gate->release();
    deadline = steady_clock::now() + seconds(3);
    while (!gate->destroyed && steady_clock::now() < deadline)
        std::this_thread::sleep_for(milliseconds(5));
    EXPECT_TRUE(gate->destroyed);
    std::this_thread::sleep_for(milliseconds(50));
}
