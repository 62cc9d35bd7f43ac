#include <gtest/gtest.h>
#include <vector>
#include <opencv2/imgproc.hpp>
#include "detector/region_locator.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;

namespace
{
    // Qualifying rectangles in the order findContours reports them
    std::vector<cv::Rect> candidatesInContourOrder(const cv::Mat &frame)
    {
        region_locator::LocatorParams params;
        cv::Mat gray, mask;
        cv::cvtColor(frame, gray, cv::COLOR_BGR2GRAY);
        cv::threshold(gray, mask, params.darkThreshold, 255, cv::THRESH_BINARY_INV);

        std::vector<std::vector<cv::Point>> contours;
        cv::findContours(mask, contours, cv::RETR_EXTERNAL, cv::CHAIN_APPROX_SIMPLE);

        std::vector<cv::Rect> candidates;
        for (const auto &contour : contours)
        {
            cv::Rect box = cv::boundingRect(contour);
            if (region_locator::isInventoryCandidate(box, params))
                candidates.push_back(box);
        }
        return candidates;
    }
}

TEST(RegionLocatorTest, FindsDarkInventoryBlock)
{
    cv::Mat frame = makeScreen(1280, 800);
    cv::Rect inventory(200, 100, 567, 504);
    drawInventory(frame, inventory);

    auto found = region_locator::locate(frame);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, inventory);
}

TEST(RegionLocatorTest, NothingOnPlainScreen)
{
    cv::Mat frame = makeScreen(1280, 800);
    EXPECT_FALSE(region_locator::locate(frame).has_value());
}

TEST(RegionLocatorTest, EmptyFrameIsAMiss)
{
    EXPECT_FALSE(region_locator::locate(cv::Mat()).has_value());
}

TEST(RegionLocatorTest, SizeLimitIsExclusive)
{
    cv::Mat frame = makeScreen(1000, 1000);
    drawInventory(frame, cv::Rect(100, 100, 400, 400));
    EXPECT_FALSE(region_locator::locate(frame).has_value());

    frame = makeScreen(1000, 1000);
    drawInventory(frame, cv::Rect(100, 100, 401, 401));
    EXPECT_TRUE(region_locator::locate(frame).has_value());
}

TEST(RegionLocatorTest, CandidateSizeAndShape)
{
    using region_locator::isInventoryCandidate;

    EXPECT_FALSE(isInventoryCandidate(cv::Rect(0, 0, 400, 500)));
    EXPECT_FALSE(isInventoryCandidate(cv::Rect(0, 0, 500, 400)));
    EXPECT_TRUE(isInventoryCandidate(cv::Rect(0, 0, 401, 401)));

    // Aspect ratio bounds are exclusive
    EXPECT_FALSE(isInventoryCandidate(cv::Rect(0, 0, 480, 600))); // 0.8
    EXPECT_TRUE(isInventoryCandidate(cv::Rect(0, 0, 481, 600)));
    EXPECT_FALSE(isInventoryCandidate(cv::Rect(0, 0, 900, 600))); // 1.5
    EXPECT_TRUE(isInventoryCandidate(cv::Rect(0, 0, 899, 600)));
}

TEST(RegionLocatorTest, RejectsWrongShape)
{
    cv::Mat frame = makeScreen(1600, 900);
    drawInventory(frame, cv::Rect(50, 50, 1200, 450)); // Too wide
    EXPECT_FALSE(region_locator::locate(frame).has_value());
}

TEST(RegionLocatorTest, CustomParams)
{
    cv::Mat frame = makeScreen(800, 800);
    drawInventory(frame, cv::Rect(100, 100, 300, 300));

    region_locator::LocatorParams params;
    params.minWidth = 250;
    params.minHeight = 250;
    auto found = region_locator::locate(frame, false, params);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->width, 300);
}

TEST(RegionLocatorTest, SameFrameSameAnswer)
{
    cv::Mat frame = makeScreen(1280, 800);
    drawInventory(frame, cv::Rect(100, 100, 504, 441));

    auto first = region_locator::locate(frame);
    auto second = region_locator::locate(frame);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(*first, *second);
}

TEST(RegionLocatorTest, IconsInsideDoNotSplitTheRegion)
{
    cv::Mat frame = makeScreen(1280, 800);
    cv::Rect inventory(100, 100, 7 * SLOT, 7 * SLOT);
    drawInventory(frame, inventory);
    paintSlot(frame, inventory, 0, 0, makeIcon(1));
    paintSlot(frame, inventory, 3, 4, makeIcon(2));
    paintSlot(frame, inventory, 6, 6, makeEmptySlot());

    auto found = region_locator::locate(frame);
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(*found, inventory);
}

TEST(RegionLocatorTest, FirstQualifyingCandidateWins)
{
    // A barely qualifying square and a large, well shaped block, tried in
    // both placements so that the square comes first in at least one
    const cv::Size small(420, 420);
    const cv::Size large(700, 600);
    const cv::Point placements[2][2] = {{{50, 50}, {900, 250}},
                                        {{900, 250}, {50, 50}}};

    bool small_won = false;
    for (const auto &placement : placements)
    {
        cv::Mat frame = makeScreen(1800, 900);
        cv::Rect small_rect(placement[0], small);
        cv::Rect large_rect(placement[1], large);
        drawInventory(frame, small_rect);
        drawInventory(frame, large_rect);

        auto candidates = candidatesInContourOrder(frame);
        ASSERT_EQ(candidates.size(), 2u);

        auto found = region_locator::locate(frame);
        ASSERT_TRUE(found.has_value());
        EXPECT_EQ(*found, candidates.front());
        if (*found == small_rect)
            small_won = true;
    }

    // Picking the biggest candidate would never return the square
    EXPECT_TRUE(small_won);
}
