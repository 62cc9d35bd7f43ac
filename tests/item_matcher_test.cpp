#include <gtest/gtest.h>
#include <opencv2/imgproc.hpp>
#include "recognizer/item_matcher.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;

namespace
{
    ItemTemplate makeTemplate(const std::string &id, const cv::Mat &icon)
    {
        ItemTemplate item;
        item.id = id;
        item.icon = icon;
        item.metadata.name = id;
        return item;
    }

    class ItemMatcherTest : public ::testing::Test
    {
    protected:
        void SetUp() override
        {
            library.add(makeTemplate("Bitcoin", makeIcon(11)));
            library.add(makeTemplate("LEDX", makeIcon(22)));
            library.add(makeTemplate("Graphics Card", makeIcon(33)));
        }

        TemplateLibrary library;
    };
}

TEST_F(ItemMatcherTest, IdenticalImageScoresNearOne)
{
    ItemMatcher matcher(library);
    auto match = matcher.recognize(makeIcon(22));
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->id, "LEDX");
    EXPECT_GE(match->confidence, 0.99);
    ASSERT_NE(match->item, nullptr);
    EXPECT_EQ(match->item->metadata.name, "LEDX");
}

TEST_F(ItemMatcherTest, UnknownIconIsRejected)
{
    ItemMatcher matcher(library);
    EXPECT_FALSE(matcher.recognize(makeIcon(99)).has_value());

    auto best = matcher.bestCandidate(makeIcon(99));
    ASSERT_TRUE(best.has_value());
    EXPECT_LT(best->confidence, ItemMatcher::DEFAULT_THRESHOLD);
}

TEST_F(ItemMatcherTest, ThresholdIsRespected)
{
    // Half icon, half noise: correlation around 0.7
    cv::Mat blended;
    cv::addWeighted(makeIcon(11), 0.5, makeIcon(77), 0.5, 0.0, blended);

    ItemMatcher matcher(library);
    auto best = matcher.bestCandidate(blended);
    ASSERT_TRUE(best.has_value());
    EXPECT_EQ(best->id, "Bitcoin");
    EXPECT_GT(best->confidence, 0.5);
    EXPECT_LT(best->confidence, 0.8);

    EXPECT_FALSE(matcher.recognize(blended, 0.8).has_value());
    auto loose = matcher.recognize(blended, 0.5);
    ASSERT_TRUE(loose.has_value());
    EXPECT_EQ(loose->id, "Bitcoin");

    // Threshold is inclusive
    auto exact = matcher.recognize(blended, best->confidence);
    EXPECT_TRUE(exact.has_value());
}

TEST_F(ItemMatcherTest, FirstTemplateWinsTies)
{
    library.add(makeTemplate("LEDX copy", makeIcon(22)));

    ItemMatcher matcher(library);
    auto match = matcher.recognize(makeIcon(22));
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->id, "LEDX");
}

TEST_F(ItemMatcherTest, LargerSlotIsResized)
{
    cv::Mat big;
    cv::resize(makeIcon(33), big, cv::Size(2 * SLOT, 2 * SLOT), 0, 0, cv::INTER_NEAREST);

    ItemMatcher matcher(library);
    auto match = matcher.recognize(big);
    ASSERT_TRUE(match.has_value());
    EXPECT_EQ(match->id, "Graphics Card");
    EXPECT_GE(match->confidence, 0.95);
}

TEST_F(ItemMatcherTest, ScoreStaysInRange)
{
    cv::Mat flat(SLOT, SLOT, CV_8UC3, cv::Scalar(60, 60, 60));
    double s = ItemMatcher::score(flat, makeIcon(11));
    EXPECT_GE(s, 0.0);
    EXPECT_LE(s, 1.0);

    // Inverted image correlates negatively, clamped to 0
    cv::Mat inverted;
    cv::bitwise_not(makeIcon(11), inverted);
    EXPECT_DOUBLE_EQ(ItemMatcher::score(inverted, makeIcon(11)), 0.0);
}

TEST_F(ItemMatcherTest, MismatchedTypesScoreZero)
{
    cv::Mat gray(SLOT, SLOT, CV_8UC1, cv::Scalar(100));
    EXPECT_DOUBLE_EQ(ItemMatcher::score(gray, makeIcon(11)), 0.0);
    EXPECT_DOUBLE_EQ(ItemMatcher::score(cv::Mat(), makeIcon(11)), 0.0);
}

TEST(ItemMatcherEmptyLibraryTest, NothingToMatch)
{
    TemplateLibrary empty;
    ItemMatcher matcher(empty);
    EXPECT_FALSE(matcher.bestCandidate(makeIcon(1)).has_value());
    EXPECT_FALSE(matcher.recognize(makeIcon(1), 0.0).has_value());
}
