#include <gtest/gtest.h>
#include <filesystem>
#include <opencv2/imgcodecs.hpp>
#include "recognizer/template_library.hpp"
#include "utils/names.hpp"
#include "test_helpers.hpp"

using namespace test_helpers;

TEST(NamesTest, Sanitize)
{
    EXPECT_EQ(names::sanitize("LEDX Skin Transilluminator"), "LEDX Skin Transilluminator");
    EXPECT_EQ(names::sanitize("Physical Bitcoin (0.2 BTC)"), "Physical Bitcoin _0_2 BTC_");
    EXPECT_EQ(names::sanitize("M4A1/AR-15 stock"), "M4A1_AR-15 stock");
    EXPECT_EQ(names::sanitize("  spaced_name  "), "spaced_name");
    EXPECT_EQ(names::sanitize("   "), "");
}

TEST(NamesTest, Normalize)
{
    EXPECT_EQ(names::normalize("Graphics Card"), "graphics-card");
    EXPECT_EQ(names::normalize("ledx"), "ledx");
}

TEST(TemplateLibraryTest, ParseMetadata)
{
    auto meta = TemplateLibrary::parseMetadata(R"({
        "name": "Graphics card",
        "short_name": "GPU",
        "trader_price": {"price": 285000, "trader": "Mechanic", "currency": "RUB"},
        "avg_flea_price": 310000,
        "grid_size": [2, 1]
    })");
    ASSERT_TRUE(meta.has_value());
    EXPECT_EQ(meta->name, "Graphics card");
    EXPECT_EQ(meta->short_name, "GPU");
    ASSERT_TRUE(meta->trader_price.has_value());
    EXPECT_EQ(meta->trader_price->price, 285000);
    EXPECT_EQ(meta->trader_price->trader, "Mechanic");
    EXPECT_EQ(meta->avg_flea_price, 310000);
    EXPECT_EQ(meta->grid_width, 2);
    EXPECT_EQ(meta->grid_height, 1);
}

TEST(TemplateLibraryTest, ParseMetadataWithNulls)
{
    auto meta = TemplateLibrary::parseMetadata(R"({"name": "Bolts", "trader_price": null, "avg_flea_price": null})");
    ASSERT_TRUE(meta.has_value());
    EXPECT_FALSE(meta->trader_price.has_value());
    EXPECT_EQ(meta->avg_flea_price, 0);
    EXPECT_EQ(meta->grid_width, 1);

    EXPECT_FALSE(TemplateLibrary::parseMetadata("{not json").has_value());
}

TEST(TemplateLibraryTest, AddRejectsDuplicatesAndEmpty)
{
    TemplateLibrary library;
    ItemTemplate item;
    item.id = "Bitcoin";
    item.icon = makeIcon(1);
    EXPECT_TRUE(library.add(item));
    EXPECT_FALSE(library.add(item));

    ItemTemplate no_icon;
    no_icon.id = "Nothing";
    EXPECT_FALSE(library.add(no_icon));

    EXPECT_EQ(library.size(), 1u);
    EXPECT_NE(library.find("Bitcoin"), nullptr);
    EXPECT_EQ(library.find("LEDX"), nullptr);
}

TEST(TemplateLibraryTest, LoadsDirectoryInSortedOrder)
{
    TempDir dir;
    cv::imwrite(dir.file("LEDX.png"), makeIcon(2));
    cv::imwrite(dir.file("Bitcoin.png"), makeIcon(1));
    cv::imwrite(dir.file("Graphics card.png"), makeIcon(3));
    writeFile(dir.file("Bitcoin.json"), R"({"name": "Physical bitcoin", "short_name": "0.2BTC", "grid_size": [1, 1]})");
    writeFile(dir.file("notes.txt"), "ignored");

    TemplateLibrary library;
    ASSERT_TRUE(library.loadDirectory(dir.path().string()));
    ASSERT_EQ(library.size(), 3u);

    const auto &templates = library.templates();
    EXPECT_EQ(templates[0].id, "Bitcoin");
    EXPECT_EQ(templates[1].id, "Graphics card");
    EXPECT_EQ(templates[2].id, "LEDX");

    EXPECT_EQ(templates[0].metadata.name, "Physical bitcoin");
    EXPECT_EQ(templates[0].metadata.short_name, "0.2BTC");

    // No sidecar: id doubles as the name
    EXPECT_EQ(templates[2].metadata.name, "LEDX");
    EXPECT_EQ(templates[2].icon.size(), cv::Size(SLOT, SLOT));
}

TEST(TemplateLibraryTest, UnreadableIconIsSkipped)
{
    TempDir dir;
    writeFile(dir.file("Broken.png"), "not a png");
    cv::imwrite(dir.file("Good.png"), makeIcon(5));

    TemplateLibrary library;
    ASSERT_TRUE(library.loadDirectory(dir.path().string()));
    EXPECT_EQ(library.size(), 1u);
    EXPECT_NE(library.find("Good"), nullptr);
}

TEST(TemplateLibraryTest, MissingDirectoryIsCreated)
{
    TempDir dir;
    std::string missing = dir.file("items");

    TemplateLibrary library;
    EXPECT_FALSE(library.loadDirectory(missing));
    EXPECT_TRUE(library.empty());
    EXPECT_TRUE(std::filesystem::is_directory(missing));
}
