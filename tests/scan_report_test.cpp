#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "scanner/scan_report.hpp"

using json = nlohmann::json;

namespace
{
    RecognizedItem item(const std::string &id, std::optional<int64_t> price)
    {
        RecognizedItem entry;
        entry.id = id;
        entry.name = id;
        entry.confidence = 0.93;
        entry.row = 1;
        entry.col = 2;
        entry.origin = cv::Point(226, 163);
        if (price)
        {
            PriceRecord record;
            record.amount = *price;
            record.trader = "Therapist";
            entry.price = record;
        }
        return entry;
    }
}

TEST(ScanReportTest, TotalSkipsMissingPrices)
{
    ScanReport report;
    report.items.push_back(item("LEDX", 890000));
    report.items.push_back(item("Unknown", std::nullopt));
    report.items.push_back(item("Bitcoin", 445000));
    EXPECT_EQ(report.totalValue(), 1335000);
}

TEST(ScanReportTest, JsonWithItems)
{
    ScanReport report;
    report.cycle = 7;
    report.timestamp = std::chrono::system_clock::time_point(std::chrono::milliseconds(1700000000123));
    report.inventory_found = true;
    report.items.push_back(item("LEDX", 890000));
    report.items.push_back(item("Unknown", std::nullopt));

    json j = json::parse(report.toJson());
    EXPECT_EQ(j["cycle"], 7);
    EXPECT_EQ(j["timestamp"], 1700000000123LL);
    EXPECT_FALSE(j.contains("error"));
    ASSERT_EQ(j["items"].size(), 2u);

    const json &ledx = j["items"][0];
    EXPECT_EQ(ledx["id"], "LEDX");
    EXPECT_EQ(ledx["price"], 890000);
    EXPECT_EQ(ledx["currency"], "RUB");
    EXPECT_EQ(ledx["trader"], "Therapist");
    EXPECT_EQ(ledx["slot"]["row"], 1);
    EXPECT_EQ(ledx["slot"]["x"], 226);

    const json &unknown = j["items"][1];
    EXPECT_TRUE(unknown["price"].is_null());
    EXPECT_TRUE(unknown["trader"].is_null());
    EXPECT_EQ(j["total"], 890000);
}

TEST(ScanReportTest, ErrorMarker)
{
    ScanReport report = ScanReport::failure(3, "capture failed");
    EXPECT_TRUE(report.hasError());
    EXPECT_TRUE(report.items.empty());

    json j = json::parse(report.toJson());
    EXPECT_EQ(j["cycle"], 3);
    EXPECT_EQ(j["error"], "capture failed");
    EXPECT_FALSE(j.contains("items"));
}
