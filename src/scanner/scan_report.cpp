#include "scan_report.hpp"
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

int64_t ScanReport::totalValue() const
{
    int64_t total = 0;
    for (const auto &item : items)
    {
        if (item.price)
            total += item.price->amount;
    }
    return total;
}

ScanReport ScanReport::failure(uint64_t cycle, const string &message)
{
    ScanReport report;
    report.cycle = cycle;
    report.timestamp = chrono::system_clock::now();
    report.error = message;
    return report;
}

string ScanReport::toJson() const
{
    json j;
    j["cycle"] = cycle;
    j["timestamp"] = chrono::duration_cast<chrono::milliseconds>(timestamp.time_since_epoch()).count();

    if (error)
    {
        j["error"] = *error;
        return j.dump();
    }

    json list = json::array();
    for (const auto &item : items)
    {
        json entry;
        entry["id"] = item.id;
        entry["name"] = item.name;
        entry["confidence"] = item.confidence;
        entry["slot"] = {{"row", item.row}, {"col", item.col}, {"x", item.origin.x}, {"y", item.origin.y}};
        if (item.price)
        {
            entry["price"] = item.price->amount;
            entry["currency"] = item.price->currency;
            entry["trader"] = item.price->trader;
        }
        else
        {
            entry["price"] = nullptr;
            entry["currency"] = nullptr;
            entry["trader"] = nullptr;
        }
        list.push_back(entry);
    }

    j["inventory_found"] = inventory_found;
    j["items"] = list;
    j["total"] = totalValue();
    return j.dump();
}
