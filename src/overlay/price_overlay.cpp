#include "price_overlay.hpp"
#include "utils/logging.hpp"
#include <iomanip>
#include <sstream>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

namespace
{
    string formatPrice(int64_t amount)
    {
        // 1234567 -> 1,234,567
        string digits = to_string(amount < 0 ? -amount : amount);
        string out;
        int count = 0;
        for (auto it = digits.rbegin(); it != digits.rend(); ++it)
        {
            if (count && count % 3 == 0)
                out.insert(out.begin(), ',');
            out.insert(out.begin(), *it);
            count++;
        }
        return amount < 0 ? "-" + out : out;
    }
}

void PriceOverlay::show()
{
    lock_guard<mutex> lock(mutex_);
    if (!visible_)
        log_debug("Overlay shown");
    visible_ = true;
}

void PriceOverlay::hide()
{
    lock_guard<mutex> lock(mutex_);
    if (visible_)
        log_debug("Overlay hidden");
    visible_ = false;
}

bool PriceOverlay::visible() const
{
    lock_guard<mutex> lock(mutex_);
    return visible_;
}

void PriceOverlay::update(const ScanReport &report)
{
    lock_guard<mutex> lock(mutex_);
    if (report.hasError())
    {
        errors_++;
        last_error_ = report.error;
        return;
    }
    latest_ = report;
    last_error_.reset();
}

void PriceOverlay::clear()
{
    lock_guard<mutex> lock(mutex_);
    latest_.reset();
    last_error_.reset();
    errors_ = 0;
}

int64_t PriceOverlay::totalValue() const
{
    lock_guard<mutex> lock(mutex_);
    return latest_ ? latest_->totalValue() : 0;
}

uint64_t PriceOverlay::errorCount() const
{
    lock_guard<mutex> lock(mutex_);
    return errors_;
}

optional<ScanReport> PriceOverlay::latest() const
{
    lock_guard<mutex> lock(mutex_);
    return latest_;
}

string PriceOverlay::render() const
{
    lock_guard<mutex> lock(mutex_);
    if (!visible_)
        return "";

    ostringstream out;
    if (!latest_)
    {
        out << "No scan yet";
        return out.str();
    }
    if (!latest_->inventory_found)
    {
        out << "Inventory not visible";
        return out.str();
    }

    out << "Items (" << latest_->items.size() << "/" << latest_->slots_occupied << " slots)\n";
    for (const auto &item : latest_->items)
    {
        out << "  " << left << setw(32) << item.name << right << setw(14);
        if (item.price)
            out << formatPrice(item.price->amount) + " " + item.price->currency << "  " << item.price->trader;
        else
            out << "n/a";
        out << "\n";
    }
    out << "Total: " << formatPrice(latest_->totalValue()) << " RUB";
    if (last_error_)
        out << "\nLast cycle failed: " << *last_error_;
    return out.str();
}

string PriceOverlay::toJson() const
{
    lock_guard<mutex> lock(mutex_);
    json j;
    j["visible"] = visible_;
    j["total"] = latest_ ? latest_->totalValue() : 0;
    j["errors"] = errors_;
    j["last_error"] = last_error_ ? json(*last_error_) : json(nullptr);
    j["report"] = latest_ ? json::parse(latest_->toJson()) : json(nullptr);
    return j.dump();
}
