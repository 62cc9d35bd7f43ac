#include "price_resolver.hpp"
#include "utils/logging.hpp"
#include "utils/names.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

PriceResolver::PriceResolver(shared_ptr<PriceSource> source, chrono::seconds cache_duration, int attempts, NowFn now)
    : source_(std::move(source)), cache_duration_(cache_duration), attempts_(attempts > 0 ? attempts : 1), now_(std::move(now))
{
}

const map<string, PriceRecord> &PriceResolver::fallbackTable()
{
    static const map<string, PriceRecord> table = []
    {
        auto entry = [](int64_t amount, const string &trader)
        {
            PriceRecord record;
            record.amount = amount;
            record.currency = "RUB";
            record.trader = trader;
            return record;
        };
        return map<string, PriceRecord>{
            {"Graphics Card", entry(285000, "Mechanic")},
            {"Bitcoin", entry(445000, "Therapist")},
            {"LEDX", entry(890000, "Therapist")},
            {"Red Rebel", entry(2800000, "Jaeger")},
        };
    }();
    return table;
}

bool PriceResolver::isFresh(const PriceRecord &record) const
{
    return now_() - record.acquired < cache_duration_;
}

optional<PriceRecord> PriceResolver::cached(const string &item_id) const
{
    auto it = cache_.find(item_id);
    if (it == cache_.end() || !isFresh(it->second))
        return nullopt;
    return it->second;
}

void PriceResolver::store(const string &item_id, const PriceRecord &record)
{
    cache_[item_id] = record;
}

optional<PriceRecord> PriceResolver::fallback(const string &item_id) const
{
    const auto &table = fallbackTable();
    auto it = table.find(item_id);
    if (it == table.end())
    {
        // Template ids keep the catalog's capitalization, the table may not
        string wanted = names::normalize(item_id);
        it = find_if(table.begin(), table.end(),
                     [&wanted](const pair<const string, PriceRecord> &entry)
                     { return names::normalize(entry.first) == wanted; });
        if (it == table.end())
            return nullopt;
    }

    PriceRecord record = it->second;
    record.acquired = now_();
    return record;
}

optional<PriceRecord> PriceResolver::getPrice(const string &item_id)
{
    if (auto hit = cached(item_id))
        return hit;

    if (source_)
    {
        for (int attempt = 1; attempt <= attempts_; attempt++)
        {
            try
            {
                optional<PriceRecord> live = source_->fetchPrice(item_id);
                if (!live)
                    break; // Source does not know the item, asking again won't help

                live->acquired = now_();
                store(item_id, *live);
                return live;
            }
            catch (const exception &e)
            {
                log_warning("Price lookup for " + item_id + " failed (attempt " + log_string(attempt) +
                            "/" + log_string(attempts_) + "): " + e.what());
            }
        }
    }

    if (auto fixed = fallback(item_id))
    {
        log_debug("Using built-in price for " + item_id);
        return fixed;
    }

    log_debug("No price for " + item_id);
    return nullopt;
}

bool PriceResolver::saveCache(const string &path) const
{
    json cache = json::object();
    for (const auto &[id, record] : cache_)
    {
        cache[id] = {{"amount", record.amount},
                     {"currency", record.currency},
                     {"trader", record.trader},
                     {"acquired", chrono::duration_cast<chrono::milliseconds>(record.acquired.time_since_epoch()).count()}};
    }

    std::error_code ec;
    auto parent = filesystem::path(path).parent_path();
    if (!parent.empty())
        filesystem::create_directories(parent, ec);

    ofstream file(path);
    if (!file)
    {
        log_error("Failed to open price cache for writing: " + path);
        return false;
    }
    file << cache.dump(2);
    if (!file.good())
    {
        log_error("Failed to write price cache: " + path);
        return false;
    }

    log_info("Saved " + log_string(cache_.size()) + " cached prices");
    return true;
}

bool PriceResolver::loadCache(const string &path)
{
    ifstream file(path);
    if (!file)
    {
        log_debug("No price cache found, starting fresh");
        return false;
    }

    try
    {
        json cache = json::parse(file);
        if (!cache.is_object())
        {
            log_warning("Price cache " + path + " is not an object");
            return false;
        }

        unordered_map<string, PriceRecord> loaded;
        for (const auto &item : cache.items())
        {
            const json &entry = item.value();
            PriceRecord record;
            record.amount = entry.at("amount").get<int64_t>();
            record.currency = entry.value("currency", "RUB");
            record.trader = entry.value("trader", "");
            record.acquired = Clock::time_point(chrono::milliseconds(entry.at("acquired").get<int64_t>()));
            loaded[item.key()] = record;
        }

        cache_ = std::move(loaded);
        log_info("Loaded " + log_string(cache_.size()) + " cached prices");
        return true;
    }
    catch (const json::exception &e)
    {
        log_warning("Error loading price cache: " + string(e.what()));
        return false;
    }
}
