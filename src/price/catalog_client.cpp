#include "catalog_client.hpp"
#include "utils/logging.hpp"
#include "utils/names.hpp"
#include <filesystem>
#include <fstream>
#include <thread>
#include <httplib.h>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

namespace
{
    // Only the fields the scanner and the template builder consume
    const char *ITEMS_QUERY = R"({
  items {
    id
    name
    shortName
    normalizedName
    width
    height
    avg24hPrice
    sellFor {
      source
      price
      currency
      priceRUB
      vendor { name }
    }
  }
})";

    int64_t numberOrZero(const json &j, const char *key)
    {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number())
            return 0;
        return static_cast<int64_t>(it->get<double>());
    }

    string stringOrEmpty(const json &j, const char *key)
    {
        auto it = j.find(key);
        if (it == j.end() || !it->is_string())
            return "";
        return it->get<string>();
    }

    json toJson(const CatalogItem &item)
    {
        json offers = json::array();
        for (const auto &offer : item.sell_for)
        {
            offers.push_back({{"source", offer.source},
                              {"price", offer.price},
                              {"currency", offer.currency},
                              {"priceRUB", offer.price_rub},
                              {"vendor", {{"name", offer.vendor}}}});
        }
        return {{"id", item.id},
                {"name", item.name},
                {"shortName", item.short_name},
                {"normalizedName", item.normalized_name},
                {"width", item.width},
                {"height", item.height},
                {"avg24hPrice", item.avg_24h_price},
                {"sellFor", offers}};
    }
}

CatalogClient::CatalogClient(Options options) : options_(std::move(options))
{
}

vector<CatalogItem> CatalogClient::parseItems(const json &items)
{
    vector<CatalogItem> parsed;
    if (!items.is_array())
        return parsed;

    parsed.reserve(items.size());
    for (const auto &entry : items)
    {
        if (!entry.is_object())
            continue;

        CatalogItem item;
        item.id = stringOrEmpty(entry, "id");
        item.name = stringOrEmpty(entry, "name");
        item.short_name = stringOrEmpty(entry, "shortName");
        item.normalized_name = stringOrEmpty(entry, "normalizedName");
        item.width = static_cast<int>(numberOrZero(entry, "width"));
        item.height = static_cast<int>(numberOrZero(entry, "height"));
        item.avg_24h_price = numberOrZero(entry, "avg24hPrice");
        if (item.name.empty())
            continue;

        auto offers = entry.find("sellFor");
        if (offers != entry.end() && offers->is_array())
        {
            for (const auto &o : *offers)
            {
                SellOffer offer;
                offer.source = stringOrEmpty(o, "source");
                offer.currency = stringOrEmpty(o, "currency");
                offer.price = numberOrZero(o, "price");
                offer.price_rub = numberOrZero(o, "priceRUB");
                auto vendor = o.find("vendor");
                if (vendor != o.end() && vendor->is_object())
                    offer.vendor = stringOrEmpty(*vendor, "name");
                item.sell_for.push_back(offer);
            }
        }
        parsed.push_back(std::move(item));
    }
    return parsed;
}

optional<PriceRecord> CatalogClient::bestTraderOffer(const CatalogItem &item)
{
    const SellOffer *best = nullptr;
    for (const auto &offer : item.sell_for)
    {
        // Flea market is not a trader
        if (offer.source == "fleaMarket" || offer.source == "flea-market")
            continue;
        if (offer.price_rub > 0 && (!best || offer.price_rub > best->price_rub))
            best = &offer;
    }

    if (!best)
        return nullopt;

    PriceRecord record;
    record.amount = best->price_rub;
    record.currency = "RUB";
    record.trader = best->vendor.empty() ? best->source : best->vendor;
    record.acquired = chrono::system_clock::now();
    return record;
}

void CatalogClient::rateLimit()
{
    auto now = chrono::steady_clock::now();
    auto elapsed = now - last_request_;
    if (elapsed < options_.min_request_interval)
        this_thread::sleep_for(options_.min_request_interval - elapsed);
    last_request_ = chrono::steady_clock::now();
}

optional<json> CatalogClient::executeQuery(const string &query, int attempts)
{
    httplib::Client client(options_.base_url);
    if (!client.is_valid())
    {
        log_error("Unsupported catalog URL: " + options_.base_url);
        return nullopt;
    }
    client.set_connection_timeout(options_.timeout_s, 0);
    client.set_read_timeout(options_.timeout_s, 0);
    client.set_write_timeout(options_.timeout_s, 0);

    const string body = json{{"query", query}}.dump();

    for (int attempt = 1; attempt <= attempts; attempt++)
    {
        rateLimit();
        auto res = client.Post(options_.endpoint, body, "application/json");
        if (!res)
        {
            log_warning("Catalog request failed on attempt " + log_string(attempt) + ": " + httplib::to_string(res.error()));
            continue;
        }
        if (res->status != 200)
        {
            log_warning("Catalog answered HTTP " + log_string(res->status) + " on attempt " + log_string(attempt));
            continue;
        }

        try
        {
            json reply = json::parse(res->body);
            if (reply.contains("errors"))
            {
                // Query problems don't go away by asking again
                log_error("Catalog query errors: " + reply["errors"].dump());
                return nullopt;
            }
            if (!reply.contains("data"))
            {
                log_warning("Catalog reply without data on attempt " + log_string(attempt));
                continue;
            }
            return reply["data"];
        }
        catch (const json::exception &e)
        {
            log_warning("Malformed catalog reply on attempt " + log_string(attempt) + ": " + e.what());
        }
    }

    log_error("All " + log_string(attempts) + " attempts to query the catalog failed");
    return nullopt;
}

vector<CatalogItem> CatalogClient::fetchItems(int attempts)
{
    log_info("Fetching all items from " + options_.base_url);

    optional<json> data = executeQuery(ITEMS_QUERY, attempts);
    if (!data || !data->contains("items"))
    {
        log_error("Failed to fetch items from catalog");
        return {};
    }

    vector<CatalogItem> items = parseItems((*data)["items"]);
    log_info("Fetched " + log_string(items.size()) + " items from catalog");
    return items;
}

vector<CatalogItem> CatalogClient::fetchAllItems()
{
    vector<CatalogItem> items = fetchItems(options_.attempts);
    if (!items.empty())
    {
        refresh_failed_at_.reset();
        index(items, chrono::system_clock::now());
        saveCache();
    }
    return items;
}

void CatalogClient::index(vector<CatalogItem> items, chrono::system_clock::time_point fetched_at)
{
    items_ = std::move(items);
    fetched_at_ = fetched_at;
    by_key_.clear();
    for (size_t i = 0; i < items_.size(); i++)
    {
        const CatalogItem &item = items_[i];
        by_key_.emplace(item.name, i);
        if (!item.normalized_name.empty())
            by_key_.emplace(item.normalized_name, i);
        by_key_.emplace(names::sanitize(item.name), i);
    }
}

const CatalogItem *CatalogClient::findItem(const string &identifier) const
{
    auto it = by_key_.find(identifier);
    if (it == by_key_.end())
        it = by_key_.find(names::normalize(identifier));
    return it == by_key_.end() ? nullptr : &items_[it->second];
}

void CatalogClient::refresh()
{
    if (refresh_failed_at_ && chrono::steady_clock::now() - *refresh_failed_at_ < options_.refresh_backoff)
    {
        if (items_.empty())
            throw PriceSourceError("catalog unavailable, waiting before the next refresh");
        return;
    }

    vector<CatalogItem> items = fetchItems(1);
    if (!items.empty())
    {
        refresh_failed_at_.reset();
        index(std::move(items), chrono::system_clock::now());
        saveCache();
        return;
    }

    refresh_failed_at_ = chrono::steady_clock::now();
    if (items_.empty())
        throw PriceSourceError("catalog unavailable");

    log_warning("Catalog refresh failed, using data from " +
                log_string(chrono::duration_cast<chrono::minutes>(chrono::system_clock::now() - fetched_at_).count()) +
                " minutes ago");
}

optional<PriceRecord> CatalogClient::getBestPrice(const string &identifier)
{
    bool stale = chrono::system_clock::now() - fetched_at_ > options_.cache_max_age;
    if ((items_.empty() || stale) && !loadCache())
        refresh();

    const CatalogItem *item = findItem(identifier);
    if (!item)
        return nullopt;
    return bestTraderOffer(*item);
}

optional<PriceRecord> CatalogClient::fetchPrice(const string &item_id)
{
    return getBestPrice(item_id);
}

bool CatalogClient::loadCache()
{
    ifstream file(options_.cache_file);
    if (!file)
        return false;

    try
    {
        json cache = json::parse(file);
        auto fetched_at = chrono::system_clock::time_point(chrono::seconds(cache.at("timestamp").get<int64_t>()));
        if (chrono::system_clock::now() - fetched_at > options_.cache_max_age)
        {
            log_debug("Catalog cache is too old, will fetch fresh data");
            return false;
        }

        vector<CatalogItem> items = parseItems(cache.at("items"));
        if (items.empty())
            return false;

        index(std::move(items), fetched_at);
        log_info("Loaded " + log_string(items_.size()) + " catalog items from cache");
        return true;
    }
    catch (const json::exception &e)
    {
        log_warning("Error loading catalog cache: " + string(e.what()));
        return false;
    }
}

bool CatalogClient::saveCache() const
{
    std::error_code ec;
    auto parent = filesystem::path(options_.cache_file).parent_path();
    if (!parent.empty())
        filesystem::create_directories(parent, ec);

    json items = json::array();
    for (const auto &item : items_)
        items.push_back(toJson(item));

    json cache = {{"timestamp", chrono::duration_cast<chrono::seconds>(fetched_at_.time_since_epoch()).count()},
                  {"items", items}};

    ofstream file(options_.cache_file);
    if (!file)
    {
        log_error("Failed to open catalog cache for writing: " + options_.cache_file);
        return false;
    }
    file << cache.dump(2);
    if (!file.good())
    {
        log_error("Failed to write catalog cache");
        return false;
    }

    log_debug("Cached " + log_string(items_.size()) + " catalog items to " + options_.cache_file);
    return true;
}
