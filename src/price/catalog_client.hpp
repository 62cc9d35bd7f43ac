#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include <nlohmann/json_fwd.hpp>
#include "price_source.hpp"

struct SellOffer
{
    std::string source; // "fleaMarket" or a trader's normalized name
    std::string vendor; // Display name of the buyer
    std::string currency;
    int64_t price = 0;
    int64_t price_rub = 0;
};

struct CatalogItem
{
    std::string id;
    std::string name;
    std::string short_name;
    std::string normalized_name;
    int width = 1;
    int height = 1;
    int64_t avg_24h_price = 0;
    std::vector<SellOffer> sell_for;
};

// Client of the public item catalog (GraphQL over HTTP). The whole catalog is
// fetched once, kept in memory and mirrored to a JSON file, so price lookups
// after the first one are local. Not thread safe: used from the scan loop only.
class CatalogClient : public PriceSource
{
public:
    struct Options
    {
        std::string base_url = "https://api.tarkov.dev";
        std::string endpoint = "/graphql";
        std::string cache_file = "data/cache/all_items.json";
        std::chrono::seconds cache_max_age{6 * 3600};
        int timeout_s = 10;
        int attempts = 3;
        std::chrono::milliseconds min_request_interval{100};
        std::chrono::seconds refresh_backoff{60}; // No network after a failed refresh for this long
    };

    explicit CatalogClient(Options options);

    // Every catalog item; empty on failure after all attempts
    std::vector<CatalogItem> fetchAllItems();

    // Best trader offer (highest price in roubles, flea market excluded).
    // Item matched by name, normalized name or sanitized name. Refreshes a
    // missing or stale catalog first; throws PriceSourceError when there is
    // no catalog data at all.
    std::optional<PriceRecord> getBestPrice(const std::string &identifier);

    // PriceSource: one request per call, the caller owns the retry policy
    std::optional<PriceRecord> fetchPrice(const std::string &item_id) override;

    const CatalogItem *findItem(const std::string &identifier) const;

    bool loadCache();
    bool saveCache() const;

    static std::vector<CatalogItem> parseItems(const nlohmann::json &items);
    static std::optional<PriceRecord> bestTraderOffer(const CatalogItem &item);

private:
    std::optional<nlohmann::json> executeQuery(const std::string &query, int attempts);
    std::vector<CatalogItem> fetchItems(int attempts);
    void refresh();
    void index(std::vector<CatalogItem> items, std::chrono::system_clock::time_point fetched_at);
    void rateLimit();

    Options options_;
    std::vector<CatalogItem> items_;
    std::unordered_map<std::string, size_t> by_key_; // name / normalized / sanitized -> items_ index
    std::chrono::system_clock::time_point fetched_at_{};
    std::chrono::steady_clock::time_point last_request_{};
    std::optional<std::chrono::steady_clock::time_point> refresh_failed_at_;
};
