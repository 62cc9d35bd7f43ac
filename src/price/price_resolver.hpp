#pragma once
#include <chrono>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include "price_source.hpp"

// Item id -> value, in this order:
//   1. cached record younger than the cache duration
//   2. live source, a few attempts, result cached
//   3. built-in table of well known valuables
// Owned by the scan loop and used from that thread only, hence no locking.
// Running scans concurrently would need a mutex around the cache.
class PriceResolver
{
public:
    using Clock = std::chrono::system_clock;
    using NowFn = std::function<Clock::time_point()>;

    static constexpr int DEFAULT_ATTEMPTS = 3;

    // source may be null (offline mode: cache and built-in table only)
    explicit PriceResolver(std::shared_ptr<PriceSource> source,
                           std::chrono::seconds cache_duration = std::chrono::hours(6),
                           int attempts = DEFAULT_ATTEMPTS,
                           NowFn now = &Clock::now);

    // Never throws; nullopt means no price anywhere
    std::optional<PriceRecord> getPrice(const std::string &item_id);

    // Cache only, expired entries count as absent
    std::optional<PriceRecord> cached(const std::string &item_id) const;
    void store(const std::string &item_id, const PriceRecord &record);

    std::optional<PriceRecord> fallback(const std::string &item_id) const;

    bool saveCache(const std::string &path) const;
    bool loadCache(const std::string &path);

    size_t cacheSize() const { return cache_.size(); }
    std::chrono::seconds cacheDuration() const { return cache_duration_; }

    // Static price table used when the live source has nothing
    static const std::map<std::string, PriceRecord> &fallbackTable();

private:
    bool isFresh(const PriceRecord &record) const;

    std::shared_ptr<PriceSource> source_;
    std::chrono::seconds cache_duration_;
    int attempts_;
    NowFn now_;
    std::unordered_map<std::string, PriceRecord> cache_;
};
