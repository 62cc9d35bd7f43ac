#pragma once
#include <chrono>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

struct PriceRecord
{
    int64_t amount = 0;
    std::string currency = "RUB";
    std::string trader;
    std::chrono::system_clock::time_point acquired; // When the value was obtained

    bool operator==(const PriceRecord &other) const
    {
        return amount == other.amount && currency == other.currency &&
               trader == other.trader && acquired == other.acquired;
    }
    bool operator!=(const PriceRecord &other) const { return !(*this == other); }
};

// Source could not be reached or answered garbage; worth another attempt
class PriceSourceError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Live price lookup
class PriceSource
{
public:
    virtual ~PriceSource() = default;

    // nullopt: the source answered and does not know the item.
    // Throws PriceSourceError when it could not answer at all.
    virtual std::optional<PriceRecord> fetchPrice(const std::string &item_id) = 0;
};
