#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <opencv2/core.hpp>

struct TraderPrice
{
    int64_t price = 0;
    std::string trader;
    std::string currency = "RUB";
};

// Sidecar <name>.json written by the catalog builder next to every icon
struct ItemMetadata
{
    std::string name;       // Display name
    std::string short_name;
    int grid_width = 1;     // Footprint in inventory cells
    int grid_height = 1;
    std::optional<TraderPrice> trader_price;
    int64_t avg_flea_price = 0;
};

struct ItemTemplate
{
    std::string id; // Sanitized file stem, unique in the library
    cv::Mat icon;   // BGR reference icon, normally 63x63
    ItemMetadata metadata;
};

// Reference icons loaded once at startup. Read-only afterwards, so it can be
// shared by any number of matchers without locking.
class TemplateLibrary
{
public:
    // Loads every <name>.png (plus optional <name>.json) in file name order.
    // A missing directory is created empty and reported as false.
    bool loadDirectory(const std::string &directory);

    // Appends in library order. Returns false for an empty icon or a duplicate id.
    bool add(ItemTemplate item);

    const std::vector<ItemTemplate> &templates() const { return templates_; }
    const ItemTemplate *find(const std::string &id) const;
    size_t size() const { return templates_.size(); }
    bool empty() const { return templates_.empty(); }

    static std::optional<ItemMetadata> parseMetadata(const std::string &json_text);

private:
    std::vector<ItemTemplate> templates_;
};
