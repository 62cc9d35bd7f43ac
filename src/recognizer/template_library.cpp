#include "template_library.hpp"
#include "utils/logging.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <nlohmann/json.hpp>
#include <opencv2/imgcodecs.hpp>

using namespace std;
using json = nlohmann::json;
namespace fs = std::filesystem;

namespace
{
    // Catalog dumps use null for unknown prices
    int64_t priceOrZero(const json &j, const char *key)
    {
        auto it = j.find(key);
        if (it == j.end() || !it->is_number())
            return 0;
        return static_cast<int64_t>(it->get<double>());
    }
}

optional<ItemMetadata> TemplateLibrary::parseMetadata(const string &json_text)
{
    try
    {
        json j = json::parse(json_text);
        ItemMetadata meta;
        meta.name = j.value("name", "");
        meta.short_name = j.value("short_name", "");
        meta.avg_flea_price = priceOrZero(j, "avg_flea_price");

        auto grid = j.find("grid_size");
        if (grid != j.end() && grid->is_array() && grid->size() == 2)
        {
            meta.grid_width = (*grid)[0].get<int>();
            meta.grid_height = (*grid)[1].get<int>();
        }

        auto trader = j.find("trader_price");
        if (trader != j.end() && trader->is_object())
        {
            TraderPrice price;
            price.price = priceOrZero(*trader, "price");
            price.trader = trader->value("trader", "Unknown");
            price.currency = trader->value("currency", "RUB");
            meta.trader_price = price;
        }

        return meta;
    }
    catch (const json::exception &e)
    {
        log_warning("Invalid item metadata: " + string(e.what()));
        return nullopt;
    }
}

bool TemplateLibrary::add(ItemTemplate item)
{
    if (item.icon.empty() || item.id.empty())
        return false;
    if (find(item.id))
    {
        log_warning("Duplicate template id: " + item.id);
        return false;
    }
    templates_.push_back(std::move(item));
    return true;
}

const ItemTemplate *TemplateLibrary::find(const string &id) const
{
    auto it = find_if(templates_.begin(), templates_.end(),
                      [&id](const ItemTemplate &t)
                      { return t.id == id; });
    return it == templates_.end() ? nullptr : &*it;
}

bool TemplateLibrary::loadDirectory(const string &directory)
{
    std::error_code ec;
    if (!fs::is_directory(directory, ec))
    {
        log_warning("Templates directory " + directory + " not found, creating it");
        fs::create_directories(directory, ec);
        if (ec)
            log_error("Cannot create " + directory + ": " + ec.message());
        return false;
    }

    // Directory iteration order is unspecified, sort for a stable library order
    vector<fs::path> icons;
    for (const auto &entry : fs::directory_iterator(directory, ec))
    {
        if (entry.is_regular_file() && entry.path().extension() == ".png")
            icons.push_back(entry.path());
    }
    if (ec)
    {
        log_error("Cannot list " + directory + ": " + ec.message());
        return false;
    }
    sort(icons.begin(), icons.end());

    size_t loaded = 0;
    for (const auto &icon_path : icons)
    {
        ItemTemplate item;
        item.id = icon_path.stem().string();
        item.icon = cv::imread(icon_path.string(), cv::IMREAD_COLOR);
        if (item.icon.empty())
        {
            log_warning("Cannot read icon " + icon_path.string());
            continue;
        }

        fs::path sidecar = icon_path;
        sidecar.replace_extension(".json");
        ifstream file(sidecar);
        if (file)
        {
            stringstream buffer;
            buffer << file.rdbuf();
            if (auto meta = parseMetadata(buffer.str()))
                item.metadata = *meta;
        }
        if (item.metadata.name.empty())
            item.metadata.name = item.id;

        log_debug("Loaded template for " + item.id);
        if (add(std::move(item)))
            loaded++;
    }

    log_info("Loaded " + log_string(loaded) + " item templates from " + directory);
    return true;
}
