#include "config.hpp"
#include "args.hpp"
#include "logging.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>

using namespace std;
using json = nlohmann::json;

namespace config
{
    namespace
    {
        template <typename T>
        void readKey(const json &j, const char *key, T &out)
        {
            auto it = j.find(key);
            if (it == j.end() || it->is_null())
                return;

            try
            {
                out = it->get<T>();
            }
            catch (const json::exception &e)
            {
                log_warning("Ignoring config key '" + string(key) + "': " + e.what());
            }
        }
    }

    bool loadFile(const string &path, ScannerConfig &cfg)
    {
        ifstream file(path);
        if (!file)
        {
            log_error("Cannot open config file: " + path);
            return false;
        }

        json j;
        try
        {
            j = json::parse(file);
        }
        catch (const json::parse_error &e)
        {
            log_error("Invalid config file " + path + ": " + e.what());
            return false;
        }

        if (!j.is_object())
        {
            log_error("Config file " + path + " must contain a JSON object");
            return false;
        }

        readKey(j, "display", cfg.display_name);
        readKey(j, "region_x", cfg.region_x);
        readKey(j, "region_y", cfg.region_y);
        readKey(j, "region_width", cfg.region_width);
        readKey(j, "region_height", cfg.region_height);

        readKey(j, "dark_threshold", cfg.dark_threshold);
        readKey(j, "min_region_width", cfg.min_region_width);
        readKey(j, "min_region_height", cfg.min_region_height);
        readKey(j, "min_aspect_ratio", cfg.min_aspect_ratio);
        readKey(j, "max_aspect_ratio", cfg.max_aspect_ratio);

        readKey(j, "slot_size", cfg.slot_size);
        readKey(j, "empty_mean_min", cfg.empty_mean_min);
        readKey(j, "empty_mean_max", cfg.empty_mean_max);
        readKey(j, "empty_variance_max", cfg.empty_variance_max);

        readKey(j, "templates_dir", cfg.templates_dir);
        readKey(j, "confidence_threshold", cfg.confidence_threshold);

        readKey(j, "catalog_url", cfg.catalog_url);
        readKey(j, "catalog_cache_file", cfg.catalog_cache_file);
        readKey(j, "price_cache_file", cfg.price_cache_file);
        readKey(j, "price_cache_hours", cfg.price_cache_hours);
        readKey(j, "request_timeout_s", cfg.request_timeout_s);
        readKey(j, "request_attempts", cfg.request_attempts);

        readKey(j, "scan_interval_ms", cfg.scan_interval_ms);
        readKey(j, "poll_interval_ms", cfg.poll_interval_ms);
        readKey(j, "shutdown_grace_ms", cfg.shutdown_grace_ms);
        readKey(j, "report_queue_capacity", cfg.report_queue_capacity);

        readKey(j, "control_port", cfg.control_port);
        readKey(j, "autostart", cfg.autostart);
        readKey(j, "debug", cfg.debug);
        readKey(j, "quiet", cfg.quiet);
        readKey(j, "log_file", cfg.log_file);

        log_info("Loaded configuration from " + path);
        return true;
    }

    bool parseRegion(const string &text, ScannerConfig &cfg)
    {
        vector<string> parts = splitString(text);
        if (parts.size() != 4)
            return false;

        int values[4];
        try
        {
            for (int i = 0; i < 4; i++)
                values[i] = stoi(parts[i]);
        }
        catch (const exception &)
        {
            return false;
        }

        if (values[2] <= 0 || values[3] <= 0)
            return false;

        cfg.region_x = values[0];
        cfg.region_y = values[1];
        cfg.region_width = values[2];
        cfg.region_height = values[3];
        return true;
    }

    void applyArgs(int argc, char **argv, ScannerConfig &cfg)
    {
        cfg.templates_dir = getArg(argc, argv, "--templates", cfg.templates_dir);
        cfg.display_name = getArg(argc, argv, "--display", cfg.display_name);
        cfg.catalog_url = getArg(argc, argv, "--catalog-url", cfg.catalog_url);
        cfg.price_cache_file = getArg(argc, argv, "--price-cache", cfg.price_cache_file);
        cfg.log_file = getArg(argc, argv, "--log-file", cfg.log_file);

        // --interval is given in seconds like the rest of the user-facing timings
        double interval_s = getArg(argc, argv, "--interval", cfg.scan_interval_ms / 1000.0);
        cfg.scan_interval_ms = static_cast<int>(interval_s * 1000.0);

        cfg.confidence_threshold = getArg(argc, argv, "--threshold", cfg.confidence_threshold);
        cfg.control_port = getArg(argc, argv, "--port", cfg.control_port);

        string region = getArg(argc, argv, "--region", "");
        if (!region.empty() && !parseRegion(region, cfg))
        {
            log_error("Invalid --region '" + region + "', expected x,y,width,height");
        }

        if (hasFlag(argc, argv, "--autostart"))
            cfg.autostart = true;
        if (hasFlag(argc, argv, "--debug") || hasFlag(argc, argv, "-d"))
            cfg.debug = true;
        if (hasFlag(argc, argv, "--quiet") || hasFlag(argc, argv, "-q"))
            cfg.quiet = true;
    }

    bool validate(const ScannerConfig &cfg)
    {
        bool ok = true;
        auto fail = [&ok](const string &message)
        {
            log_error("Invalid configuration: " + message);
            ok = false;
        };

        if (cfg.slot_size <= 0)
            fail("slot_size must be positive");
        if (cfg.confidence_threshold < 0.0 || cfg.confidence_threshold > 1.0)
            fail("confidence_threshold must be in [0, 1]");
        if (cfg.min_aspect_ratio >= cfg.max_aspect_ratio)
            fail("min_aspect_ratio must be below max_aspect_ratio");
        if (cfg.empty_mean_min >= cfg.empty_mean_max)
            fail("empty_mean_min must be below empty_mean_max");
        if (cfg.scan_interval_ms < 0)
            fail("scan interval must not be negative");
        if (cfg.poll_interval_ms <= 0)
            fail("poll_interval_ms must be positive");
        if (cfg.shutdown_grace_ms < 0)
            fail("shutdown_grace_ms must not be negative");
        if (cfg.report_queue_capacity <= 0)
            fail("report_queue_capacity must be positive");
        if (cfg.request_attempts <= 0)
            fail("request_attempts must be positive");
        if (cfg.request_timeout_s <= 0)
            fail("request_timeout_s must be positive");
        if (cfg.price_cache_hours <= 0.0)
            fail("price_cache_hours must be positive");
        if (cfg.control_port < 0 || cfg.control_port > 65535)
            fail("control_port out of range");
        if (cfg.region_width < 0 || cfg.region_height < 0)
            fail("capture region size must not be negative");

        return ok;
    }

    chrono::seconds priceCacheDuration(const ScannerConfig &cfg)
    {
        return chrono::seconds(max<int64_t>(1, llround(cfg.price_cache_hours * 3600.0)));
    }

    string toJson(const ScannerConfig &cfg)
    {
        json j;
        j["display"] = cfg.display_name;
        j["region"] = {cfg.region_x, cfg.region_y, cfg.region_width, cfg.region_height};
        j["templates_dir"] = cfg.templates_dir;
        j["confidence_threshold"] = cfg.confidence_threshold;
        j["scan_interval_ms"] = cfg.scan_interval_ms;
        j["price_cache_hours"] = cfg.price_cache_hours;
        j["catalog_url"] = cfg.catalog_url;
        j["control_port"] = cfg.control_port;
        j["autostart"] = cfg.autostart;
        j["debug"] = cfg.debug;
        return j.dump();
    }

} // namespace config
