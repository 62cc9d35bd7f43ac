#include "test_helpers.hpp"
#include <fstream>
#include <random>
#include <stdexcept>
#include <opencv2/imgproc.hpp>

namespace test_helpers
{
    cv::Mat makeScreen(int width, int height, int level)
    {
        return cv::Mat(height, width, CV_8UC3, cv::Scalar(level, level, level));
    }

    void drawInventory(cv::Mat &frame, const cv::Rect &rect, int level)
    {
        frame(rect).setTo(cv::Scalar(level, level, level));
    }

    cv::Mat makeIcon(uint64_t seed, int size)
    {
        cv::Mat icon(size, size, CV_8UC3);
        cv::RNG rng(seed);
        rng.fill(icon, cv::RNG::UNIFORM, cv::Scalar::all(0), cv::Scalar::all(256));
        cv::rectangle(icon, cv::Rect(0, 0, size, size), cv::Scalar(10, 10, 10), 1);
        return icon;
    }

    cv::Mat makeEmptySlot(int size)
    {
        cv::Mat slot(size, size, CV_8UC3, cv::Scalar(60, 60, 60));
        cv::rectangle(slot, cv::Rect(0, 0, size, size), cv::Scalar(45, 45, 45), 1);
        return slot;
    }

    void paintSlot(cv::Mat &frame, const cv::Rect &inventory, int row, int col, const cv::Mat &content)
    {
        cv::Rect cell(inventory.x + col * content.cols, inventory.y + row * content.rows, content.cols, content.rows);
        content.copyTo(frame(cell));
    }

    TempDir::TempDir()
    {
        std::random_device rd;
        path_ = std::filesystem::temp_directory_path() / ("stashscan_test_" + std::to_string(rd()));
        std::filesystem::create_directories(path_);
    }

    TempDir::~TempDir()
    {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    void writeFile(const std::string &path, const std::string &content)
    {
        std::ofstream file(path);
        file << content;
    }

    CaptureResult frameResult(const cv::Mat &image)
    {
        CaptureResult result;
        result.success = true;
        result.backend = "fake";
        result.frame.image = image;
        result.frame.region.width = image.cols;
        result.frame.region.height = image.rows;
        return result;
    }

    std::optional<PriceRecord> FakePriceSource::fetchPrice(const std::string &item_id)
    {
        calls++;
        if (always_fail)
            throw PriceSourceError("source down");
        if (failures_before_success > 0)
        {
            failures_before_success--;
            throw PriceSourceError("temporary failure");
        }

        auto it = prices.find(item_id);
        if (it == prices.end())
            return std::nullopt;
        return it->second;
    }

    void FakePriceSource::set(const std::string &id, int64_t amount, const std::string &trader)
    {
        PriceRecord record;
        record.amount = amount;
        record.trader = trader;
        prices[id] = record;
    }

    void Gate::release()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            open = true;
        }
        cv.notify_all();
    }

    void Gate::wait()
    {
        entered = true;
        std::unique_lock<std::mutex> lock(mutex);
        cv.wait(lock, [this]()
                { return open; });
    }

} // namespace test_helpers
