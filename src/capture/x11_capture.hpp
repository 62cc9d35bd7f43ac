#pragma once
#include <memory>
#include <optional>
#include <string>
#include "capture_backend.hpp"

// Xlib headers define None, Bool, Status... as macros, keep them out of here.

namespace x11_capture
{
    // Bounds of the default screen of the display, nullopt if it can't be opened
    std::optional<CaptureRegion> queryScreenBounds(const std::string &display_name);

    // MIT-SHM capture: pixels are copied by the server into a shared memory
    // segment that is kept between grabs and reallocated when the size changes.
    class ShmBackend : public CaptureBackend
    {
    public:
        explicit ShmBackend(const std::string &display_name);
        ~ShmBackend() override;

        std::string name() const override { return "x11-shm"; }
        bool grab(const CaptureRegion &region, cv::Mat &bgr, std::string &error) override;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };

    // Plain XGetImage round trip, slower but works on any X server
    class GetImageBackend : public CaptureBackend
    {
    public:
        explicit GetImageBackend(const std::string &display_name);
        ~GetImageBackend() override;

        std::string name() const override { return "x11-getimage"; }
        bool grab(const CaptureRegion &region, cv::Mat &bgr, std::string &error) override;

    private:
        struct Impl;
        std::unique_ptr<Impl> impl_;
    };

} // namespace x11_capture
