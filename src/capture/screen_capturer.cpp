#include "screen_capturer.hpp"
#include "x11_capture.hpp"
#include "utils/logging.hpp"

using namespace std;

CaptureSession::CaptureSession(const CaptureRegion &region, BackendFactory primary, BackendFactory secondary)
    : region_(region), primary_factory_(std::move(primary)), secondary_factory_(std::move(secondary))
{
}

bool CaptureSession::tryBackend(CaptureBackendPtr &backend, const BackendFactory &factory, const char *label,
                                cv::Mat &bgr, string &error)
{
    if (!factory)
    {
        error = string(label) + " backend not configured";
        return false;
    }

    try
    {
        if (!backend)
            backend = factory();
        if (!backend)
        {
            error = string(label) + " backend unavailable";
            return false;
        }

        string grab_error;
        if (backend->grab(region_, bgr, grab_error) && !bgr.empty())
            return true;

        error = backend->name() + ": " + (grab_error.empty() ? "empty image" : grab_error);
    }
    catch (const exception &e)
    {
        error = string(label) + " backend threw: " + e.what();
    }
    return false;
}

CaptureResult CaptureSession::capture()
{
    if (!region_.valid())
        return CaptureResult::failure("no capture region (display unavailable?)");

    CaptureResult result;
    result.frame.region = region_;

    string primary_error;
    if (tryBackend(primary_, primary_factory_, "primary", result.frame.image, primary_error))
    {
        result.success = true;
        result.backend = primary_->name();
        return result;
    }

    log_debug("Primary capture failed (" + primary_error + "), retrying with fallback");

    string secondary_error;
    if (tryBackend(secondary_, secondary_factory_, "secondary", result.frame.image, secondary_error))
    {
        result.success = true;
        result.backend = secondary_->name();
        return result;
    }

    return CaptureResult::failure("capture failed: " + primary_error + "; " + secondary_error);
}

ScreenCapturer::ScreenCapturer(const string &display_name, const CaptureRegion &region_override)
    : display_name_(display_name), region_override_(region_override)
{
}

CaptureRegion ScreenCapturer::findCaptureRegion() const
{
    if (region_override_.valid())
        return region_override_;

    optional<CaptureRegion> bounds = x11_capture::queryScreenBounds(display_name_);
    return bounds ? *bounds : CaptureRegion();
}

unique_ptr<CaptureSession> ScreenCapturer::openSession() const
{
    CaptureRegion region = findCaptureRegion();
    if (!region.valid())
        log_warning("No usable capture region, captures will fail until restarted");

    string display = display_name_;
    return make_unique<CaptureSession>(
        region,
        [display]()
        { return make_unique<x11_capture::ShmBackend>(display); },
        [display]()
        { return make_unique<x11_capture::GetImageBackend>(display); });
}
