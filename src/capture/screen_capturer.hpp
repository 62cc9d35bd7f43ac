#pragma once
#include <functional>
#include <memory>
#include <string>
#include "capture_backend.hpp"
#include "frame.hpp"

using BackendFactory = std::function<CaptureBackendPtr()>;

// Capture context of one worker. Backends are created on first use, on the
// thread that captures, and released with the session. Never share a session
// between threads; every worker opens its own.
class CaptureSession : public FrameSource
{
public:
    CaptureSession(const CaptureRegion &region, BackendFactory primary, BackendFactory secondary);
    ~CaptureSession() override = default;

    CaptureSession(const CaptureSession &) = delete;
    CaptureSession &operator=(const CaptureSession &) = delete;

    // Primary backend, then one retry on the secondary
    CaptureResult capture() override;

    const CaptureRegion &region() const { return region_; }

private:
    bool tryBackend(CaptureBackendPtr &backend, const BackendFactory &factory, const char *label,
                    cv::Mat &bgr, std::string &error);

    CaptureRegion region_;
    BackendFactory primary_factory_;
    BackendFactory secondary_factory_;
    CaptureBackendPtr primary_;
    CaptureBackendPtr secondary_;
};

// Hands out capture sessions for a display. Only holds configuration, so it
// can be shared freely; the per-thread state lives in the sessions.
class ScreenCapturer
{
public:
    // A region with zero size means "whole screen"
    ScreenCapturer(const std::string &display_name, const CaptureRegion &region_override = CaptureRegion());

    // Best effort: no window lookup, the configured region or the full screen.
    // Returns an invalid region when the display can't be reached.
    CaptureRegion findCaptureRegion() const;

    std::unique_ptr<CaptureSession> openSession() const;

private:
    std::string display_name_;
    CaptureRegion region_override_;
};
