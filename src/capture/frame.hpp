#pragma once
#include <string>
#include <opencv2/core.hpp>

// Screen area to grab, in screen coordinates
struct CaptureRegion
{
    int top = 0;
    int left = 0;
    int width = 0;
    int height = 0;

    bool valid() const { return width > 0 && height > 0; }
};

// One captured screen image (CV_8UC3, BGR) tagged with where it came from
struct Frame
{
    cv::Mat image;
    CaptureRegion region;
};

struct CaptureResult
{
    bool success = false;
    Frame frame;
    std::string backend; // Backend that produced the frame
    std::string error;   // Set when success is false

    explicit operator bool() const { return success; }

    static CaptureResult failure(const std::string &message)
    {
        CaptureResult result;
        result.error = message;
        return result;
    }
};

// Anything the scan loop can pull frames from. Implementations are used by a
// single thread only.
class FrameSource
{
public:
    virtual ~FrameSource() = default;

    // Never throws for expected failures, reports them in the result instead
    virtual CaptureResult capture() = 0;
};
