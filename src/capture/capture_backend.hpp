#pragma once
#include <memory>
#include <string>
#include <opencv2/core.hpp>
#include "frame.hpp"

// A way of reading screen pixels. One instance holds one capture context
// (display connection, shared memory segment) and must stay on one thread.
class CaptureBackend
{
public:
    virtual ~CaptureBackend() = default;

    virtual std::string name() const = 0;

    // Fill bgr with the region as CV_8UC3. Returns false and sets error on failure.
    virtual bool grab(const CaptureRegion &region, cv::Mat &bgr, std::string &error) = 0;
};

using CaptureBackendPtr = std::unique_ptr<CaptureBackend>;
