#include "x11_capture.hpp"
#include "utils/logging.hpp"
#include <mutex>
#include <opencv2/imgproc.hpp>

// Xlib last, its macros clash with OpenCV and the standard library
#include <sys/ipc.h>
#include <sys/shm.h>
#include <X11/Xlib.h>
#include <X11/Xutil.h>
#include <X11/extensions/XShm.h>

using namespace std;

namespace x11_capture
{
    namespace
    {
        // Xlib reports protocol errors through a process wide handler whose
        // default implementation exits. Record the code instead; each thread
        // only ever looks at errors raised by its own connection.
        thread_local int lastErrorCode = 0;

        int onXError(Display *, XErrorEvent *event)
        {
            lastErrorCode = event->error_code;
            return 0;
        }

        void initXlib()
        {
            static once_flag once;
            call_once(once, []
                      {
                          XInitThreads();
                          XSetErrorHandler(onXError); });
        }

        Display *openDisplay(const string &display_name)
        {
            initXlib();
            return XOpenDisplay(display_name.empty() ? nullptr : display_name.c_str());
        }

        // ZPixmap with 0xRRGGBB masks is BGRX/BGR in memory on little endian
        bool toBgr(const XImage *image, cv::Mat &bgr, string &error)
        {
            if (image->red_mask != 0xFF0000 || image->green_mask != 0x00FF00 || image->blue_mask != 0x0000FF)
            {
                error = "unsupported visual (masks " + to_string(image->red_mask) + "/" +
                        to_string(image->green_mask) + "/" + to_string(image->blue_mask) + ")";
                return false;
            }

            if (image->bits_per_pixel == 32)
            {
                cv::Mat bgra(image->height, image->width, CV_8UC4, image->data, image->bytes_per_line);
                cv::cvtColor(bgra, bgr, cv::COLOR_BGRA2BGR);
                return true;
            }

            if (image->bits_per_pixel == 24)
            {
                cv::Mat raw(image->height, image->width, CV_8UC3, image->data, image->bytes_per_line);
                raw.copyTo(bgr);
                return true;
            }

            error = "unsupported pixel depth " + to_string(image->bits_per_pixel);
            return false;
        }

        bool checkRegion(Display *display, const CaptureRegion &region, string &error)
        {
            if (!region.valid())
            {
                error = "empty capture region";
                return false;
            }

            int screen = DefaultScreen(display);
            int screenWidth = DisplayWidth(display, screen);
            int screenHeight = DisplayHeight(display, screen);
            if (region.left < 0 || region.top < 0 ||
                region.left + region.width > screenWidth ||
                region.top + region.height > screenHeight)
            {
                error = "capture region " + to_string(region.width) + "x" + to_string(region.height) +
                        "+" + to_string(region.left) + "+" + to_string(region.top) +
                        " outside screen " + to_string(screenWidth) + "x" + to_string(screenHeight);
                return false;
            }
            return true;
        }
    }

    optional<CaptureRegion> queryScreenBounds(const string &display_name)
    {
        Display *display = openDisplay(display_name);
        if (!display)
        {
            log_warning("Cannot open X display '" + display_name + "'");
            return nullopt;
        }

        int screen = DefaultScreen(display);
        CaptureRegion region;
        region.width = DisplayWidth(display, screen);
        region.height = DisplayHeight(display, screen);
        XCloseDisplay(display);

        log_info("Using screen: " + log_string(region.width) + "x" + log_string(region.height));
        return region;
    }

    // ---------------------------------------------------------------- MIT-SHM

    struct ShmBackend::Impl
    {
        Display *display = nullptr;
        bool shmAvailable = false;
        XShmSegmentInfo shminfo{};
        XImage *image = nullptr;
        bool attached = false;

        void release()
        {
            if (attached)
            {
                XShmDetach(display, &shminfo);
                XSync(display, False);
                attached = false;
            }
            if (image)
            {
                // The XShm destroy hook leaves the shared segment alone
                XDestroyImage(image);
                image = nullptr;
            }
            if (shminfo.shmaddr && shminfo.shmaddr != reinterpret_cast<char *>(-1))
            {
                shmdt(shminfo.shmaddr);
            }
            shminfo = XShmSegmentInfo{};
        }

        bool allocate(int width, int height, string &error)
        {
            int screen = DefaultScreen(display);
            image = XShmCreateImage(display, DefaultVisual(display, screen), DefaultDepth(display, screen),
                                    ZPixmap, nullptr, &shminfo, width, height);
            if (!image)
            {
                error = "XShmCreateImage failed";
                return false;
            }

            shminfo.shmid = shmget(IPC_PRIVATE, image->bytes_per_line * image->height, IPC_CREAT | 0600);
            if (shminfo.shmid < 0)
            {
                error = "shmget failed";
                release();
                return false;
            }

            shminfo.shmaddr = image->data = static_cast<char *>(shmat(shminfo.shmid, nullptr, 0));
            // Segment goes away with the last detach
            shmctl(shminfo.shmid, IPC_RMID, nullptr);
            if (shminfo.shmaddr == reinterpret_cast<char *>(-1))
            {
                error = "shmat failed";
                release();
                return false;
            }

            shminfo.readOnly = False;
            lastErrorCode = 0;
            if (!XShmAttach(display, &shminfo))
            {
                error = "XShmAttach failed";
                release();
                return false;
            }
            XSync(display, False);
            if (lastErrorCode != 0)
            {
                error = "XShmAttach rejected by server (X error " + to_string(lastErrorCode) + ")";
                release();
                return false;
            }

            attached = true;
            return true;
        }
    };

    ShmBackend::ShmBackend(const string &display_name) : impl_(make_unique<Impl>())
    {
        impl_->display = openDisplay(display_name);
        if (impl_->display)
        {
            impl_->shmAvailable = XShmQueryExtension(impl_->display);
            log_debug("MIT-SHM " + string(impl_->shmAvailable ? "available" : "not available"));
        }
    }

    ShmBackend::~ShmBackend()
    {
        if (impl_->display)
        {
            impl_->release();
            XCloseDisplay(impl_->display);
        }
    }

    bool ShmBackend::grab(const CaptureRegion &region, cv::Mat &bgr, string &error)
    {
        if (!impl_->display)
        {
            error = "cannot open X display";
            return false;
        }
        if (!impl_->shmAvailable)
        {
            error = "MIT-SHM extension not available";
            return false;
        }
        if (!checkRegion(impl_->display, region, error))
            return false;

        if (!impl_->image || impl_->image->width != region.width || impl_->image->height != region.height)
        {
            impl_->release();
            if (!impl_->allocate(region.width, region.height, error))
                return false;
        }

        lastErrorCode = 0;
        if (!XShmGetImage(impl_->display, DefaultRootWindow(impl_->display), impl_->image,
                          region.left, region.top, AllPlanes))
        {
            error = "XShmGetImage failed";
            return false;
        }
        XSync(impl_->display, False);
        if (lastErrorCode != 0)
        {
            error = "XShmGetImage failed (X error " + to_string(lastErrorCode) + ")";
            return false;
        }

        return toBgr(impl_->image, bgr, error);
    }

    // --------------------------------------------------------------- GetImage

    struct GetImageBackend::Impl
    {
        Display *display = nullptr;
    };

    GetImageBackend::GetImageBackend(const string &display_name) : impl_(make_unique<Impl>())
    {
        impl_->display = openDisplay(display_name);
    }

    GetImageBackend::~GetImageBackend()
    {
        if (impl_->display)
            XCloseDisplay(impl_->display);
    }

    bool GetImageBackend::grab(const CaptureRegion &region, cv::Mat &bgr, string &error)
    {
        if (!impl_->display)
        {
            error = "cannot open X display";
            return false;
        }
        if (!checkRegion(impl_->display, region, error))
            return false;

        lastErrorCode = 0;
        XImage *image = XGetImage(impl_->display, DefaultRootWindow(impl_->display),
                                  region.left, region.top, region.width, region.height,
                                  AllPlanes, ZPixmap);
        if (!image)
        {
            error = "XGetImage failed (X error " + to_string(lastErrorCode) + ")";
            return false;
        }

        bool ok = toBgr(image, bgr, error);
        XDestroyImage(image);
        return ok;
    }

} // namespace x11_capture
