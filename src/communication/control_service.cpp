#include "control_service.hpp"
#include "utils/logging.hpp"
#include <chrono>
#include <nlohmann/json.hpp>

using namespace std;
using json = nlohmann::json;

ControlService::ControlService(shared_ptr<ControlQueue> queue,
                               shared_ptr<const PriceOverlay> overlay,
                               StatusFn status,
                               int port,
                               string host)
    : queue_(std::move(queue)), overlay_(std::move(overlay)), status_(std::move(status)), port_(port), host_(std::move(host))
{
}

ControlService::~ControlService()
{
    stop();
}

void ControlService::enqueue(const httplib::Request &req, httplib::Response &res, ControlSignal signal)
{
    log_debug("Control request " + req.path + " from " + req.remote_addr);
    queue_->push(signal);

    json body;
    body["status"] = "queued";
    body["signal"] = toString(signal);
    res.status = 202;
    res.set_content(body.dump(), "application/json");
}

void ControlService::registerRoutes()
{
    server_->set_default_headers({{"Access-Control-Allow-Origin", "*"},
                                  {"Access-Control-Allow-Methods", "GET, POST, OPTIONS"},
                                  {"Access-Control-Allow-Headers", "Content-Type"}});

    server_->Post("/scan/start", [this](const httplib::Request &req, httplib::Response &res)
                  { enqueue(req, res, ControlSignal::StartScanning); });
    server_->Post("/scan/stop", [this](const httplib::Request &req, httplib::Response &res)
                  { enqueue(req, res, ControlSignal::StopScanning); });
    server_->Post("/overlay/show", [this](const httplib::Request &req, httplib::Response &res)
                  { enqueue(req, res, ControlSignal::ShowOverlay); });
    server_->Post("/overlay/hide", [this](const httplib::Request &req, httplib::Response &res)
                  { enqueue(req, res, ControlSignal::HideOverlay); });
    server_->Post("/shutdown", [this](const httplib::Request &req, httplib::Response &res)
                  { enqueue(req, res, ControlSignal::Terminate); });

    // Health check
    server_->Get("/health", [](const httplib::Request &, httplib::Response &res)
                 { res.set_content("{\"status\":\"ok\",\"service\":\"StashScan\"}", "application/json"); });

    server_->Get("/status", [this](const httplib::Request &, httplib::Response &res)
                 {
        if (!status_) {
            res.status = 503;
            res.set_content("{\"error\":\"status unavailable\"}", "application/json");
            return;
        }
        res.set_content(status_(), "application/json"); });

    server_->Get("/overlay", [this](const httplib::Request &, httplib::Response &res)
                 { res.set_content(overlay_->toJson(), "application/json"); });

    server_->set_exception_handler([](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep)
                                   {
        string message = "unknown error";
        try {
            rethrow_exception(ep);
        } catch (const exception &e) {
            message = e.what();
        }
        log_error("Request " + req.path + " failed: " + message);
        json body;
        body["error"] = message;
        res.status = 500;
        res.set_content(body.dump(), "application/json"); });
}

bool ControlService::start()
{
    if (running_)
        return true;

    server_ = make_unique<httplib::Server>();
    registerRoutes();

    if (!server_->bind_to_port(host_, port_))
    {
        log_error("Control service cannot bind " + host_ + ":" + to_string(port_));
        server_.reset();
        return false;
    }

    running_ = true;
    worker_thread_ = thread([this]()
                            {
        if (!server_->listen_after_bind())
            log_debug("Control service listener returned");
        running_ = false; });

    log_info("Control service listening on http://" + host_ + ":" + to_string(port_));
    return true;
}

void ControlService::stop()
{
    if (server_)
        server_->stop();

    if (worker_thread_.joinable())
        worker_thread_.join();

    if (server_)
    {
        server_.reset();
        log_info("Control service stopped");
    }
    running_ = false;
}
