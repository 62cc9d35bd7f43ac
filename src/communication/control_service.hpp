#pragma once
#include "control_queue.hpp"
#include "overlay/price_overlay.hpp"
#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>

// Local HTTP control surface. Handlers only enqueue signals or read state,
// nothing here drives the scanner directly.
class ControlService
{
public:
    // Returns the JSON body for GET /status
    using StatusFn = std::function<std::string()>;

    ControlService(std::shared_ptr<ControlQueue> queue,
                   std::shared_ptr<const PriceOverlay> overlay,
                   StatusFn status,
                   int port = 13521,
                   std::string host = "127.0.0.1");
    ~ControlService();

    ControlService(const ControlService &) = delete;
    ControlService &operator=(const ControlService &) = delete;

    // false if the port could not be bound
    bool start();
    void stop();
    bool isRunning() const { return running_; }
    int port() const { return port_; }

private:
    void registerRoutes();
    void enqueue(const httplib::Request &req, httplib::Response &res, ControlSignal signal);

    std::shared_ptr<ControlQueue> queue_;
    std::shared_ptr<const PriceOverlay> overlay_;
    StatusFn status_;
    std::unique_ptr<httplib::Server> server_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    int port_;
    std::string host_;
};
