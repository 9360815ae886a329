#pragma once
#include <atomic>
#include <memory>
#include <string>
#include <thread>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include "errors/error_store.hpp"
#include "status_provider.hpp"

// Read-only REST surface for dashboards:
//   GET /health, /state, /performance, /session,
//   GET /errors/summary?hours=N, /errors?severity=&category=&component=&hours=&limit=
class DashboardService
{
public:
    DashboardService(StatusProvider &status, ErrorStore &errors, int port = 13520);
    ~DashboardService();

    void start();
    void stop();
    bool isRunning() const { return running_; }
    int port() const { return port_; }

    // Query string -> filter. Throws std::invalid_argument on unknown names or bad numbers
    static ErrorFilter filterFromParams(const httplib::Params &params);

private:
    void run();
    void registerRoutes();

    StatusProvider &status_;
    ErrorStore &errors_;
    std::thread worker_thread_;
    std::atomic<bool> running_{false};
    std::unique_ptr<httplib::Server> server_;
    int port_;
};
