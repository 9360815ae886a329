#include "dashboard_service.hpp"
#include "utils.hpp"

using namespace std;
using json = nlohmann::json;

namespace
{
    void sendJson(httplib::Response &res, const json &body, int status = 200)
    {
        res.status = status;
        res.set_content(body.dump(), "application/json");
    }

    string paramOr(const httplib::Params &params, const string &key, const string &fallback = "")
    {
        auto it = params.find(key);
        return it == params.end() ? fallback : it->second;
    }
}

DashboardService::DashboardService(StatusProvider &status, ErrorStore &errors, int port)
    : status_(status), errors_(errors), port_(port) {}

DashboardService::~DashboardService()
{
    stop();
}

ErrorFilter DashboardService::filterFromParams(const httplib::Params &params)
{
    ErrorFilter filter;

    string severity = paramOr(params, "severity");
    if (!severity.empty())
    {
        filter.severity = severityFromString(severity);
        if (!filter.severity)
            throw invalid_argument("Unknown severity: " + severity);
    }

    string category = paramOr(params, "category");
    if (!category.empty())
    {
        filter.category = categoryFromString(category);
        if (!filter.category)
            throw invalid_argument("Unknown category: " + category);
    }

    string component = paramOr(params, "component");
    if (!component.empty())
        filter.component = component;

    string hours = paramOr(params, "hours");
    if (!hours.empty())
        filter.hours = stod(hours);

    string limit = paramOr(params, "limit");
    if (!limit.empty())
        filter.limit = stoi(limit);

    if (filter.limit <= 0)
        throw invalid_argument("limit must be positive");

    return filter;
}

void DashboardService::start()
{
    if (running_)
        return;

    running_ = true;
    server_ = make_unique<httplib::Server>();
    registerRoutes();
    worker_thread_ = thread(&DashboardService::run, this);
    log_debug("Dashboard service starting on port " + to_string(port_));
}

void DashboardService::stop()
{
    if (!running_.exchange(false))
        return;

    if (server_)
    {
        server_->stop();
    }
    if (worker_thread_.joinable())
    {
        worker_thread_.join();
    }
    log_info("Dashboard service stopped");
}

void DashboardService::run()
{
    log_info("Dashboard listening on http://0.0.0.0:" + to_string(port_) + "/");

    if (!server_->listen("0.0.0.0", port_) && running_)
    {
        errors_.logError(ErrorSeverity::MEDIUM, ErrorCategory::NETWORK, "DashboardService", "run",
                         "Dashboard could not listen", nullptr, {{"port", port_}});
    }
}

void DashboardService::registerRoutes()
{
    // CORS headers
    server_->set_default_headers({{"Access-Control-Allow-Origin", "*"},
                                  {"Access-Control-Allow-Methods", "GET, OPTIONS"},
                                  {"Access-Control-Allow-Headers", "Content-Type"}});

    server_->set_exception_handler([this](const httplib::Request &req, httplib::Response &res, std::exception_ptr ep)
                                   {
        string what = "unknown error";
        try
        {
            rethrow_exception(ep);
        }
        catch (const exception &e)
        {
            what = e.what();
            errors_.logError(ErrorSeverity::LOW, ErrorCategory::NETWORK, "DashboardService", "handle",
                             "Request handler failed on " + req.path, &e);
        }
        catch (...)
        {
            errors_.logError(ErrorSeverity::LOW, ErrorCategory::NETWORK, "DashboardService", "handle",
                             "Request handler failed on " + req.path);
        }
        sendJson(res, {{"error", what}}, 500); });

    server_->Get("/health", [](const httplib::Request &, httplib::Response &res)
                 { sendJson(res, {{"status", "ok"}, {"service", "pokervision"}}); });

    server_->Get("/state", [this](const httplib::Request &, httplib::Response &res)
                 {
        optional<json> state = status_.currentGameState();
        if (!state)
        {
            sendJson(res, {{"error", "no game state yet"}}, 404);
            return;
        }
        sendJson(res, *state); });

    server_->Get("/performance", [this](const httplib::Request &, httplib::Response &res)
                 { sendJson(res, status_.performanceStats()); });

    server_->Get("/session", [this](const httplib::Request &, httplib::Response &res)
                 { sendJson(res, status_.sessionStats()); });

    server_->Get("/errors/summary", [this](const httplib::Request &req, httplib::Response &res)
                 {
        double hours = 24.0;
        try
        {
            if (req.has_param("hours"))
                hours = stod(req.get_param_value("hours"));
        }
        catch (const exception &e)
        {
            sendJson(res, {{"error", "invalid hours: " + req.get_param_value("hours")}}, 400);
            return;
        }
        sendJson(res, errors_.getSummary(hours).toJson()); });

    server_->Get("/errors", [this](const httplib::Request &req, httplib::Response &res)
                 {
        ErrorFilter filter;
        try
        {
            filter = filterFromParams(req.params);
        }
        catch (const exception &e)
        {
            sendJson(res, {{"error", e.what()}}, 400);
            return;
        }

        json records = json::array();
        for (const auto &record : errors_.getErrors(filter))
            records.push_back(record.toJson());

        sendJson(res, {{"count", records.size()}, {"errors", records}}); });
}
