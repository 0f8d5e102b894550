#include "api_server.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>

ApiServer::ApiServer(const std::string& listen_addr, int listen_port,
                     std::shared_ptr<const ReadCache> cache,
                     std::shared_ptr<const HealthMonitor> health)
    : listen_addr_(listen_addr)
    , listen_port_(listen_port)
    , cache_(std::move(cache))
    , health_(std::move(health))
    , server_(std::make_unique<httplib::Server>())
{}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::start() {
    if (running_) return;

    setup_routes();
    running_ = true;

    server_thread_ = std::thread([this]() {
        spdlog::info("HTTP server listening on {}:{}", listen_addr_, listen_port_);
        if (!server_->listen(listen_addr_.c_str(), listen_port_) && running_) {
            spdlog::error("HTTP server failed to listen on {}:{}", listen_addr_, listen_port_);
            failed_ = true;
        }
    });

    spdlog::info("API server started");
}

void ApiServer::stop() {
    if (!running_) return;

    running_ = false;
    server_->stop();

    if (server_thread_.joinable()) {
        server_thread_.join();
    }

    spdlog::info("API server stopped");
}

void ApiServer::reply(httplib::Response& res, const ApiResponse& response) {
    res.status = response.status;
    // headlines come from third parties and may carry invalid UTF-8
    res.set_content(response.body.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace),
                    "application/json");
}

void ApiServer::setup_routes() {
    server_->Get("/api/dashboard-data", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, api::dashboard_data(*cache_, util::current_timestamp_ms()));
    });

    server_->Get("/api/signal", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, api::signal(*cache_));
    });

    server_->Get("/api/derivatives", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, api::derivatives(*cache_));
    });

    server_->Get("/api/news", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, api::news(*cache_));
    });

    server_->Get("/api/polymarket", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, api::polymarket(*cache_));
    });

    server_->Get("/api/signal-history", [this](const httplib::Request& req, httplib::Response& res) {
        std::string limit = req.has_param("limit") ? req.get_param_value("limit") : "";
        reply(res, api::signal_history(*cache_, limit));
    });

    server_->Get("/api/bet-suggestion", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, api::bet_suggestion(*cache_));
    });

    server_->Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
        reply(res, api::health(*cache_, *health_, util::current_timestamp_ms()));
    });
}
