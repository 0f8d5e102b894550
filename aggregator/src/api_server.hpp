#pragma once

#include "read_cache.hpp"
#include "health.hpp"
#include "api_handlers.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <string>
#include <thread>

class ApiServer {
public:
    ApiServer(const std::string& listen_addr, int listen_port,
              std::shared_ptr<const ReadCache> cache,
              std::shared_ptr<const HealthMonitor> health);
    ~ApiServer();

    void start();
    void stop();
    bool is_running() const { return running_; }

    // Set when the listener could not bind or stopped on its own
    bool has_failed() const { return failed_; }

private:
    std::string listen_addr_;
    int listen_port_;
    std::shared_ptr<const ReadCache> cache_;
    std::shared_ptr<const HealthMonitor> health_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    std::atomic<bool> failed_{false};
    std::thread server_thread_;

    void setup_routes();
    static void reply(httplib::Response& res, const ApiResponse& response);
};
