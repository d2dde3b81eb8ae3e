#pragma once

#include "config.hpp"
#include "health.hpp"
#include "price_service.hpp"
#include <httplib.h>
#include <atomic>
#include <memory>
#include <thread>

class ApiServer {
public:
    ApiServer(const Config& config,
              std::shared_ptr<PriceService> prices,
              std::shared_ptr<HealthCheck> health);
    ~ApiServer();

    // Binds synchronously and throws std::runtime_error when the address is
    // unavailable. Port 0 picks a free port; see port().
    void start();
    void stop();
    bool is_running() const { return running_; }
    int port() const { return port_; }

private:
    const Config& config_;
    std::shared_ptr<PriceService> prices_;
    std::shared_ptr<HealthCheck> health_;

    std::unique_ptr<httplib::Server> server_;
    std::atomic<bool> running_{false};
    int port_ = 0;
    std::thread server_thread_;

    void setup_routes();
    void handle_token_prices(const httplib::Request& req, httplib::Response& res);
    void handle_peg_prices(const httplib::Request& req, httplib::Response& res);
    void handle_health(const httplib::Request& req, httplib::Response& res);

    void write_prices(const ApiResponse& response, httplib::Response& res) const;
};
