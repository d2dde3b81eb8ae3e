#include "api_server.hpp"
#include <spdlog/spdlog.h>
#include <chrono>
#include <stdexcept>

ApiServer::ApiServer(const Config& config,
                     std::shared_ptr<PriceService> prices,
                     std::shared_ptr<HealthCheck> health)
    : config_(config)
    , prices_(std::move(prices))
    , health_(std::move(health))
    , server_(std::make_unique<httplib::Server>())
{}

ApiServer::~ApiServer() {
    stop();
}

void ApiServer::start() {
    if (running_) return;

    setup_routes();

    if (config_.listen_port == 0) {
        port_ = server_->bind_to_any_port(config_.listen_addr);
    } else if (server_->bind_to_port(config_.listen_addr, config_.listen_port)) {
        port_ = config_.listen_port;
    } else {
        port_ = -1;
    }

    if (port_ <= 0) {
        throw std::runtime_error("HTTP server failed to bind " + config_.listen_addr +
                                 ":" + std::to_string(config_.listen_port));
    }

    running_ = true;
    server_thread_ = std::thread([this]() {
        if (!server_->listen_after_bind()) {
            spdlog::error("HTTP server on port {} stopped listening", port_);
        }
        running_ = false;
    });

    spdlog::info("API server listening on {}:{}", config_.listen_addr, port_);
}

void ApiServer::stop() {
    if (!server_thread_.joinable()) return;

    // stop() is a no-op until listen_after_bind() has entered its accept loop
    while (running_ && !server_->is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    server_->stop();
    server_thread_.join();
    running_ = false;

    spdlog::info("API server stopped");
}

void ApiServer::setup_routes() {
    server_->Get("/api/prices/token",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_token_prices(req, res);
        });

    server_->Get("/api/prices/peg",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_peg_prices(req, res);
        });

    server_->Get("/health",
        [this](const httplib::Request& req, httplib::Response& res) {
            handle_health(req, res);
        });
}

void ApiServer::write_prices(const ApiResponse& response, httplib::Response& res) const {
    int ttl = config_.cache_ttl_seconds;

    res.status = response.status;
    res.set_header("Access-Control-Allow-Origin", "*");
    if (response.status == 200) {
        res.set_header("Cache-Control", "public, s-maxage=" + std::to_string(ttl) +
                                        ", stale-while-revalidate=" + std::to_string(ttl * 2));
    }
    res.set_content(response.body.dump(), "application/json");
}

void ApiServer::handle_token_prices(const httplib::Request& req, httplib::Response& res) {
    std::string chain = req.has_param("chainId") ? req.get_param_value("chainId") : "";
    std::string addresses = req.has_param("addresses") ? req.get_param_value("addresses") : "";

    write_prices(prices_->token_prices(chain, addresses), res);
}

void ApiServer::handle_peg_prices(const httplib::Request&, httplib::Response& res) {
    write_prices(prices_->peg_prices(), res);
}

void ApiServer::handle_health(const httplib::Request&, httplib::Response& res) {
    auto status = health_->get_status();
    res.set_content(status.dump(), "application/json");
    res.status = status.value("ok", false) ? 200 : 503;
}
