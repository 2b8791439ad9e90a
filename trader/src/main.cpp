#include "config.hpp"
#include "broker_client.hpp"
#include "health.hpp"
#include "http_client.hpp"
#include "news_calendar.hpp"
#include "patterns.hpp"
#include "predictor.hpp"
#include "redis_bus.hpp"
#include "session_controller.hpp"
#include "stake_manager.hpp"
#include "state.hpp"
#include "stop_token.hpp"
#include "util.hpp"
#include <httplib.h>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <curl/curl.h>
#include <signal.h>
#include <memory>
#include <thread>

StopToken stop_token;

// libcurl global state must outlive every handle
struct CurlGlobal {
    CurlGlobal() { curl_global_init(CURL_GLOBAL_DEFAULT); }
    ~CurlGlobal() { curl_global_cleanup(); }
};

void signal_handler(int) {
    stop_token.request_stop();
}

void setup_logging(const std::string& log_level) {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    auto logger = std::make_shared<spdlog::logger>("optionscout", console_sink);

    if (log_level == "debug") {
        logger->set_level(spdlog::level::debug);
    } else if (log_level == "warn") {
        logger->set_level(spdlog::level::warn);
    } else if (log_level == "error") {
        logger->set_level(spdlog::level::err);
    } else {
        logger->set_level(spdlog::level::info);
    }

    spdlog::set_default_logger(logger);
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v");
    spdlog::info("Logging initialized at level: {}", log_level);
}

int main() {
    Config config;
    try {
        config = Config::from_env();
        setup_logging(config.log_level);
        config.validate();
        config.log_summary();
    } catch (const std::exception& e) {
        spdlog::error("Invalid configuration: {}", e.what());
        return 1;
    }

    CurlGlobal curl_global;
    int exit_code = 0;

    try {
        spdlog::info("Starting {} on {}:{}",
                     config.service_name, config.listen_addr, config.listen_port);

        HealthMonitor health;

        // Collaborators
        auto broker_http = std::make_shared<HttpClient>(config.broker_bridge_url,
                                                        config.broker_timeout_ms);
        HttpBrokerSession broker(broker_http,
                                 BrokerCredentials{config.email, config.password, config.account_type},
                                 std::chrono::seconds(config.outcome_timeout_seconds),
                                 std::chrono::seconds(config.outcome_poll_seconds),
                                 stop_token);

        std::unique_ptr<NewsGate> news;
        if (config.news_calendar_url.empty()) {
            news = std::make_unique<DisabledNewsGate>();
        } else {
            news = std::make_unique<CalendarNewsGate>(
                std::make_shared<HttpClient>(config.news_calendar_url, config.broker_timeout_ms),
                "", config.news_buffer_minutes, config.news_refresh_minutes,
                util::current_timestamp_ms);
        }

        StakePolicy policy;
        policy.strategy = parse_stake_strategy(config.strategy);
        policy.base_stake = config.base_stake;
        policy.martingale_factor = config.martingale_factor;
        policy.martingale_max_steps = config.martingale_max_steps;
        policy.soros_level = config.soros_level;
        policy.use_soros_if_low_payout = config.use_soros_if_low_payout;
        policy.min_payout_for_soros = config.min_payout_for_soros;
        policy.stop_loss_consecutive = config.stop_loss_consecutive;
        policy.loss_cooldown_minutes = config.loss_cooldown_minutes;
        RiskManager stakes(policy, util::current_timestamp_ms);

        std::shared_ptr<RedisBus> redis;
        if (!config.redis_url.empty()) {
            redis = std::make_shared<RedisBus>(config.redis_url);
            health.set_redis(redis->ping());
        }
        RuleBasedPredictor predictor(redis, config.stream_trades);
        CandlestickPatterns patterns;

        // Without a session nothing can trade
        try {
            broker.connect();
        } catch (const ConnectionError& e) {
            spdlog::error("Failed to connect to broker: {}", e.what());
            return 1;
        }
        health.set_broker(true);

        // Setup HTTP server for /health endpoint
        httplib::Server http_server;
        http_server.Get("/health", [&health](const httplib::Request&, httplib::Response& res) {
            res.set_content(health.to_json().dump(), "application/json");
            res.status = health.is_ok() ? 200 : 503;
        });

        std::thread http_thread([&]() {
            spdlog::info("HTTP server listening on {}:{}",
                         config.listen_addr, config.listen_port);
            http_server.listen(config.listen_addr.c_str(), config.listen_port);
        });

        signal(SIGTERM, signal_handler);
        signal(SIGINT, signal_handler);

        SessionState state;
        SessionController controller(SessionSettings::from_config(config), state,
                                     broker, stakes, predictor, *news, patterns,
                                     local_today, &health);

        try {
            controller.run(stop_token);
        } catch (const ConnectionError& e) {
            spdlog::error("Broker session lost: {}", e.what());
            health.set_broker(false);
            exit_code = 1;
        }

        // Graceful shutdown
        spdlog::info("Shutting down gracefully");
        health.set_loop_status("shutdown");
        http_server.stop();
        if (http_thread.joinable()) {
            http_thread.join();
        }

        spdlog::info("Shutdown complete");

    } catch (const std::exception& e) {
        spdlog::error("Fatal error: {}", e.what());
        exit_code = 1;
    }

    return exit_code;
}
