#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <nlohmann/json.hpp>

// Snapshot shared between the session loop (writer) and the /health handler
class HealthMonitor {
public:
    void set_broker(bool connected);
    void set_redis(bool ok);
    void set_loop_status(const std::string& status);
    void update_last_cycle(int daily_wins);
    void update_last_trade();

    nlohmann::json to_json() const;
    bool is_ok() const;

private:
    mutable std::mutex mutex_;
    bool broker_ok_ = false;
    bool redis_ok_ = true;
    std::string loop_status_ = "starting";
    int daily_wins_ = 0;
    int64_t last_cycle_ms_ = 0;
    int64_t last_trade_ms_ = 0;
};
