#include "health.hpp"
#include "util.hpp"

void HealthMonitor::set_broker(bool connected) {
    std::lock_guard<std::mutex> lock(mutex_);
    broker_ok_ = connected;
}

void HealthMonitor::set_redis(bool ok) {
    std::lock_guard<std::mutex> lock(mutex_);
    redis_ok_ = ok;
}

void HealthMonitor::set_loop_status(const std::string& status) {
    std::lock_guard<std::mutex> lock(mutex_);
    loop_status_ = status;
}

void HealthMonitor::update_last_cycle(int daily_wins) {
    std::lock_guard<std::mutex> lock(mutex_);
    daily_wins_ = daily_wins;
    last_cycle_ms_ = util::current_timestamp_ms();
}

void HealthMonitor::update_last_trade() {
    std::lock_guard<std::mutex> lock(mutex_);
    last_trade_ms_ = util::current_timestamp_ms();
}

nlohmann::json HealthMonitor::to_json() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {
        {"ok", broker_ok_ && redis_ok_ && loop_status_ != "error" && loop_status_ != "shutdown"},
        {"broker", broker_ok_},
        {"redis", redis_ok_},
        {"loop", loop_status_},
        {"daily_wins", daily_wins_},
        {"last_cycle_ts_ms", last_cycle_ms_},
        {"last_trade_ts_ms", last_trade_ms_},
        {"ts", util::current_iso8601()}
    };
}

bool HealthMonitor::is_ok() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return broker_ok_ && redis_ok_ && loop_status_ != "error" && loop_status_ != "shutdown";
}
