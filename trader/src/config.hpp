#pragma once

#include <string>
#include <vector>
#include <cstdlib>
#include <stdexcept>

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Config {
    // Broker
    std::string email;
    std::string password;
    std::string account_type;    // PRACTICE or REAL
    std::string broker_bridge_url;
    int broker_timeout_ms;

    // Instruments and candles
    std::vector<std::string> instruments;
    int timeframe_main_seconds;
    int candle_count;
    double min_payout;
    double max_payout;

    // Signal parameters
    int ma_fast;
    int ma_slow;
    int volume_period;

    // Session control
    int daily_win_cap;
    int base_cycle_sleep_seconds;
    int news_pause_seconds;
    int daily_stop_pause_seconds;

    // Execution
    int expiry_minutes;
    int outcome_timeout_seconds;
    int outcome_poll_seconds;

    // News calendar
    std::string news_calendar_url;
    int news_buffer_minutes;
    int news_refresh_minutes;

    // Staking
    std::string strategy;        // martingale or soros
    double base_stake;
    double martingale_factor;
    int martingale_max_steps;
    int soros_level;
    bool use_soros_if_low_payout;
    double min_payout_for_soros;
    int stop_loss_consecutive;
    int loss_cooldown_minutes;

    // Redis trade journal
    std::string redis_url;
    std::string stream_trades;

    // HTTP
    std::string listen_addr;
    int listen_port;

    // Service
    std::string service_name;
    std::string log_level;

    static Config from_env();
    void validate() const;
    void log_summary() const;

private:
    static std::string get_env(const char* name, const std::string& default_val = "");
    static int get_env_int(const char* name, int default_val);
    static double get_env_double(const char* name, double default_val);
    static bool get_env_bool(const char* name, bool default_val);
};
