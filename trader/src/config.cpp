#include "config.hpp"
#include "stake_manager.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>

std::string Config::get_env(const char* name, const std::string& default_val) {
    const char* val = std::getenv(name);
    return val ? std::string(val) : default_val;
}

int Config::get_env_int(const char* name, int default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid integer for {}, using default {}", name, default_val);
        return default_val;
    }
}

double Config::get_env_double(const char* name, double default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    try {
        return std::stod(val);
    } catch (const std::exception&) {
        spdlog::warn("Invalid number for {}, using default {}", name, default_val);
        return default_val;
    }
}

Config Config::from_env() {
    Config cfg;

    cfg.email = get_env("BROKER_EMAIL");
    cfg.password = get_env("BROKER_PASSWORD");
    cfg.account_type = util::to_upper(get_env("ACCOUNT_TYPE", "PRACTICE"));
    cfg.broker_bridge_url = get_env("BROKER_BRIDGE_URL", "http://localhost:8090");
    cfg.broker_timeout_ms = get_env_int("BROKER_TIMEOUT_MS", 8000);

    // Keep configured order, drop repeats
    for (const auto& inst : util::split(get_env("INSTRUMENTS", "EURUSD,GBPUSD,USDJPY"), ',')) {
        if (std::find(cfg.instruments.begin(), cfg.instruments.end(), inst) == cfg.instruments.end()) {
            cfg.instruments.push_back(inst);
        }
    }
    cfg.timeframe_main_seconds = get_env_int("TIMEFRAME_MAIN_SECONDS", 60);
    cfg.candle_count = get_env_int("CANDLE_COUNT", 100);
    cfg.min_payout = get_env_double("MIN_PAYOUT", 0.70);
    cfg.max_payout = get_env_double("MAX_PAYOUT", 0.95);

    cfg.ma_fast = get_env_int("MA_FAST", 20);
    cfg.ma_slow = get_env_int("MA_SLOW", 50);
    cfg.volume_period = get_env_int("VOLUME_PERIOD", 20);

    cfg.daily_win_cap = get_env_int("DAILY_WIN_CAP", 3);
    cfg.base_cycle_sleep_seconds = get_env_int("BASE_CYCLE_SLEEP_SECONDS", cfg.timeframe_main_seconds);
    cfg.news_pause_seconds = get_env_int("NEWS_PAUSE_SECONDS", 60);
    cfg.daily_stop_pause_seconds = get_env_int("DAILY_STOP_PAUSE_SECONDS", 3600);

    cfg.expiry_minutes = get_env_int("EXPIRY_MINUTES", 1);
    cfg.outcome_timeout_seconds = get_env_int("OUTCOME_TIMEOUT_SECONDS", 120);
    cfg.outcome_poll_seconds = get_env_int("OUTCOME_POLL_SECONDS", 2);

    cfg.news_calendar_url = get_env("NEWS_CALENDAR_URL");
    cfg.news_buffer_minutes = get_env_int("NEWS_BUFFER_MINUTES", 30);
    cfg.news_refresh_minutes = get_env_int("NEWS_REFRESH_MINUTES", 30);

    cfg.strategy = get_env("STRATEGY", "martingale");
    cfg.base_stake = get_env_double("BASE_STAKE", 1.0);
    cfg.martingale_factor = get_env_double("MARTINGALE_FACTOR", 2.0);
    cfg.martingale_max_steps = get_env_int("MARTINGALE_MAX_STEPS", 2);
    cfg.soros_level = get_env_int("SOROS_LEVEL", 2);
    cfg.use_soros_if_low_payout = get_env_bool("USE_SOROS_IF_LOW_PAYOUT", false);
    cfg.min_payout_for_soros = get_env_double("MIN_PAYOUT_FOR_SOROS", 0.80);
    cfg.stop_loss_consecutive = get_env_int("STOP_LOSS_CONSECUTIVE", 3);
    cfg.loss_cooldown_minutes = get_env_int("LOSS_COOLDOWN_MINUTES", 30);

    cfg.redis_url = get_env("REDIS_URL");
    cfg.stream_trades = get_env("STREAM_TRADES", "optionscout.trades");

    cfg.listen_addr = get_env("LISTEN_ADDR", "0.0.0.0");
    cfg.listen_port = get_env_int("LISTEN_PORT", 8085);

    cfg.service_name = get_env("SERVICE_NAME", "trader");
    cfg.log_level = get_env("LOG_LEVEL", "info");

    return cfg;
}

void Config::validate() const {
    auto require_positive = [](int value, const char* name) {
        if (value <= 0) {
            throw ConfigError(std::string(name) + " must be positive, got " + std::to_string(value));
        }
    };
    auto require_non_negative = [](int value, const char* name) {
        if (value < 0) {
            throw ConfigError(std::string(name) + " must not be negative, got " + std::to_string(value));
        }
    };

    if (email.empty() || password.empty()) {
        throw ConfigError("BROKER_EMAIL and BROKER_PASSWORD are required");
    }
    if (account_type != "PRACTICE" && account_type != "REAL") {
        throw ConfigError("ACCOUNT_TYPE must be PRACTICE or REAL, got " + account_type);
    }
    if (broker_bridge_url.empty()) {
        throw ConfigError("BROKER_BRIDGE_URL is required");
    }
    if (instruments.empty()) {
        throw ConfigError("INSTRUMENTS must list at least one instrument");
    }
    if (!(min_payout >= 0.0 && min_payout <= max_payout && max_payout <= 1.0)) {
        throw ConfigError("Payout band must satisfy 0 <= MIN_PAYOUT <= MAX_PAYOUT <= 1");
    }
    try {
        parse_stake_strategy(strategy);
    } catch (const std::invalid_argument&) {
        throw ConfigError("STRATEGY must be martingale or soros, got " + strategy);
    }
    if (!(min_payout_for_soros >= 0.0 && min_payout_for_soros <= 1.0)) {
        throw ConfigError("MIN_PAYOUT_FOR_SOROS must be within [0, 1]");
    }
    if (!(base_stake > 0.0)) {
        throw ConfigError("BASE_STAKE must be positive");
    }
    if (!(martingale_factor >= 1.0)) {
        throw ConfigError("MARTINGALE_FACTOR must be at least 1");
    }
    if (log_level != "debug" && log_level != "info" && log_level != "warn" && log_level != "error") {
        throw ConfigError("LOG_LEVEL must be one of debug, info, warn, error");
    }
    if (listen_port <= 0 || listen_port > 65535) {
        throw ConfigError("LISTEN_PORT out of range: " + std::to_string(listen_port));
    }

    require_positive(broker_timeout_ms, "BROKER_TIMEOUT_MS");
    require_positive(timeframe_main_seconds, "TIMEFRAME_MAIN_SECONDS");
    require_positive(candle_count, "CANDLE_COUNT");
    require_positive(ma_fast, "MA_FAST");
    require_positive(ma_slow, "MA_SLOW");
    require_positive(volume_period, "VOLUME_PERIOD");
    require_positive(daily_win_cap, "DAILY_WIN_CAP");
    require_positive(base_cycle_sleep_seconds, "BASE_CYCLE_SLEEP_SECONDS");
    require_positive(news_pause_seconds, "NEWS_PAUSE_SECONDS");
    require_positive(daily_stop_pause_seconds, "DAILY_STOP_PAUSE_SECONDS");
    require_positive(expiry_minutes, "EXPIRY_MINUTES");
    require_positive(outcome_timeout_seconds, "OUTCOME_TIMEOUT_SECONDS");
    require_positive(outcome_poll_seconds, "OUTCOME_POLL_SECONDS");
    require_non_negative(news_buffer_minutes, "NEWS_BUFFER_MINUTES");
    require_positive(news_refresh_minutes, "NEWS_REFRESH_MINUTES");
    require_non_negative(martingale_max_steps, "MARTINGALE_MAX_STEPS");
    require_non_negative(soros_level, "SOROS_LEVEL");
    require_positive(stop_loss_consecutive, "STOP_LOSS_CONSECUTIVE");
    require_non_negative(loss_cooldown_minutes, "LOSS_COOLDOWN_MINUTES");
}

void Config::log_summary() const {
    spdlog::info("Configuration validated successfully");
    spdlog::info("  Account: {} ({}), password {}", email, account_type, util::redact_secret(password));
    spdlog::info("  Instruments: {} on {}s candles x{}", instruments.size(),
                 timeframe_main_seconds, candle_count);
    spdlog::info("  Payout band: [{:.2f}, {:.2f}]", min_payout, max_payout);
    spdlog::info("  MA fast/slow: {}/{}, volume period {}", ma_fast, ma_slow, volume_period);
    spdlog::info("  Daily win cap: {}, cycle sleep {}s", daily_win_cap, base_cycle_sleep_seconds);
    spdlog::info("  Staking: {} from {:.2f}", strategy, base_stake);
    spdlog::info("  News gate: {}", news_calendar_url.empty() ? "disabled" : news_calendar_url);
    spdlog::info("  Trade journal: {}", redis_url.empty() ? "disabled" : stream_trades);
}

bool Config::get_env_bool(const char* name, bool default_val) {
    const char* val = std::getenv(name);
    if (!val) return default_val;
    std::string upper = util::to_upper(val);
    if (upper == "1" || upper == "TRUE" || upper == "YES") return true;
    if (upper == "0" || upper == "FALSE" || upper == "NO") return false;
    spdlog::warn("Invalid boolean for {}, using default {}", name, default_val);
    return default_val;
}
