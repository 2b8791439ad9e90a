#include "session_controller.hpp"
#include <spdlog/spdlog.h>

std::string to_string(SessionPhase phase) {
    switch (phase) {
        case SessionPhase::Running: return "running";
        case SessionPhase::NewsPause: return "news_pause";
        case SessionPhase::DailyStopPause: return "daily_stop";
    }
    return "running";
}

SessionSettings SessionSettings::from_config(const Config& config) {
    SessionSettings s;
    s.instruments = config.instruments;
    s.timeframe_seconds = config.timeframe_main_seconds;
    s.candle_count = config.candle_count;
    s.min_payout = config.min_payout;
    s.max_payout = config.max_payout;
    s.ma_fast = config.ma_fast;
    s.ma_slow = config.ma_slow;
    s.volume_period = config.volume_period;
    s.daily_win_cap = config.daily_win_cap;
    s.expiry_minutes = config.expiry_minutes;
    s.base_cycle_sleep = std::chrono::seconds(config.base_cycle_sleep_seconds);
    s.news_pause = std::chrono::seconds(config.news_pause_seconds);
    s.daily_stop_pause = std::chrono::seconds(config.daily_stop_pause_seconds);
    return s;
}

SessionController::SessionController(SessionSettings settings,
                                     SessionState& state,
                                     BrokerSession& broker,
                                     StakeManager& stakes,
                                     TradePredictor& predictor,
                                     NewsGate& news,
                                     const PatternDetector& patterns,
                                     DateProvider today,
                                     HealthMonitor* health)
    : settings_(std::move(settings))
    , state_(state)
    , broker_(broker)
    , stakes_(stakes)
    , predictor_(predictor)
    , news_(news)
    , aggregator_(settings_.ma_fast, settings_.ma_slow, settings_.volume_period, patterns)
    , today_(std::move(today))
    , health_(health)
{}

void SessionController::set_status(const std::string& status) {
    if (health_) health_->set_loop_status(status);
}

bool SessionController::payout_in_band(double payout) const {
    return payout >= settings_.min_payout && payout <= settings_.max_payout;
}

CycleReport SessionController::run_cycle() {
    CycleReport report;

    // 1. News blackout leaves the session state untouched
    if (news_.has_imminent_high_impact_event()) {
        spdlog::info("High-impact news imminent, pausing {}s", settings_.news_pause.count());
        report.phase = SessionPhase::NewsPause;
        report.sleep_for = settings_.news_pause;
        set_status(to_string(report.phase));
        return report;
    }

    // 2. Daily rollover runs on every cycle past the news gate
    CalendarDate today = today_();
    if (state_.roll_date(today)) {
        spdlog::info("New trading day {}, daily wins reset", today.to_string());
    }

    // 3. Daily stop-win
    if (state_.cap_reached(settings_.daily_win_cap)) {
        spdlog::info("Daily win cap reached ({}/{}), pausing {}s",
                     state_.daily_wins, settings_.daily_win_cap,
                     settings_.daily_stop_pause.count());
        report.phase = SessionPhase::DailyStopPause;
        report.sleep_for = settings_.daily_stop_pause;
        set_status(to_string(report.phase));
        if (health_) health_->update_last_cycle(state_.daily_wins);
        return report;
    }

    // 4. Scan
    report.phase = SessionPhase::Running;
    report.sleep_for = settings_.base_cycle_sleep;
    set_status(to_string(report.phase));
    scan_instruments(report);

    spdlog::info("Cycle done: {} trades, {} wins, daily wins {}/{}",
                 report.trades, report.wins, state_.daily_wins, settings_.daily_win_cap);
    if (health_) health_->update_last_cycle(state_.daily_wins);

    return report;
}

void SessionController::scan_instruments(CycleReport& report) {
    std::map<std::string, double> payouts;
    try {
        payouts = broker_.fetch_all_payouts();
    } catch (const FetchError& e) {
        spdlog::error("Failed to fetch payouts, skipping scan: {}", e.what());
        return;
    }

    for (const auto& instrument : settings_.instruments) {
        auto it = payouts.find(instrument);
        double payout = it != payouts.end() ? it->second : 0.0;

        InstrumentReport result;
        try {
            result = scan_instrument(instrument, payout);
        } catch (const std::exception& e) {
            spdlog::error("[{}] Evaluation failed: {}", instrument, e.what());
            result = InstrumentReport{instrument, InstrumentStatus::Failed, payout, std::nullopt};
        }

        if (result.status == InstrumentStatus::Traded) {
            report.trades++;
            if (result.outcome == TradeOutcome::Win) report.wins++;
        }
        report.instruments.push_back(std::move(result));
    }
}

InstrumentReport SessionController::scan_instrument(const std::string& instrument, double payout) {
    InstrumentReport result{instrument, InstrumentStatus::PayoutFiltered, payout, std::nullopt};

    // a. Payout band, checked before any candle traffic
    if (!payout_in_band(payout)) {
        spdlog::debug("[{}] Payout {:.2f} outside [{:.2f}, {:.2f}]", instrument, payout,
                      settings_.min_payout, settings_.max_payout);
        return result;
    }

    // b. Candles
    CandleWindow window;
    try {
        window = broker_.fetch_candles(instrument, settings_.timeframe_seconds,
                                       settings_.candle_count);
    } catch (const FetchError& e) {
        spdlog::error("[{}] Failed to fetch candles: {}", instrument, e.what());
        result.status = InstrumentStatus::FetchFailed;
        return result;
    }

    // c. Signals
    SignalResult signal = aggregator_.evaluate(window, payout);
    spdlog::debug("[{}] trend={} breakout={} pattern={} volume_ratio={:.2f}",
                  instrument, to_string(signal.features.trend),
                  to_string(signal.features.breakout),
                  signal.features.pattern_name.value_or("none"),
                  signal.features.volume_ratio);

    // d. Direction and eligibility
    if (!signal.direction) {
        result.status = InstrumentStatus::NoDirection;
        return result;
    }
    if (!stakes_.can_trade(instrument)) {
        spdlog::debug("[{}] Not tradeable right now", instrument);
        result.status = InstrumentStatus::NotTradeable;
        return result;
    }

    // e. Predictor gate
    if (!predictor_.predict_high_chance(signal.features)) {
        spdlog::debug("[{}] Setup not rated high chance", instrument);
        result.status = InstrumentStatus::LowChance;
        return result;
    }

    // f. Execute
    TradeDecision decision{instrument, *signal.direction,
                           stakes_.next_stake(instrument, true, payout),
                           signal.features};
    spdlog::info("[{}] Entering {} with {:.2f}, high_chance=true",
                 decision.instrument, to_string(decision.direction), decision.stake_amount);

    // A rejected or unresolved order counts as a loss for sizing and the journal
    std::optional<TradeOutcome> outcome;
    try {
        int64_t order_id = broker_.execute(decision.stake_amount, decision.instrument,
                                           decision.direction, settings_.expiry_minutes);
        outcome = broker_.await_outcome(order_id);
    } catch (const ExecutionError& e) {
        spdlog::error("[{}] Order rejected: {}", instrument, e.what());
        result.status = InstrumentStatus::ExecutionFailed;
    } catch (const TimeoutError& e) {
        spdlog::error("[{}] Outcome not available: {}", instrument, e.what());
        result.status = InstrumentStatus::OutcomeTimeout;
    }

    bool win = outcome == TradeOutcome::Win;
    stakes_.register_outcome(instrument, win);
    predictor_.log_outcome(decision.features, win);
    if (!outcome) {
        return result;
    }

    if (win) {
        state_.record_win();
    }
    if (health_) health_->update_last_trade();

    spdlog::info("[{}] {} {} -> {}", instrument, to_string(decision.direction),
                 decision.stake_amount, win ? "win" : "loss");

    result.status = InstrumentStatus::Traded;
    result.outcome = outcome;
    return result;
}

void SessionController::run(const StopToken& stop) {
    spdlog::info("Session loop started with {} instruments", settings_.instruments.size());

    while (!stop.stop_requested()) {
        std::chrono::seconds sleep_for = settings_.base_cycle_sleep;
        try {
            CycleReport report = run_cycle();
            sleep_for = report.sleep_for;
        } catch (const std::exception& e) {
            spdlog::error("Error in session cycle: {}", e.what());
            set_status("error");
        }

        if (stop.wait_for(sleep_for)) break;
    }

    spdlog::info("Session loop stopped");
}
