#pragma once

#include "collaborators.hpp"
#include "config.hpp"
#include "health.hpp"
#include "patterns.hpp"
#include "signals.hpp"
#include "state.hpp"
#include "stop_token.hpp"
#include <chrono>
#include <functional>
#include <optional>
#include <string>
#include <vector>

enum class SessionPhase {
    Running,
    NewsPause,
    DailyStopPause
};

std::string to_string(SessionPhase phase);

// Settings the loop needs, taken from Config once at startup
struct SessionSettings {
    std::vector<std::string> instruments;
    int timeframe_seconds = 60;
    int candle_count = 100;
    double min_payout = 0.70;
    double max_payout = 0.95;
    int ma_fast = 20;
    int ma_slow = 50;
    int volume_period = 20;
    int daily_win_cap = 3;
    int expiry_minutes = 1;
    std::chrono::seconds base_cycle_sleep{60};
    std::chrono::seconds news_pause{60};
    std::chrono::seconds daily_stop_pause{3600};

    static SessionSettings from_config(const Config& config);
};

enum class InstrumentStatus {
    PayoutFiltered,
    FetchFailed,
    NoDirection,
    NotTradeable,
    LowChance,
    ExecutionFailed,
    OutcomeTimeout,
    Failed,
    Traded
};

struct InstrumentReport {
    std::string instrument;
    InstrumentStatus status;
    double payout = 0.0;
    std::optional<TradeOutcome> outcome;
};

struct CycleReport {
    SessionPhase phase;
    std::chrono::seconds sleep_for{0};
    std::vector<InstrumentReport> instruments;
    int trades = 0;
    int wins = 0;
};

// Built only once a direction has cleared every gate
struct TradeDecision {
    std::string instrument;
    Direction direction;
    double stake_amount;
    FeatureVector features;
};

using DateProvider = std::function<CalendarDate()>;

class SessionController {
public:
    SessionController(SessionSettings settings,
                      SessionState& state,
                      BrokerSession& broker,
                      StakeManager& stakes,
                      TradePredictor& predictor,
                      NewsGate& news,
                      const PatternDetector& patterns,
                      DateProvider today = local_today,
                      HealthMonitor* health = nullptr);

    // One pass: news gate, date rollover, win cap, then the instrument scan.
    // ConnectionError propagates; every per-instrument failure is contained.
    CycleReport run_cycle();

    // Cycles until the token is stopped, honoring it at every wait
    void run(const StopToken& stop);

    const SessionState& state() const { return state_; }

private:
    SessionSettings settings_;
    SessionState& state_;
    BrokerSession& broker_;
    StakeManager& stakes_;
    TradePredictor& predictor_;
    NewsGate& news_;
    SignalAggregator aggregator_;
    DateProvider today_;
    HealthMonitor* health_;

    void scan_instruments(CycleReport& report);
    InstrumentReport scan_instrument(const std::string& instrument, double payout);
    bool payout_in_band(double payout) const;
    void set_status(const std::string& status);
};
