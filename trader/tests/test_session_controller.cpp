#include <catch2/catch_test_macros.hpp>
#include "../src/session_controller.hpp"
#include <algorithm>
#include <set>

namespace {

CandleWindow breakout_up_window(const std::string& instrument) {
    // 60 closes rising 100 -> 160, highs just under each close
    CandleWindow w;
    w.instrument = instrument;
    for (int i = 0; i < 60; i++) {
        double close = 100.0 + i * (60.0 / 59.0);
        w.candles.push_back(Candle{i * 60, close - 1.0, close - 0.5, close - 1.5, close, 100.0});
    }
    return w;
}

CandleWindow breakout_down_window(const std::string& instrument) {
    CandleWindow w;
    w.instrument = instrument;
    for (int i = 0; i < 60; i++) {
        double close = 160.0 - i * (60.0 / 59.0);
        w.candles.push_back(Candle{i * 60, close + 1.0, close + 1.5, close + 0.5, close, 100.0});
    }
    return w;
}

CandleWindow quiet_window(const std::string& instrument) {
    CandleWindow w;
    w.instrument = instrument;
    for (int i = 0; i < 60; i++) {
        w.candles.push_back(Candle{i * 60, 100.0, 101.0, 99.0, 100.0, 100.0});
    }
    return w;
}

class FakeBroker : public BrokerSession {
public:
    std::map<std::string, double> payouts;
    std::map<std::string, CandleWindow> windows;
    std::set<std::string> fetch_failures;
    std::set<std::string> execution_failures;
    std::set<std::string> timeouts;
    std::set<std::string> losers;
    std::set<std::string> connection_drops;
    bool payout_failure = false;

    std::vector<std::string> fetched;
    std::vector<std::string> executed;
    std::vector<double> stakes;
    std::function<void()> on_fetch;

    void connect() override {}

    CandleWindow fetch_candles(const std::string& instrument, int, int) override {
        fetched.push_back(instrument);
        if (on_fetch) on_fetch();
        if (connection_drops.count(instrument)) throw ConnectionError("socket closed");
        if (fetch_failures.count(instrument)) throw FetchError("timeout");
        auto it = windows.find(instrument);
        if (it == windows.end()) throw FetchError("unknown instrument");
        return it->second;
    }

    std::map<std::string, double> fetch_all_payouts() override {
        if (payout_failure) throw FetchError("payout service down");
        return payouts;
    }

    int64_t execute(double amount, const std::string& instrument, Direction, int) override {
        if (execution_failures.count(instrument)) throw ExecutionError("rejected");
        executed.push_back(instrument);
        stakes.push_back(amount);
        order_instruments_.push_back(instrument);
        return static_cast<int64_t>(order_instruments_.size());
    }

    TradeOutcome await_outcome(int64_t order_id) override {
        const auto& instrument = order_instruments_.at(order_id - 1);
        if (timeouts.count(instrument)) throw TimeoutError("no result");
        return losers.count(instrument) ? TradeOutcome::Loss : TradeOutcome::Win;
    }

private:
    std::vector<std::string> order_instruments_;
};

class FakeStakes : public StakeManager {
public:
    std::set<std::string> blocked;
    std::vector<std::pair<std::string, bool>> outcomes;

    bool can_trade(const std::string& instrument) override { return !blocked.count(instrument); }
    double next_stake(const std::string&, bool, double) override { return 2.5; }
    void register_outcome(const std::string& instrument, bool win) override {
        outcomes.emplace_back(instrument, win);
    }
};

class FakePredictor : public TradePredictor {
public:
    bool answer = true;
    int predictions = 0;
    std::vector<bool> logged;

    bool predict_high_chance(const FeatureVector&) override {
        predictions++;
        return answer;
    }
    void log_outcome(const FeatureVector&, bool win) override { logged.push_back(win); }
};

class FakeNews : public NewsGate {
public:
    bool imminent = false;
    bool has_imminent_high_impact_event() override { return imminent; }
};

class NoPatterns : public PatternDetector {
public:
    std::vector<PatternHit> detect(const CandleWindow&) const override { return {}; }
};

struct Harness {
    SessionSettings settings;
    SessionState state;
    FakeBroker broker;
    FakeStakes stakes;
    FakePredictor predictor;
    FakeNews news;
    NoPatterns patterns;
    CalendarDate today{2026, 10, 19};

    Harness() {
        settings.instruments = {"EURUSD", "GBPUSD"};
        settings.min_payout = 0.70;
        settings.max_payout = 0.95;
        settings.ma_fast = 5;
        settings.ma_slow = 20;
        settings.volume_period = 20;
        settings.daily_win_cap = 2;
        settings.base_cycle_sleep = std::chrono::seconds(60);
        settings.news_pause = std::chrono::seconds(60);
        settings.daily_stop_pause = std::chrono::seconds(3600);

        broker.payouts = {{"EURUSD", 0.85}, {"GBPUSD", 0.80}};
        broker.windows["EURUSD"] = breakout_up_window("EURUSD");
        broker.windows["GBPUSD"] = quiet_window("GBPUSD");
    }

    SessionController controller() {
        return SessionController(settings, state, broker, stakes, predictor, news, patterns,
                                 [this]() { return today; });
    }
};

const InstrumentReport& report_for(const CycleReport& report, const std::string& instrument) {
    for (const auto& r : report.instruments) {
        if (r.instrument == instrument) return r;
    }
    throw std::runtime_error("no report for " + instrument);
}

} // namespace

TEST_CASE("News pause", "[session]") {
    Harness h;
    h.state.daily_wins = 1;
    h.state.last_trade_date = CalendarDate{2026, 10, 18};
    h.news.imminent = true;

    auto ctl = h.controller();
    auto report = ctl.run_cycle();

    REQUIRE(report.phase == SessionPhase::NewsPause);
    REQUIRE(report.sleep_for == std::chrono::seconds(60));
    REQUIRE(report.instruments.empty());
    REQUIRE(h.broker.fetched.empty());

    SECTION("Session state is left untouched") {
        REQUIRE(h.state.daily_wins == 1);
        REQUIRE(h.state.last_trade_date == CalendarDate{2026, 10, 18});
    }
}

TEST_CASE("Daily rollover and win cap", "[session]") {
    Harness h;
    auto ctl = h.controller();

    SECTION("Rollover runs even when nothing trades") {
        h.broker.payouts.clear();
        auto report = ctl.run_cycle();
        REQUIRE(report.phase == SessionPhase::Running);
        REQUIRE(report.trades == 0);
        REQUIRE(h.state.last_trade_date == h.today);
    }

    SECTION("Two winning cycles with cap 2 stop the next cycle before scanning") {
        h.settings.instruments = {"EURUSD"};
        auto single = h.controller();

        auto first = single.run_cycle();
        REQUIRE(first.phase == SessionPhase::Running);
        REQUIRE(first.wins == 1);

        auto second = single.run_cycle();
        REQUIRE(second.wins == 1);
        REQUIRE(h.state.daily_wins == 2);

        h.broker.fetched.clear();
        auto third = single.run_cycle();
        REQUIRE(third.phase == SessionPhase::DailyStopPause);
        REQUIRE(third.sleep_for == std::chrono::seconds(3600));
        REQUIRE(third.instruments.empty());
        REQUIRE(h.broker.fetched.empty());

        SECTION("A new day resets the counter and resumes scanning") {
            h.today = CalendarDate{2026, 10, 20};
            auto next_day = single.run_cycle();
            REQUIRE(next_day.phase == SessionPhase::Running);
            REQUIRE(h.state.daily_wins == 1);
        }
    }

    SECTION("Stale wins from a previous day are cleared") {
        h.state.daily_wins = 5;
        h.state.last_trade_date = CalendarDate{2026, 10, 18};
        h.broker.payouts.clear();
        auto report = ctl.run_cycle();
        REQUIRE(report.phase == SessionPhase::Running);
        REQUIRE(h.state.daily_wins == 0);
    }

    SECTION("Losses never count toward the cap") {
        h.broker.losers = {"EURUSD"};
        ctl.run_cycle();
        ctl.run_cycle();
        REQUIRE(h.state.daily_wins == 0);
        REQUIRE(h.stakes.outcomes.size() == 2);
        REQUIRE_FALSE(h.stakes.outcomes[0].second);
    }
}

TEST_CASE("Per-instrument scan", "[session]") {
    Harness h;
    auto ctl = h.controller();

    SECTION("Confirmed breakout trades and folds the win back") {
        auto report = ctl.run_cycle();

        REQUIRE(report_for(report, "EURUSD").status == InstrumentStatus::Traded);
        REQUIRE(report_for(report, "EURUSD").outcome == TradeOutcome::Win);
        REQUIRE(report_for(report, "GBPUSD").status == InstrumentStatus::NoDirection);
        REQUIRE(h.broker.executed == std::vector<std::string>{"EURUSD"});
        REQUIRE(h.broker.stakes == std::vector<double>{2.5});
        REQUIRE(h.stakes.outcomes.size() == 1);
        REQUIRE(h.predictor.logged == std::vector<bool>{true});
        REQUIRE(h.state.daily_wins == 1);
    }

    SECTION("Payout below the band skips before any candle fetch") {
        h.broker.payouts["EURUSD"] = 0.65;
        auto report = ctl.run_cycle();

        REQUIRE(report_for(report, "EURUSD").status == InstrumentStatus::PayoutFiltered);
        REQUIRE(std::find(h.broker.fetched.begin(), h.broker.fetched.end(), "EURUSD")
                == h.broker.fetched.end());
    }

    SECTION("Payout above the band and missing payouts are skipped") {
        h.broker.payouts["EURUSD"] = 0.97;
        h.broker.payouts.erase("GBPUSD");
        auto report = ctl.run_cycle();

        REQUIRE(report_for(report, "EURUSD").status == InstrumentStatus::PayoutFiltered);
        REQUIRE(report_for(report, "GBPUSD").status == InstrumentStatus::PayoutFiltered);
        REQUIRE(h.broker.fetched.empty());
    }

    SECTION("Instruments are visited in configured order") {
        h.settings.instruments = {"GBPUSD", "EURUSD"};
        auto ordered = h.controller();
        ordered.run_cycle();
        REQUIRE(h.broker.fetched == std::vector<std::string>{"GBPUSD", "EURUSD"});
    }

    SECTION("Fetch failure skips only that instrument") {
        h.settings.instruments = {"GBPUSD", "EURUSD"};
        h.broker.fetch_failures = {"GBPUSD"};
        auto isolated = h.controller();
        auto report = isolated.run_cycle();

        REQUIRE(report_for(report, "GBPUSD").status == InstrumentStatus::FetchFailed);
        REQUIRE(report_for(report, "EURUSD").status == InstrumentStatus::Traded);
    }

    SECTION("Execution failure does not stop later instruments") {
        h.settings.instruments = {"EURUSD", "USDJPY"};
        h.broker.payouts["USDJPY"] = 0.80;
        h.broker.windows["USDJPY"] = breakout_up_window("USDJPY");
        h.broker.execution_failures = {"EURUSD"};
        auto isolated = h.controller();
        auto report = isolated.run_cycle();

        REQUIRE(report_for(report, "EURUSD").status == InstrumentStatus::ExecutionFailed);
        REQUIRE(report_for(report, "USDJPY").status == InstrumentStatus::Traded);
        REQUIRE(h.stakes.outcomes.size() == 2);
        REQUIRE(h.stakes.outcomes[0] == std::make_pair(std::string("EURUSD"), false));
        REQUIRE(h.predictor.logged == std::vector<bool>{false, true});
        REQUIRE(h.state.daily_wins == 1);
        REQUIRE(report.trades == 1);
    }

    SECTION("Outcome timeout is booked as a loss but never as a win") {
        h.broker.timeouts = {"EURUSD"};
        auto report = ctl.run_cycle();

        REQUIRE(report_for(report, "EURUSD").status == InstrumentStatus::OutcomeTimeout);
        REQUIRE_FALSE(report_for(report, "EURUSD").outcome.has_value());
        REQUIRE(h.stakes.outcomes.size() == 1);
        REQUIRE(h.stakes.outcomes[0] == std::make_pair(std::string("EURUSD"), false));
        REQUIRE(h.predictor.logged == std::vector<bool>{false});
        REQUIRE(h.state.daily_wins == 0);
        REQUIRE(report.wins == 0);
    }

    SECTION("Staking manager can veto an instrument") {
        h.stakes.blocked = {"EURUSD"};
        auto report = ctl.run_cycle();

        REQUIRE(report_for(report, "EURUSD").status == InstrumentStatus::NotTradeable);
        REQUIRE(h.predictor.predictions == 0);
        REQUIRE(h.broker.executed.empty());
    }

    SECTION("Predictor can veto a setup") {
        h.predictor.answer = false;
        auto report = ctl.run_cycle();

        REQUIRE(report_for(report, "EURUSD").status == InstrumentStatus::LowChance);
        REQUIRE(h.broker.executed.empty());
    }

    SECTION("Downside breakout with a downtrend trades a put") {
        h.broker.windows["GBPUSD"] = breakout_down_window("GBPUSD");
        auto report = ctl.run_cycle();
        REQUIRE(report_for(report, "GBPUSD").status == InstrumentStatus::Traded);
        REQUIRE(report.trades == 2);
    }

    SECTION("Payout table failure skips the scan but not the cycle") {
        h.broker.payout_failure = true;
        auto report = ctl.run_cycle();

        REQUIRE(report.phase == SessionPhase::Running);
        REQUIRE(report.instruments.empty());
        REQUIRE(report.sleep_for == std::chrono::seconds(60));
    }

    SECTION("Lost connection on one instrument does not stop the basket") {
        h.settings.instruments = {"GBPUSD", "EURUSD"};
        h.broker.connection_drops = {"GBPUSD"};
        auto isolated = h.controller();

        CycleReport report;
        REQUIRE_NOTHROW(report = isolated.run_cycle());
        REQUIRE(report_for(report, "GBPUSD").status == InstrumentStatus::Failed);
        REQUIRE(report_for(report, "EURUSD").status == InstrumentStatus::Traded);
        REQUIRE(h.broker.fetched == std::vector<std::string>{"GBPUSD", "EURUSD"});
    }
}

TEST_CASE("Session loop honors the stop token", "[session]") {
    Harness h;
    StopToken stop;

    SECTION("A stopped token runs no cycle") {
        stop.request_stop();
        auto ctl = h.controller();
        ctl.run(stop);
        REQUIRE(h.broker.fetched.empty());
    }

    SECTION("Stop during a cycle ends the loop at the next wait") {
        h.settings.base_cycle_sleep = std::chrono::seconds(3600);
        h.broker.on_fetch = [&stop]() { stop.request_stop(); };
        auto ctl = h.controller();

        auto start = std::chrono::steady_clock::now();
        ctl.run(stop);
        REQUIRE(std::chrono::steady_clock::now() - start < std::chrono::seconds(5));
        REQUIRE_FALSE(h.broker.fetched.empty());
    }

    SECTION("Connection loss mid-cycle keeps the loop alive") {
        h.broker.connection_drops = {"EURUSD"};
        h.broker.on_fetch = [&stop]() { stop.request_stop(); };
        auto ctl = h.controller();

        REQUIRE_NOTHROW(ctl.run(stop));
        REQUIRE(h.broker.fetched == std::vector<std::string>{"EURUSD", "GBPUSD"});
    }
}
