#pragma once

#include "candle.hpp"
#include "patterns.hpp"
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

enum class Trend {
    Up,
    Down,
    Flat
};

enum class Breakout {
    None,
    Up,
    Down
};

enum class Direction {
    Call,
    Put
};

std::string to_string(Trend trend);
std::string to_string(Breakout breakout);
std::string to_string(Direction direction);

// Per-instrument, per-cycle inputs to the predictor. Fixed once built.
struct FeatureVector {
    const std::optional<std::string> pattern_name;
    const Breakout breakout;
    const Trend trend;
    const double volume_ratio; // >= 0, 0 when mean volume is zero or unavailable
    const double payout;       // 0..1

    nlohmann::json to_json() const;
};

struct MovingAverages {
    std::vector<std::optional<double>> fast;
    std::vector<std::optional<double>> slow;

    std::optional<double> last_fast() const;
    std::optional<double> last_slow() const;
};

struct SignalResult {
    FeatureVector features;
    std::optional<double> ma_fast;
    std::optional<double> ma_slow;
    std::vector<PatternHit> patterns;
    std::optional<Direction> direction;
    bool high_chance_basic;
};

class SignalAggregator {
public:
    SignalAggregator(int ma_fast, int ma_slow, int volume_period,
                     const PatternDetector& patterns);

    MovingAverages compute_moving_averages(const CandleWindow& window) const;

    // Unavailable averages classify as Flat
    static Trend detect_trend(const std::optional<double>& ma_fast,
                              const std::optional<double>& ma_slow);

    // Support/resistance span the whole window, latest candle included
    static Breakout detect_breakout(const CandleWindow& window);

    std::vector<PatternHit> detect_patterns(const CandleWindow& window) const;
    double volume_ratio(const CandleWindow& window) const;

    static bool is_high_chance_basic(const FeatureVector& features);
    static std::optional<Direction> infer_direction(Breakout breakout, Trend trend);

    SignalResult evaluate(const CandleWindow& window, double payout) const;

private:
    int ma_fast_;
    int ma_slow_;
    int volume_period_;
    const PatternDetector& patterns_;
};
