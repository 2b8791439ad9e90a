#include "signals.hpp"
#include "indicators.hpp"
#include <algorithm>
#include <cmath>

std::string to_string(Trend trend) {
    switch (trend) {
        case Trend::Up: return "up";
        case Trend::Down: return "down";
        case Trend::Flat: return "flat";
    }
    return "flat";
}

std::string to_string(Breakout breakout) {
    switch (breakout) {
        case Breakout::Up: return "breakout_up";
        case Breakout::Down: return "breakout_down";
        case Breakout::None: return "none";
    }
    return "none";
}

std::string to_string(Direction direction) {
    return direction == Direction::Call ? "call" : "put";
}

nlohmann::json FeatureVector::to_json() const {
    return {
        {"pattern_name", pattern_name.value_or("unknown")},
        {"breakout", to_string(breakout)},
        {"trend", to_string(trend)},
        {"volume_ratio", volume_ratio},
        {"payout", payout}
    };
}

std::optional<double> MovingAverages::last_fast() const {
    if (fast.empty()) return std::nullopt;
    return fast.back();
}

std::optional<double> MovingAverages::last_slow() const {
    if (slow.empty()) return std::nullopt;
    return slow.back();
}

SignalAggregator::SignalAggregator(int ma_fast, int ma_slow, int volume_period,
                                   const PatternDetector& patterns)
    : ma_fast_(ma_fast)
    , ma_slow_(ma_slow)
    , volume_period_(volume_period)
    , patterns_(patterns)
{}

MovingAverages SignalAggregator::compute_moving_averages(const CandleWindow& window) const {
    auto closes = Indicators::closes(window);

    MovingAverages mas;
    mas.fast = Indicators::rolling_mean(closes, ma_fast_);
    mas.slow = Indicators::rolling_mean(closes, ma_slow_);
    return mas;
}

Trend SignalAggregator::detect_trend(const std::optional<double>& ma_fast,
                                     const std::optional<double>& ma_slow) {
    if (!ma_fast || !ma_slow) return Trend::Flat;

    if (*ma_fast > *ma_slow) return Trend::Up;
    if (*ma_fast < *ma_slow) return Trend::Down;
    return Trend::Flat;
}

Breakout SignalAggregator::detect_breakout(const CandleWindow& window) {
    if (window.empty()) return Breakout::None;

    double support = window.candles.front().low;
    double resistance = window.candles.front().high;
    for (const auto& c : window.candles) {
        support = std::min(support, c.low);
        resistance = std::max(resistance, c.high);
    }

    double last_close = window.last().close;
    if (last_close > resistance) return Breakout::Up;
    if (last_close < support) return Breakout::Down;
    return Breakout::None;
}

std::vector<PatternHit> SignalAggregator::detect_patterns(const CandleWindow& window) const {
    auto hits = patterns_.detect(window);
    // Detectors must not report zero-strength hits; drop any that slip through
    hits.erase(std::remove_if(hits.begin(), hits.end(),
                              [](const PatternHit& h) { return h.strength == 0; }),
               hits.end());
    return hits;
}

double SignalAggregator::volume_ratio(const CandleWindow& window) const {
    if (window.empty()) return 0.0;

    auto avg_volume = Indicators::last_rolling_mean(Indicators::volumes(window), volume_period_);
    if (!avg_volume || !std::isfinite(*avg_volume) || *avg_volume <= 0.0) {
        return 0.0;
    }

    double ratio = window.last().volume / *avg_volume;
    if (!std::isfinite(ratio) || ratio < 0.0) return 0.0;
    return ratio;
}

bool SignalAggregator::is_high_chance_basic(const FeatureVector& features) {
    return features.breakout != Breakout::None
        && features.pattern_name.has_value()
        && features.volume_ratio > 1.0
        && features.trend != Trend::Flat;
}

std::optional<Direction> SignalAggregator::infer_direction(Breakout breakout, Trend trend) {
    if (breakout == Breakout::Up && trend == Trend::Up) return Direction::Call;
    if (breakout == Breakout::Down && trend == Trend::Down) return Direction::Put;
    return std::nullopt;
}

SignalResult SignalAggregator::evaluate(const CandleWindow& window, double payout) const {
    auto mas = compute_moving_averages(window);
    std::optional<double> ma_fast = mas.last_fast();
    std::optional<double> ma_slow = mas.last_slow();
    std::vector<PatternHit> patterns = detect_patterns(window);

    std::optional<std::string> pattern_name;
    if (!patterns.empty()) {
        pattern_name = patterns.front().name;
    }

    FeatureVector features{pattern_name, detect_breakout(window),
                           detect_trend(ma_fast, ma_slow), volume_ratio(window), payout};
    auto direction = infer_direction(features.breakout, features.trend);
    bool high_chance = is_high_chance_basic(features);

    return SignalResult{features, ma_fast, ma_slow, std::move(patterns), direction, high_chance};
}
