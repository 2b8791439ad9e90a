#include "indicators.hpp"
#include <algorithm>
#include <cmath>

namespace {

// Mean of values[end-period+1 .. end], taken relative to the first element so
// a constant run yields exactly that constant.
double window_mean(const std::vector<double>& values, size_t end, size_t period) {
    size_t start = end + 1 - period;
    double anchor = values[start];
    double delta_sum = 0.0;
    for (size_t i = start; i <= end; i++) {
        delta_sum += values[i] - anchor;
    }
    return anchor + delta_sum / static_cast<double>(period);
}

} // namespace

std::vector<std::optional<double>> Indicators::rolling_mean(const std::vector<double>& values,
                                                            int period) {
    std::vector<std::optional<double>> out(values.size());
    if (period <= 0) return out;

    const size_t p = static_cast<size_t>(period);
    for (size_t i = p - 1; i < values.size(); i++) {
        out[i] = window_mean(values, i, p);
    }
    return out;
}

std::optional<double> Indicators::last_rolling_mean(const std::vector<double>& values, int period) {
    if (period <= 0 || values.size() < static_cast<size_t>(period)) {
        return std::nullopt;
    }
    return window_mean(values, values.size() - 1, static_cast<size_t>(period));
}

std::vector<double> Indicators::closes(const CandleWindow& window) {
    std::vector<double> out;
    out.reserve(window.size());
    for (const auto& c : window.candles) out.push_back(c.close);
    return out;
}

std::vector<double> Indicators::volumes(const CandleWindow& window) {
    std::vector<double> out;
    out.reserve(window.size());
    for (const auto& c : window.candles) out.push_back(c.volume);
    return out;
}

std::optional<SupportResistance> Indicators::support_resistance(const CandleWindow& window,
                                                                int lookback) {
    if (lookback <= 0 || window.size() < static_cast<size_t>(lookback)) {
        return std::nullopt;
    }

    SupportResistance sr;
    size_t start = window.size() - lookback;
    sr.support = window.candles[start].low;
    sr.resistance = window.candles[start].high;
    for (size_t i = start; i < window.size(); i++) {
        sr.support = std::min(sr.support, window.candles[i].low);
        sr.resistance = std::max(sr.resistance, window.candles[i].high);
    }
    return sr;
}

std::map<std::string, double> Indicators::fibonacci_levels(const CandleWindow& window) {
    std::map<std::string, double> levels;
    if (window.empty()) return levels;

    double swing_high = window.candles.front().high;
    double swing_low = window.candles.front().low;
    for (const auto& c : window.candles) {
        swing_high = std::max(swing_high, c.high);
        swing_low = std::min(swing_low, c.low);
    }

    double diff = swing_high - swing_low;
    for (double ratio : {0.236, 0.382, 0.5, 0.618, 0.786}) {
        // Key truncates the ratio to whole percent, 0.618 -> fib_61
        int pct = static_cast<int>(std::floor(ratio * 100.0 + 1e-9));
        levels["fib_" + std::to_string(pct)] = swing_low + diff * ratio;
    }
    return levels;
}

std::optional<Trendlines> Indicators::draw_trendlines(const CandleWindow& window) {
    if (window.empty()) return std::nullopt;

    size_t top_idx = 0;
    size_t bottom_idx = 0;
    for (size_t i = 1; i < window.size(); i++) {
        if (window.candles[i].high > window.candles[top_idx].high) top_idx = i;
        if (window.candles[i].low < window.candles[bottom_idx].low) bottom_idx = i;
    }

    Trendlines lines;
    lines.lta = TrendPoint{bottom_idx, window.candles[bottom_idx].low};
    lines.ltb = TrendPoint{top_idx, window.candles[top_idx].high};
    return lines;
}
