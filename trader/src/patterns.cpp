#include "patterns.hpp"
#include <algorithm>
#include <cmath>

namespace {

constexpr int kBullish = 100;
constexpr int kBearish = -100;

double body(const Candle& c) { return std::abs(c.close - c.open); }
double range(const Candle& c) { return c.high - c.low; }
double upper_shadow(const Candle& c) { return c.high - std::max(c.open, c.close); }
double lower_shadow(const Candle& c) { return std::min(c.open, c.close) - c.low; }
int color(const Candle& c) { return c.close >= c.open ? kBullish : kBearish; }

} // namespace

CandlestickPatterns::CandlestickPatterns(int doji_length, double doji_factor_pct)
    : doji_length_(doji_length)
    , doji_factor_pct_(doji_factor_pct)
{}

std::vector<PatternHit> CandlestickPatterns::detect(const CandleWindow& window) const {
    std::vector<PatternHit> hits;
    if (window.empty()) return hits;

    const Candle& cur = window.last();

    if (is_doji(window)) {
        hits.push_back({"CDL_DOJI", kBullish});
    }

    if (window.size() >= 2) {
        const Candle& prev = window.candles[window.size() - 2];
        if (int s = inside(prev, cur)) hits.push_back({"CDL_INSIDE", s});
        if (int s = engulfing(prev, cur)) hits.push_back({"CDL_ENGULFING", s});
    }

    if (int s = hammer(cur)) hits.push_back({"CDL_HAMMER", s});
    if (int s = shooting_star(cur)) hits.push_back({"CDL_SHOOTINGSTAR", s});
    if (int s = marubozu(cur)) hits.push_back({"CDL_MARUBOZU", s});

    std::sort(hits.begin(), hits.end(),
              [](const PatternHit& a, const PatternHit& b) { return a.name < b.name; });
    return hits;
}

bool CandlestickPatterns::is_doji(const CandleWindow& window) const {
    // Body below factor% of the mean high-low range over the last doji_length_ candles
    if (doji_length_ <= 0 || window.size() < static_cast<size_t>(doji_length_)) {
        return false;
    }

    double range_sum = 0.0;
    for (size_t i = window.size() - doji_length_; i < window.size(); i++) {
        range_sum += range(window.candles[i]);
    }
    double avg_range = range_sum / doji_length_;
    if (avg_range <= 0.0) return false;

    return body(window.last()) < avg_range * doji_factor_pct_ / 100.0;
}

int CandlestickPatterns::inside(const Candle& prev, const Candle& cur) {
    if (cur.high < prev.high && cur.low > prev.low) {
        return color(cur);
    }
    return 0;
}

int CandlestickPatterns::engulfing(const Candle& prev, const Candle& cur) {
    bool prev_bear = prev.close < prev.open;
    bool prev_bull = prev.close > prev.open;
    bool cur_bull = cur.close > cur.open;
    bool cur_bear = cur.close < cur.open;

    if (body(cur) <= body(prev)) return 0;

    if (prev_bear && cur_bull && cur.open <= prev.close && cur.close >= prev.open) {
        return kBullish;
    }
    if (prev_bull && cur_bear && cur.open >= prev.close && cur.close <= prev.open) {
        return kBearish;
    }
    return 0;
}

int CandlestickPatterns::hammer(const Candle& cur) {
    double b = body(cur);
    double r = range(cur);
    if (b <= 0.0 || r <= 0.0) return 0;

    if (lower_shadow(cur) >= 2.0 * b && upper_shadow(cur) <= 0.1 * r) {
        return kBullish;
    }
    return 0;
}

int CandlestickPatterns::shooting_star(const Candle& cur) {
    double b = body(cur);
    double r = range(cur);
    if (b <= 0.0 || r <= 0.0) return 0;

    if (upper_shadow(cur) >= 2.0 * b && lower_shadow(cur) <= 0.1 * r) {
        return kBearish;
    }
    return 0;
}

int CandlestickPatterns::marubozu(const Candle& cur) {
    double r = range(cur);
    if (r <= 0.0) return 0;

    if (body(cur) >= 0.95 * r) {
        return color(cur);
    }
    return 0;
}
