#pragma once

#include "candle.hpp"
#include <string>
#include <vector>

struct PatternHit {
    std::string name;
    int strength; // signed, never zero: >0 bullish, <0 bearish
};

// Candlestick pattern recognition for the latest candle of a window.
class PatternDetector {
public:
    virtual ~PatternDetector() = default;
    virtual std::vector<PatternHit> detect(const CandleWindow& window) const = 0;
};

// Native detector. Hits come back sorted by name so the first one is stable.
class CandlestickPatterns : public PatternDetector {
public:
    explicit CandlestickPatterns(int doji_length = 10, double doji_factor_pct = 10.0);

    std::vector<PatternHit> detect(const CandleWindow& window) const override;

private:
    int doji_length_;
    double doji_factor_pct_;

    bool is_doji(const CandleWindow& window) const;
    static int inside(const Candle& prev, const Candle& cur);
    static int engulfing(const Candle& prev, const Candle& cur);
    static int hammer(const Candle& cur);
    static int shooting_star(const Candle& cur);
    static int marubozu(const Candle& cur);
};
