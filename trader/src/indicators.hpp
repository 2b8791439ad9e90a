#pragma once

#include "candle.hpp"
#include <map>
#include <optional>
#include <string>
#include <vector>

struct SupportResistance {
    double support;
    double resistance;
};

struct TrendPoint {
    size_t index;
    double price;
};

struct Trendlines {
    TrendPoint lta; // rising line anchor at the lowest low
    TrendPoint ltb; // falling line anchor at the highest high
};

class Indicators {
public:
    // Right-aligned rolling mean; entries before period-1 are unavailable
    static std::vector<std::optional<double>> rolling_mean(const std::vector<double>& values,
                                                           int period);

    // Rolling mean ending at the last element only
    static std::optional<double> last_rolling_mean(const std::vector<double>& values, int period);

    static std::vector<double> closes(const CandleWindow& window);
    static std::vector<double> volumes(const CandleWindow& window);

    // Read-only analytics, not used for trade decisions
    static std::optional<SupportResistance> support_resistance(const CandleWindow& window,
                                                               int lookback = 50);
    static std::map<std::string, double> fibonacci_levels(const CandleWindow& window);
    static std::optional<Trendlines> draw_trendlines(const CandleWindow& window);
};
