#pragma once

#include <string>
#include <vector>
#include <cstdint>

struct Candle {
    int64_t timestamp;  // bucket start, epoch seconds
    double open;
    double high;
    double low;
    double close;
    double volume;
};

// Candles for one instrument, most recent last.
struct CandleWindow {
    std::string instrument;
    std::vector<Candle> candles;

    bool empty() const { return candles.empty(); }
    size_t size() const { return candles.size(); }
    const Candle& last() const { return candles.back(); }

    // Finite fields and strictly increasing timestamps
    bool is_well_formed() const;
};
