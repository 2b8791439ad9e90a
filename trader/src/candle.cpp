#include "candle.hpp"
#include <cmath>

bool CandleWindow::is_well_formed() const {
    for (size_t i = 0; i < candles.size(); i++) {
        const auto& c = candles[i];
        if (!std::isfinite(c.open) || !std::isfinite(c.high) ||
            !std::isfinite(c.low) || !std::isfinite(c.close) ||
            !std::isfinite(c.volume)) {
            return false;
        }
        if (i > 0 && c.timestamp <= candles[i - 1].timestamp) {
            return false;
        }
    }
    return true;
}
