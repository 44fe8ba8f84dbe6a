// =============================================================================
// AtrCalculator.hpp - Average True Range over a closed candle series
// =============================================================================
// TR[i]  = max(high - low, |high - close[i-1]|, |low - close[i-1]|)
// TR[0]  = high - low
// ATR[i] = simple mean of TR over the last `period` candles; absent before
//          the window is full.
// =============================================================================
#pragma once

#include "market/Candle.hpp"

#include <cstddef>
#include <optional>
#include <vector>

namespace Confluence {

class AtrCalculator {
public:
    explicit AtrCalculator(size_t period = 14);

    std::vector<std::optional<double>> compute(const CandleSeries& series) const;
    std::optional<double> latest(const CandleSeries& series) const;

    static double true_range(const Candle& c, const Candle* prev);

    size_t period() const { return period_; }

private:
    size_t period_;
};

}
