// =============================================================================
// OrderBlockDetector.hpp - consolidation ranges that precede an impulse
// =============================================================================
// A candidate at i needs:
//   - an impulse: the extreme of (i, i+lookback] at least impulse_threshold_pct
//     away from close[i]
//   - a consolidation: the longest window ending at i, between max_candles and
//     min_candles long, whose range is within consolidation_range_mult times
//     the series' average candle range
//
// A candidate is known once it is confirmed and at least max_candles candles
// follow it. Same-direction candidates whose windows overlap an earlier-known
// block are dropped, so a longer series only ever adds blocks. The average
// range still covers the whole series.
// Validity is computed in one forward scan per zone.
// =============================================================================
#pragma once

#include "market/Candle.hpp"
#include "zones/ZoneTypes.hpp"

#include <cstddef>
#include <vector>

namespace Confluence {

struct OrderBlockConfig {
    size_t min_candles = 3;
    size_t max_candles = 5;
    double impulse_threshold_pct = 1.5;
    size_t lookback = 20;
    size_t max_age = 100;                   // 0 disables expiry
    double consolidation_range_mult = 1.5;
};

class OrderBlockDetector {
public:
    explicit OrderBlockDetector(const OrderBlockConfig& cfg = OrderBlockConfig());

    std::vector<Zone> detect(const CandleSeries& series) const;

    const OrderBlockConfig& config() const { return cfg_; }

private:
    OrderBlockConfig cfg_;
};

}
