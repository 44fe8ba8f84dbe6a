#pragma once

#include "market/Candle.hpp"
#include "profile/ProfileTypes.hpp"

#include <cstddef>

namespace Confluence {

struct MarketProfileConfig {
    size_t bins = 30;
    double value_area_percent = 0.70;
    size_t period = 24;             // window = last period + 1 candles
    bool time_weighted = false;
    double hvn_multiplier = 1.5;
    double lvn_multiplier = 0.5;
};

// Session-style profile. TRENDING when the window's last close sits outside
// the value area, BALANCED otherwise.
class MarketProfileCalculator {
public:
    explicit MarketProfileCalculator(const MarketProfileConfig& cfg = MarketProfileConfig());

    MarketProfile compute(const CandleWindow& window) const;
    MarketProfile compute_at(const CandleSeries& series, size_t index) const;
    MarketProfile compute_latest(const CandleSeries& series) const;

    const MarketProfileConfig& config() const { return cfg_; }

private:
    MarketProfileConfig cfg_;
};

}
