#pragma once

#include "market/Candle.hpp"
#include "profile/ProfileTypes.hpp"

#include <cstddef>

namespace Confluence {

struct TpoConfig {
    size_t bins = 30;
    size_t ib_periods = 4;
    double extreme_fraction = 0.2;
    size_t period = 24;             // window = last period + 1 candles
};

// Time-at-price: every candle marks each bucket it touches once.
class TpoCalculator {
public:
    explicit TpoCalculator(const TpoConfig& cfg = TpoConfig());

    TpoProfile compute(const CandleWindow& window) const;
    TpoProfile compute_at(const CandleSeries& series, size_t index) const;
    TpoProfile compute_latest(const CandleSeries& series) const;

    const TpoConfig& config() const { return cfg_; }

private:
    TpoConfig cfg_;
};

}
