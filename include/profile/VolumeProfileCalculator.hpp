#pragma once

#include "market/Candle.hpp"
#include "profile/ProfileTypes.hpp"

#include <cstddef>

namespace Confluence {

struct VolumeProfileConfig {
    size_t bins = 70;
    double value_area_percent = 0.70;
    double hvn_multiplier = 1.5;
    double lvn_multiplier = 0.5;
    size_t period = 0;              // 0 = every candle up to the evaluation index
};

class VolumeProfileCalculator {
public:
    explicit VolumeProfileCalculator(const VolumeProfileConfig& cfg = VolumeProfileConfig());

    Profile compute(const CandleWindow& window) const;

    // Window of period + 1 candles ending at `index`. INSUFFICIENT_DATA while
    // fewer candles exist.
    Profile compute_at(const CandleSeries& series, size_t index) const;
    Profile compute_latest(const CandleSeries& series) const;

    const VolumeProfileConfig& config() const { return cfg_; }

private:
    VolumeProfileConfig cfg_;
};

}
