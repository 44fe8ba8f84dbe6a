#pragma once

#include "market/Candle.hpp"
#include "zones/ZoneTypes.hpp"

#include <cstddef>
#include <vector>

namespace Confluence {

struct FairValueGapConfig {
    double min_size_pct = 0.1;
    double strong_threshold_pct = 0.5;
    size_t max_age_bars = 50;        // 0 disables expiry
    double strong_weight = 1.5;
};

// Three-candle imbalance: candle i-1 leaves the interval between close[i-2]
// and open[i] untouched. The gap is filled by the first later close inside it.
class FairValueGapDetector {
public:
    explicit FairValueGapDetector(const FairValueGapConfig& cfg = FairValueGapConfig());

    std::vector<Zone> detect(const CandleSeries& series) const;

    const FairValueGapConfig& config() const { return cfg_; }

private:
    FairValueGapConfig cfg_;
};

}
