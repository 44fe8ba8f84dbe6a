#pragma once

#include "market/Candle.hpp"
#include "regime/StructureTypes.hpp"

#include <vector>

namespace Confluence {

struct StructureConfig {
    size_t swing_lookback = 5;
    double liquidity_buffer_pct = 0.001;
};

// Swings are the extremum of [i-L, i+L] and become known at i+L. Every state
// only uses swings registered at or before its own index.
class StructureAnalyzer {
public:
    explicit StructureAnalyzer(const StructureConfig& cfg = StructureConfig());

    std::vector<SwingPoint> detect_swings(const CandleSeries& series) const;
    std::vector<StructureState> analyze(const CandleSeries& series) const;

    const StructureConfig& config() const { return cfg_; }

private:
    StructureConfig cfg_;
};

}
