// =============================================================================
// DeltaAnalyzer.hpp - buy/sell pressure estimated from OHLCV candles
// =============================================================================
// Without trade-level data each candle's volume is split by its body:
//   close > open : buy = dominant_share x volume, sell = the rest
//   close < open : mirror
//   close == open: both sides get (1 - dominant_share) x volume
// delta     = buy - sell
// delta_pct = delta / volume x 100, absent on zero volume
// alignment = BULLISH above +threshold_pct, BEARISH below -threshold_pct
//
// Divergence at i compares close and delta with i - divergence_lookback:
// price up with delta down is bearish, price down with delta up is bullish.
//
// Absorption at a price: the last absorption_lookback candles trading within
// absorption_tolerance_pct of it carry a large mean delta (over 2x the average
// candle range) while their combined range stays under half of it.
// =============================================================================
#pragma once

#include "market/Candle.hpp"
#include "market/MarketTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace Confluence {

enum class DeltaAlignment : uint8_t {
    NEUTRAL = 0,
    BULLISH = 1,
    BEARISH = 2
};

const char* to_string(DeltaAlignment a);

struct DeltaConfig {
    double dominant_share = 0.6;
    double threshold_pct = 0.1;
    size_t divergence_lookback = 5;
    size_t absorption_lookback = 10;
    double absorption_tolerance_pct = 0.002;
    size_t summary_lookback = 20;
};

struct DeltaBar {
    double buy_volume = 0.0;
    double sell_volume = 0.0;
    double delta = 0.0;
    std::optional<double> delta_pct;
    DeltaAlignment alignment = DeltaAlignment::NEUTRAL;
    std::optional<Direction> divergence;
};

struct Absorption {
    bool detected = false;
    std::optional<Direction> direction;
    double strength = 0.0;              // |mean delta| / volume of the candles used
};

struct DeltaSummary {
    double avg_delta = 0.0;
    std::optional<double> avg_delta_pct;
    DeltaAlignment alignment = DeltaAlignment::NEUTRAL;          // most frequent
    DeltaAlignment current_alignment = DeltaAlignment::NEUTRAL;  // last candle
    bool divergence_detected = false;
    double current_delta = 0.0;
};

class DeltaAnalyzer {
public:
    explicit DeltaAnalyzer(const DeltaConfig& cfg = DeltaConfig());

    std::vector<DeltaBar> compute(const CandleSeries& series) const;

    Absorption absorption(const CandleSeries& series,
                          const std::vector<DeltaBar>& bars,
                          double price) const;

    // Over the last summary_lookback bars.
    DeltaSummary summary(const std::vector<DeltaBar>& bars) const;

    DeltaBar split(const Candle& c) const;

    const DeltaConfig& config() const { return cfg_; }

private:
    DeltaConfig cfg_;
};

}
