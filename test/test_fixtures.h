// ============================================================================
// test_fixtures.h
// Candle builders shared by the unit tests
// ============================================================================
#pragma once

#include "market/Candle.hpp"

#include <cmath>
#include <vector>

namespace Fixtures {

inline Confluence::Candle bar(int64_t ts, double o, double h, double l, double c, double v = 100.0) {
    Confluence::Candle k;
    k.timestamp = ts;
    k.open = o;
    k.high = h;
    k.low = l;
    k.close = c;
    k.volume = v;
    return k;
}

// Series with one-minute spacing starting at t = 60000.
inline Confluence::CandleSeries series(const std::vector<Confluence::Candle>& bars) {
    std::vector<Confluence::Candle> out = bars;
    for (size_t i = 0; i < out.size(); ++i)
        out[i].timestamp = static_cast<int64_t>(i + 1) * 60000;
    return Confluence::CandleSeries(std::move(out));
}

// Reflect every price around `axis` (highs become lows).
inline std::vector<Confluence::Candle> mirror(const std::vector<Confluence::Candle>& bars, double axis) {
    std::vector<Confluence::Candle> out;
    for (const Confluence::Candle& c : bars)
        out.push_back(bar(c.timestamp, axis - c.open, axis - c.low, axis - c.high, axis - c.close, c.volume));
    return out;
}

// 100 candles:
//   0..19   drift up toward 100, range 0.6
//   20..24  flat at exactly 100
//   25..30  impulse +0.5 per candle to 103, range 0.6
//   31..99  flat near 103, range 0.1
// Average range 0.225, so only the flat run around 20..24 forms a
// consolidation. One bullish order block anchored at 22, the first
// candle completing the flat run, band [100, 100].
inline std::vector<Confluence::Candle> order_block_bars() {
    std::vector<Confluence::Candle> bars;
    for (int i = 0; i < 20; ++i) {
        const double c = 94.0 + 0.3 * i;
        bars.push_back(bar(0, c - 0.1, c + 0.3, c - 0.3, c));
    }
    for (int i = 20; i < 25; ++i)
        bars.push_back(bar(0, 100.0, 100.0, 100.0, 100.0));
    for (int i = 25; i < 31; ++i) {
        const double c = 100.0 + 0.5 * (i - 24);
        bars.push_back(bar(0, c - 0.5, c + 0.05, c - 0.55, c));
    }
    for (int i = 31; i < 100; ++i)
        bars.push_back(bar(0, 103.0, 103.05, 102.95, 103.0));
    return bars;
}

inline bool near(double a, double b, double eps = 1e-9) {
    return std::abs(a - b) <= eps;
}

}
