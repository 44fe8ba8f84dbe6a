#include "micro/DeltaAnalyzer.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace Confluence {

const char* to_string(DeltaAlignment a) {
    switch (a) {
        case DeltaAlignment::NEUTRAL: return "NEUTRAL";
        case DeltaAlignment::BULLISH: return "BULLISH";
        case DeltaAlignment::BEARISH: return "BEARISH";
    }
    return "UNKNOWN";
}

DeltaAnalyzer::DeltaAnalyzer(const DeltaConfig& cfg)
    : cfg_(cfg)
{
    if (!(cfg_.dominant_share >= 0.0 && cfg_.dominant_share <= 1.0))
        throw std::invalid_argument("[DELTA] dominant_share must be within [0, 1]");
    if (cfg_.summary_lookback == 0) cfg_.summary_lookback = 1;
}

DeltaBar DeltaAnalyzer::split(const Candle& c) const {
    const double major = c.volume * cfg_.dominant_share;
    const double minor = c.volume * (1.0 - cfg_.dominant_share);

    DeltaBar b;
    b.buy_volume = c.close > c.open ? major : minor;
    b.sell_volume = c.close < c.open ? major : minor;
    b.delta = b.buy_volume - b.sell_volume;

    if (c.volume > 0.0) {
        b.delta_pct = b.delta / c.volume * 100.0;
        if (*b.delta_pct > cfg_.threshold_pct)
            b.alignment = DeltaAlignment::BULLISH;
        else if (*b.delta_pct < -cfg_.threshold_pct)
            b.alignment = DeltaAlignment::BEARISH;
    }
    return b;
}

std::vector<DeltaBar> DeltaAnalyzer::compute(const CandleSeries& series) const {
    const size_t n = series.size();
    std::vector<DeltaBar> out;
    out.reserve(n);
    for (size_t i = 0; i < n; ++i)
        out.push_back(split(series[i]));

    const size_t lb = cfg_.divergence_lookback;
    if (lb == 0)
        return out;

    for (size_t i = lb; i < n; ++i) {
        const double price_change = series[i].close - series[i - lb].close;
        const double delta_change = out[i].delta - out[i - lb].delta;
        if (price_change > 0.0 && delta_change < 0.0)
            out[i].divergence = Direction::BEARISH;
        else if (price_change < 0.0 && delta_change > 0.0)
            out[i].divergence = Direction::BULLISH;
    }
    return out;
}

Absorption DeltaAnalyzer::absorption(const CandleSeries& series,
                                     const std::vector<DeltaBar>& bars,
                                     double price) const
{
    Absorption r;
    const size_t n = std::min(series.size(), bars.size());
    if (n == 0 || cfg_.absorption_lookback == 0)
        return r;

    const double tol = price * cfg_.absorption_tolerance_pct;

    // Newest first, stop once the lookback is filled.
    double delta_sum = 0.0;
    double volume_sum = 0.0;
    double hi = 0.0;
    double lo = 0.0;
    size_t used = 0;
    for (size_t k = n; k-- > 0 && used < cfg_.absorption_lookback;) {
        const Candle& c = series[k];
        if (c.low > price + tol || c.high < price - tol)
            continue;
        if (used == 0) {
            hi = c.high;
            lo = c.low;
        } else {
            hi = std::max(hi, c.high);
            lo = std::min(lo, c.low);
        }
        delta_sum += bars[k].delta;
        volume_sum += c.volume;
        ++used;
    }
    if (used == 0)
        return r;

    const double avg_delta = delta_sum / static_cast<double>(used);
    const double avg_range = series.average_range();
    if (std::abs(avg_delta) > avg_range * 2.0 && hi - lo < avg_range * 0.5) {
        r.detected = true;
        r.direction = avg_delta > 0.0 ? Direction::BULLISH : Direction::BEARISH;
        r.strength = volume_sum > 0.0 ? std::abs(avg_delta) / volume_sum : 0.0;
    }
    return r;
}

DeltaSummary DeltaAnalyzer::summary(const std::vector<DeltaBar>& bars) const {
    DeltaSummary s;
    if (bars.empty())
        return s;

    const size_t count = std::min(cfg_.summary_lookback, bars.size());
    const size_t first = bars.size() - count;

    double delta_sum = 0.0;
    double pct_sum = 0.0;
    size_t pct_count = 0;
    size_t votes[3] = {0, 0, 0};
    for (size_t i = first; i < bars.size(); ++i) {
        const DeltaBar& b = bars[i];
        delta_sum += b.delta;
        if (b.delta_pct) {
            pct_sum += *b.delta_pct;
            ++pct_count;
        }
        ++votes[static_cast<size_t>(b.alignment)];
        if (b.divergence)
            s.divergence_detected = true;
    }

    s.avg_delta = delta_sum / static_cast<double>(count);
    if (pct_count > 0)
        s.avg_delta_pct = pct_sum / static_cast<double>(pct_count);

    // A tie between the leaders reads as NEUTRAL.
    const size_t bull = votes[static_cast<size_t>(DeltaAlignment::BULLISH)];
    const size_t bear = votes[static_cast<size_t>(DeltaAlignment::BEARISH)];
    const size_t flat = votes[static_cast<size_t>(DeltaAlignment::NEUTRAL)];
    if (bull > bear && bull > flat)
        s.alignment = DeltaAlignment::BULLISH;
    else if (bear > bull && bear > flat)
        s.alignment = DeltaAlignment::BEARISH;

    s.current_alignment = bars.back().alignment;
    s.current_delta = bars.back().delta;
    return s;
}

}
