#include "regime/StructureAnalyzer.hpp"

#include <algorithm>

using namespace Confluence;

const char* Confluence::to_string(Trend t) {
    switch (t) {
        case Trend::RANGE:   return "RANGE";
        case Trend::BULLISH: return "BULLISH";
        case Trend::BEARISH: return "BEARISH";
    }
    return "UNKNOWN";
}

const char* Confluence::to_string(SwingKind k) {
    return k == SwingKind::HIGH ? "HIGH" : "LOW";
}

const char* Confluence::to_string(BreakKind k) {
    return k == BreakKind::BOS ? "BOS" : "CHOCH";
}

StructureAnalyzer::StructureAnalyzer(const StructureConfig& cfg)
    : cfg_(cfg) {}

std::vector<SwingPoint> StructureAnalyzer::detect_swings(const CandleSeries& series) const {
    std::vector<SwingPoint> out;
    const size_t L = cfg_.swing_lookback;
    const size_t n = series.size();
    if (n < 2 * L + 1)
        return out;

    for (size_t i = L; i + L < n; ++i) {
        double hi = series[i].high;
        double lo = series[i].low;
        for (size_t j = i - L; j <= i + L; ++j) {
            hi = std::max(hi, series[j].high);
            lo = std::min(lo, series[j].low);
        }
        if (series[i].high == hi)
            out.push_back(SwingPoint{i, series[i].high, SwingKind::HIGH});
        if (series[i].low == lo)
            out.push_back(SwingPoint{i, series[i].low, SwingKind::LOW});
    }
    return out;
}

std::vector<StructureState> StructureAnalyzer::analyze(const CandleSeries& series) const {
    const size_t n = series.size();
    const size_t L = cfg_.swing_lookback;
    std::vector<StructureState> states(n);

    const std::vector<SwingPoint> swings = detect_swings(series);
    size_t next_swing = 0;

    // Last two registered swings of each kind; [1] is the newest.
    std::optional<double> highs[2];
    std::optional<double> lows[2];

    // Unconsumed BOS references.
    std::optional<double> ref_high;
    std::optional<double> ref_low;

    for (size_t i = 0; i < n; ++i) {
        StructureState& st = states[i];

        // ---- Register swings confirmed at this candle ----
        while (next_swing < swings.size() && swings[next_swing].index + L <= i) {
            const SwingPoint& sp = swings[next_swing++];
            if (sp.kind == SwingKind::HIGH) {
                highs[0] = highs[1];
                highs[1] = sp.price;
                ref_high = sp.price;
            } else {
                lows[0] = lows[1];
                lows[1] = sp.price;
                ref_low = sp.price;
            }
        }

        // ---- Change of character ----
        // Holds while the last two swings disagree with the prior leg. A lower
        // high outranks a higher low.
        if (highs[0] && *highs[1] < *highs[0])
            st.choch = BreakEvent{BreakKind::CHOCH, Direction::BEARISH};
        else if (lows[0] && *lows[1] > *lows[0])
            st.choch = BreakEvent{BreakKind::CHOCH, Direction::BULLISH};

        // ---- Break of structure ----
        const double close = series[i].close;
        if (ref_high && close > *ref_high) {
            st.bos = BreakEvent{BreakKind::BOS, Direction::BULLISH};
            ref_high.reset();
        }
        if (ref_low && close < *ref_low) {
            st.bos = BreakEvent{BreakKind::BOS, Direction::BEARISH};
            ref_low.reset();
        }

        // ---- Trend ----
        if (highs[0] && lows[0]) {
            const bool hh = *highs[1] > *highs[0];
            const bool hl = *lows[1] > *lows[0];
            const bool lh = *highs[1] < *highs[0];
            const bool ll = *lows[1] < *lows[0];
            if (hh && hl)
                st.trend = Trend::BULLISH;
            else if (lh && ll)
                st.trend = Trend::BEARISH;
        }

        // ---- Liquidity ----
        st.last_swing_high = highs[1];
        st.last_swing_low = lows[1];
        if (highs[1])
            st.liquidity_high = *highs[1] * (1.0 + cfg_.liquidity_buffer_pct);
        if (lows[1])
            st.liquidity_low = *lows[1] * (1.0 - cfg_.liquidity_buffer_pct);
    }

    return states;
}
