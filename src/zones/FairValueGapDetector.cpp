#include "zones/FairValueGapDetector.hpp"

namespace Confluence {

FairValueGapDetector::FairValueGapDetector(const FairValueGapConfig& cfg)
    : cfg_(cfg) {}

std::vector<Zone> FairValueGapDetector::detect(const CandleSeries& series) const {
    std::vector<Zone> out;
    const size_t n = series.size();
    if (n < 3)
        return out;

    for (size_t i = 2; i < n; ++i) {
        const double c0 = series[i - 2].close;
        const double o2 = series[i].open;
        const Candle& mid = series[i - 1];

        Direction dir = Direction::BULLISH;
        if (c0 < o2) {
            if (mid.low < o2 && mid.high > c0)
                continue;
            dir = Direction::BULLISH;
        } else if (c0 > o2) {
            if (mid.low < c0 && mid.high > o2)
                continue;
            dir = Direction::BEARISH;
        } else {
            continue;
        }

        const PriceLevel band = PriceLevel::band(c0, o2);
        if (band.low <= 0.0)
            continue;
        const double size = band_size_pct(band);
        if (size < cfg_.min_size_pct)
            continue;

        Zone z;
        z.kind = ZoneKind::FAIR_VALUE_GAP;
        z.direction = dir;
        z.band = band;
        z.origin_index = i;
        z.valid_from_index = i;
        z.size_pct = size;
        z.strong = size >= cfg_.strong_threshold_pct;
        z.strength = z.strong ? cfg_.strong_weight : 1.0;

        for (size_t j = i + 1; j < n; ++j) {
            if (cfg_.max_age_bars > 0 && j - i > cfg_.max_age_bars) {
                z.valid_until_index = j;
                z.end_reason = ZoneEnd::EXPIRED;
                break;
            }
            if (band.contains(series[j].close)) {
                z.valid_until_index = j;
                z.end_reason = ZoneEnd::FILLED;
                break;
            }
        }

        out.push_back(z);
    }

    return out;
}

}
