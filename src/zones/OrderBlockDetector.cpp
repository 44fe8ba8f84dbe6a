#include "zones/OrderBlockDetector.hpp"

#include <algorithm>
#include <deque>
#include <limits>
#include <optional>

namespace Confluence {

namespace {

// Highest high and lowest low over (i, i + lookback], clipped to the series.
struct FutureExtremes {
    std::vector<double> max_high;
    std::vector<double> min_low;
};

FutureExtremes future_extremes(const CandleSeries& s, size_t lookback) {
    const size_t n = s.size();
    FutureExtremes fx;
    fx.max_high.assign(n, 0.0);
    fx.min_low.assign(n, 0.0);
    if (n < 2 || lookback == 0)
        return fx;

    // Monotonic deques, oldest (largest index) at the front.
    std::deque<size_t> hi;
    std::deque<size_t> lo;
    for (size_t i = n - 1; i-- > 0;) {
        const size_t k = i + 1;
        while (!hi.empty() && s[hi.back()].high <= s[k].high) hi.pop_back();
        hi.push_back(k);
        while (!lo.empty() && s[lo.back()].low >= s[k].low) lo.pop_back();
        lo.push_back(k);

        while (hi.front() > i + lookback) hi.pop_front();
        while (lo.front() > i + lookback) lo.pop_front();

        fx.max_high[i] = s[hi.front()].high;
        fx.min_low[i]  = s[lo.front()].low;
    }
    return fx;
}

double excursion_pct(double extreme, double close, Direction dir) {
    const double move = dir == Direction::BULLISH ? extreme - close : close - extreme;
    return move / close * 100.0;
}

struct Candidate {
    Zone zone;
    size_t window_start = 0;
    size_t known_at = 0;        // last index of the shortest series that reports it
};

bool windows_overlap(const Candidate& a, const Candidate& b) {
    return a.window_start <= b.zone.origin_index && b.window_start <= a.zone.origin_index;
}

}

OrderBlockDetector::OrderBlockDetector(const OrderBlockConfig& cfg)
    : cfg_(cfg)
{
    if (cfg_.min_candles == 0) cfg_.min_candles = 1;
    if (cfg_.max_candles < cfg_.min_candles) cfg_.max_candles = cfg_.min_candles;
}

std::vector<Zone> OrderBlockDetector::detect(const CandleSeries& series) const {
    std::vector<Zone> out;
    const size_t n = series.size();
    if (cfg_.lookback == 0 || n < cfg_.lookback + cfg_.max_candles)
        return out;

    const FutureExtremes fx = future_extremes(series, cfg_.lookback);
    const double limit = cfg_.consolidation_range_mult * series.average_range();

    std::vector<Candidate> candidates;

    const size_t first = std::max(cfg_.lookback, cfg_.min_candles - 1);
    const size_t last = n - cfg_.max_candles;

    for (size_t i = first; i < last; ++i) {
        const double close = series[i].close;
        if (close <= 0.0)
            continue;

        const bool bull = excursion_pct(fx.max_high[i], close, Direction::BULLISH) >= cfg_.impulse_threshold_pct;
        const bool bear = excursion_pct(fx.min_low[i], close, Direction::BEARISH) >= cfg_.impulse_threshold_pct;
        if (!bull && !bear)
            continue;

        // Longest qualifying window ending at i. The window range only grows
        // with its length, so the first breach ends the search.
        std::optional<PriceLevel> band;
        size_t start = i;
        double hi = -std::numeric_limits<double>::infinity();
        double lo = std::numeric_limits<double>::infinity();
        for (size_t len = 1; len <= cfg_.max_candles && len <= i + 1; ++len) {
            const Candle& c = series[i + 1 - len];
            hi = std::max(hi, c.high);
            lo = std::min(lo, c.low);
            if (hi - lo > limit)
                break;
            if (len >= cfg_.min_candles) {
                band = PriceLevel::band(lo, hi);
                start = i + 1 - len;
            }
        }
        if (!band)
            continue;

        const Direction dirs[2] = {Direction::BULLISH, Direction::BEARISH};
        const bool fired[2] = {bull, bear};
        for (int d = 0; d < 2; ++d) {
            if (!fired[d])
                continue;

            Candidate cand;
            cand.window_start = start;
            Zone& z = cand.zone;
            z.kind = ZoneKind::ORDER_BLOCK;
            z.direction = dirs[d];
            z.band = *band;
            z.origin_index = i;
            z.valid_from_index = i + 1;
            z.strength = 1.0;
            z.size_pct = band_size_pct(*band);

            const size_t stop = std::min(n - 1, i + cfg_.lookback);
            for (size_t j = i + 1; j <= stop; ++j) {
                const double extreme = dirs[d] == Direction::BULLISH ? series[j].high : series[j].low;
                if (excursion_pct(extreme, close, dirs[d]) >= cfg_.impulse_threshold_pct) {
                    z.confirmed_index = j;
                    break;
                }
            }
            cand.known_at = std::max(*z.confirmed_index, i + cfg_.max_candles);
            candidates.push_back(cand);
        }
    }

    // Decide candidates in the order a growing series would report them, so
    // appending candles never removes or changes a block already reported.
    std::stable_sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        return a.known_at < b.known_at;
    });

    std::vector<Candidate> kept;
    for (const Candidate& c : candidates) {
        bool merged = false;
        for (const Candidate& k : kept) {
            if (k.zone.direction == c.zone.direction && windows_overlap(k, c)) {
                merged = true;
                break;
            }
        }
        if (!merged) {
            kept.push_back(c);
            out.push_back(c.zone);
        }
    }

    std::sort(out.begin(), out.end(), [](const Zone& a, const Zone& b) {
        if (a.origin_index != b.origin_index)
            return a.origin_index < b.origin_index;
        return a.direction < b.direction;
    });

    for (Zone& z : out) {
        for (size_t j = z.origin_index + 1; j < n; ++j) {
            if (cfg_.max_age > 0 && j - z.origin_index > cfg_.max_age) {
                z.valid_until_index = j;
                z.end_reason = ZoneEnd::EXPIRED;
                break;
            }
            const double c = series[j].close;
            const bool broken = z.direction == Direction::BULLISH ? c < z.band.low
                                                                  : c > z.band.high;
            if (broken) {
                z.valid_until_index = j;
                z.end_reason = ZoneEnd::INVALIDATED;
                break;
            }
        }
    }

    return out;
}

}
