#include "profile/TpoCalculator.hpp"
#include "profile/PriceHistogram.hpp"

#include <algorithm>

using namespace Confluence;

TpoCalculator::TpoCalculator(const TpoConfig& cfg)
    : cfg_(cfg) {}

TpoProfile TpoCalculator::compute(const CandleWindow& window) const {
    TpoProfile tpo;
    if (window.empty())
        return tpo;

    // ---- Initial balance ----
    const size_t ib_n = std::min(std::max<size_t>(cfg_.ib_periods, 1), window.size);
    double ib_hi = window[0].high;
    double ib_lo = window[0].low;
    for (size_t i = 1; i < ib_n; ++i) {
        ib_hi = std::max(ib_hi, window[i].high);
        ib_lo = std::min(ib_lo, window[i].low);
    }
    tpo.ib_high = ib_hi;
    tpo.ib_low = ib_lo;

    double lo = window[0].low;
    double hi = window[0].high;
    for (const Candle& c : window) {
        lo = std::min(lo, c.low);
        hi = std::max(hi, c.high);
    }
    if (lo == hi) {
        tpo.status = ProfileStatus::DEGENERATE_RANGE;
        return tpo;
    }

    PriceHistogram h(lo, hi, cfg_.bins);
    for (const Candle& c : window) {
        const std::pair<size_t, size_t> r = h.bins_touched(c.low, c.high);
        for (size_t b = r.first; b <= r.second; ++b)
            h.add_to_bin(b, 1.0);
    }

    const double bins = static_cast<double>(h.size());
    const double top = bins * (1.0 - cfg_.extreme_fraction);
    const double bottom = bins * cfg_.extreme_fraction;

    std::optional<size_t> lowest_single;
    std::optional<size_t> highest_single;
    for (size_t b = 0; b < h.size(); ++b) {
        if (h.volume(b) != 1.0)
            continue;
        tpo.single_prints.push_back(h.center(b));
        if (!lowest_single)
            lowest_single = b;
        highest_single = b;
    }

    if (highest_single && static_cast<double>(*highest_single) >= top)
        tpo.poor_high = h.center(*highest_single);
    if (lowest_single && static_cast<double>(*lowest_single) <= bottom)
        tpo.poor_low = h.center(*lowest_single);

    tpo.status = ProfileStatus::OK;
    return tpo;
}

TpoProfile TpoCalculator::compute_at(const CandleSeries& series, size_t index) const {
    if (index >= series.size() || index < cfg_.period)
        return TpoProfile{};
    return compute(series.window_ending_at(index, cfg_.period + 1));
}

TpoProfile TpoCalculator::compute_latest(const CandleSeries& series) const {
    if (series.empty())
        return TpoProfile{};
    return compute_at(series, series.size() - 1);
}
