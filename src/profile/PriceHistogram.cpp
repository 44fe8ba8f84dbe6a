#include "profile/PriceHistogram.hpp"

#include <algorithm>
#include <cmath>

namespace Confluence {

namespace {
// Tolerance in bucket units so a price sitting on an edge is not pushed into
// the neighbouring bucket by rounding.
constexpr double kEdgeEps = 1e-9;
}

const char* to_string(ProfileStatus s) {
    switch (s) {
        case ProfileStatus::OK:                return "OK";
        case ProfileStatus::INSUFFICIENT_DATA: return "INSUFFICIENT_DATA";
        case ProfileStatus::DEGENERATE_RANGE:  return "DEGENERATE_RANGE";
        case ProfileStatus::NO_VALUE_AREA:     return "NO_VALUE_AREA";
    }
    return "UNKNOWN";
}

const char* to_string(MarketState s) {
    return s == MarketState::TRENDING ? "TRENDING" : "BALANCED";
}

PriceHistogram::PriceHistogram(double price_min, double price_max, size_t bins)
    : min_(price_min),
      width_(0.0),
      volume_(bins == 0 ? 1 : bins, 0.0)
{
    width_ = (price_max - price_min) / static_cast<double>(volume_.size());
}

std::pair<size_t, size_t> PriceHistogram::bins_touched(double low, double high) const {
    const size_t last = volume_.size() - 1;
    if (width_ <= 0.0)
        return {0, 0};

    const double lo_f = std::floor((low - min_) / width_ + kEdgeEps);
    const double hi_f = std::ceil((high - min_) / width_ - kEdgeEps) - 1.0;

    size_t lo = lo_f <= 0.0 ? 0 : std::min(last, static_cast<size_t>(lo_f));
    size_t hi = hi_f <= 0.0 ? 0 : std::min(last, static_cast<size_t>(hi_f));
    if (hi < lo)
        hi = lo;
    return {lo, hi};
}

void PriceHistogram::add_range(double low, double high, double weight) {
    const std::pair<size_t, size_t> r = bins_touched(low, high);
    const double share = weight / static_cast<double>(r.second - r.first + 1);
    for (size_t b = r.first; b <= r.second; ++b)
        volume_[b] += share;
}

size_t PriceHistogram::poc_bin() const {
    size_t best = 0;
    for (size_t b = 1; b < volume_.size(); ++b) {
        if (volume_[b] > volume_[best])
            best = b;
    }
    return best;
}

std::pair<size_t, size_t> PriceHistogram::value_area(size_t poc, double target) const {
    size_t lower = poc;
    size_t upper = poc;
    double acc = volume_[poc];
    const size_t last = volume_.size() - 1;

    while (acc < target && (lower > 0 || upper < last)) {
        const bool can_down = lower > 0;
        const bool can_up = upper < last;
        const double down = can_down ? volume_[lower - 1] : -1.0;
        const double up = can_up ? volume_[upper + 1] : -1.0;

        if (can_down && (!can_up || down >= up)) {
            --lower;
            acc += volume_[lower];
        } else {
            ++upper;
            acc += volume_[upper];
        }
    }
    return {lower, upper};
}

double PriceHistogram::total() const {
    double t = 0.0;
    for (double v : volume_)
        t += v;
    return t;
}

Profile build_profile(const CandleWindow& window, const DistributionSettings& s) {
    Profile p;
    if (window.empty()) {
        p.status = ProfileStatus::INSUFFICIENT_DATA;
        return p;
    }

    double lo = window[0].low;
    double hi = window[0].high;
    double total = 0.0;
    for (const Candle& c : window) {
        lo = std::min(lo, c.low);
        hi = std::max(hi, c.high);
        total += s.time_weighted ? 1.0 : c.volume;
    }
    p.profile_low = lo;
    p.profile_high = hi;
    p.total_volume = total;

    if (lo == hi) {
        p.status = ProfileStatus::DEGENERATE_RANGE;
        p.poc = lo;
        p.val = lo;
        p.vah = lo;
        p.bins.push_back(ProfileBin{lo, total});
        return p;
    }

    PriceHistogram h(lo, hi, s.bins);
    for (const Candle& c : window)
        h.add_range(c.low, c.high, s.time_weighted ? 1.0 : c.volume);

    p.bins.reserve(h.size());
    for (size_t b = 0; b < h.size(); ++b)
        p.bins.push_back(ProfileBin{h.center(b), h.volume(b)});

    if (total <= 0.0) {
        p.status = ProfileStatus::NO_VALUE_AREA;
        return p;
    }

    const size_t poc = h.poc_bin();
    const std::pair<size_t, size_t> va = h.value_area(poc, s.value_area_percent * total);
    p.status = ProfileStatus::OK;
    p.poc = h.center(poc);
    p.val = h.center(va.first);
    p.vah = h.center(va.second);

    const double mean = total / static_cast<double>(h.size());
    for (size_t b = 0; b < h.size(); ++b) {
        const double v = h.volume(b);
        if (v > 0.0 && v >= s.hvn_multiplier * mean)
            p.hvn.push_back(h.center(b));
        if (v > 0.0 && v <= s.lvn_multiplier * mean)
            p.lvn.push_back(h.center(b));
    }
    return p;
}

}
