// =============================================================================
// PriceHistogram.hpp - fixed-width price buckets shared by every profile
// =============================================================================
// [price_min, price_max] is split into `bins` equal buckets. A candle adds its
// weight evenly across the buckets its [low, high] touches; a zero-width candle
// lands in the single bucket holding its price.
// =============================================================================
#pragma once

#include "market/Candle.hpp"
#include "profile/ProfileTypes.hpp"

#include <cstddef>
#include <utility>
#include <vector>

namespace Confluence {

class PriceHistogram {
public:
    PriceHistogram(double price_min, double price_max, size_t bins);

    // Inclusive bucket range touched by [low, high].
    std::pair<size_t, size_t> bins_touched(double low, double high) const;

    void add_range(double low, double high, double weight);
    void add_to_bin(size_t bin, double weight) { volume_[bin] += weight; }

    // Max-volume bucket; ties go to the lowest index.
    size_t poc_bin() const;

    // Greedy expansion from `poc` until `target` volume is held.
    std::pair<size_t, size_t> value_area(size_t poc, double target) const;

    double center(size_t bin) const { return min_ + (static_cast<double>(bin) + 0.5) * width_; }
    double volume(size_t bin) const { return volume_[bin]; }
    size_t size() const { return volume_.size(); }
    double total() const;

private:
    double min_;
    double width_;
    std::vector<double> volume_;
};

struct DistributionSettings {
    size_t bins = 70;
    double value_area_percent = 0.70;
    double hvn_multiplier = 1.5;
    double lvn_multiplier = 0.5;
    bool time_weighted = false;     // one unit per candle instead of its volume
};

// Full profile of a window: status, POC, value area, HVN/LVN, extremes.
Profile build_profile(const CandleWindow& window, const DistributionSettings& s);

}
