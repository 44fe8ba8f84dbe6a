#include "profile/VolumeProfileCalculator.hpp"
#include "profile/PriceHistogram.hpp"

using namespace Confluence;

VolumeProfileCalculator::VolumeProfileCalculator(const VolumeProfileConfig& cfg)
    : cfg_(cfg) {}

Profile VolumeProfileCalculator::compute(const CandleWindow& window) const {
    DistributionSettings s;
    s.bins = cfg_.bins;
    s.value_area_percent = cfg_.value_area_percent;
    s.hvn_multiplier = cfg_.hvn_multiplier;
    s.lvn_multiplier = cfg_.lvn_multiplier;
    s.time_weighted = false;
    return build_profile(window, s);
}

Profile VolumeProfileCalculator::compute_at(const CandleSeries& series, size_t index) const {
    if (index >= series.size() || index < cfg_.period)
        return Profile{};
    if (cfg_.period == 0)
        return compute(series.window(0, index + 1));
    return compute(series.window_ending_at(index, cfg_.period + 1));
}

Profile VolumeProfileCalculator::compute_latest(const CandleSeries& series) const {
    if (series.empty())
        return Profile{};
    return compute_at(series, series.size() - 1);
}
