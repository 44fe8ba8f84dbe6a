#include "profile/MarketProfileCalculator.hpp"
#include "profile/PriceHistogram.hpp"

using namespace Confluence;

MarketProfileCalculator::MarketProfileCalculator(const MarketProfileConfig& cfg)
    : cfg_(cfg) {}

MarketProfile MarketProfileCalculator::compute(const CandleWindow& window) const {
    DistributionSettings s;
    s.bins = cfg_.bins;
    s.value_area_percent = cfg_.value_area_percent;
    s.hvn_multiplier = cfg_.hvn_multiplier;
    s.lvn_multiplier = cfg_.lvn_multiplier;
    s.time_weighted = cfg_.time_weighted;

    MarketProfile mp;
    mp.profile = build_profile(window, s);

    if (mp.profile.has_value_area() && !mp.profile.in_value_area(window.back().close))
        mp.market_state = MarketState::TRENDING;
    return mp;
}

MarketProfile MarketProfileCalculator::compute_at(const CandleSeries& series, size_t index) const {
    if (index >= series.size() || index < cfg_.period)
        return MarketProfile{};
    return compute(series.window_ending_at(index, cfg_.period + 1));
}

MarketProfile MarketProfileCalculator::compute_latest(const CandleSeries& series) const {
    if (series.empty())
        return MarketProfile{};
    return compute_at(series, series.size() - 1);
}
