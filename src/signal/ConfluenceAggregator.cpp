#include "signal/ConfluenceAggregator.hpp"

#include <algorithm>
#include <cmath>

using namespace Confluence;

const char* Confluence::to_string(SignalTag t) {
    switch (t) {
        case SignalTag::ORDER_BLOCK:    return "order_block";
        case SignalTag::FAIR_VALUE_GAP: return "fvg";
        case SignalTag::VP_POC:         return "vp_poc";
        case SignalTag::VP_VAH:         return "vp_vah";
        case SignalTag::VP_VAL:         return "vp_val";
        case SignalTag::VP_HVN:         return "vp_hvn";
        case SignalTag::MP_POC:         return "mp_poc";
        case SignalTag::MP_VAH:         return "mp_vah";
        case SignalTag::MP_VAL:         return "mp_val";
        case SignalTag::LIQUIDITY_HIGH: return "liquidity_high";
        case SignalTag::LIQUIDITY_LOW:  return "liquidity_low";
        case SignalTag::TPO_POOR_HIGH:  return "tpo_poor_high";
        case SignalTag::TPO_POOR_LOW:   return "tpo_poor_low";
    }
    return "unknown";
}

namespace {

bool level_less(const WeightedLevel& a, const WeightedLevel& b) {
    if (a.price != b.price) return a.price < b.price;
    if (a.tag != b.tag) return a.tag < b.tag;
    if (a.strength != b.strength) return a.strength < b.strength;
    if (a.band.low != b.band.low) return a.band.low < b.band.low;
    return a.band.high < b.band.high;
}

ConfluenceZone make_zone(const std::vector<WeightedLevel>& cluster) {
    ConfluenceZone z;
    double sum = 0.0;
    z.band = cluster.front().band;
    for (const WeightedLevel& l : cluster) {
        sum += l.price;
        z.strength += l.strength;
        z.band.low = std::min(z.band.low, l.band.low);
        z.band.high = std::max(z.band.high, l.band.high);
        z.contributing_signals.insert(l.tag);
    }
    z.level = sum / static_cast<double>(cluster.size());
    z.signal_count = z.contributing_signals.size();
    return z;
}

}

ConfluenceAggregator::ConfluenceAggregator(const ConfluenceConfig& cfg)
    : cfg_(cfg) {}

std::vector<ConfluenceZone> ConfluenceAggregator::find_zones(
    std::vector<WeightedLevel> levels,
    size_t min_signals) const
{
    std::vector<ConfluenceZone> out;

    levels.erase(std::remove_if(levels.begin(), levels.end(),
                                [](const WeightedLevel& l) { return !std::isfinite(l.price); }),
                 levels.end());
    if (levels.empty())
        return out;

    std::sort(levels.begin(), levels.end(), level_less);

    auto flush = [&](const std::vector<WeightedLevel>& cluster) {
        ConfluenceZone z = make_zone(cluster);
        if (z.signal_count >= min_signals)
            out.push_back(std::move(z));
    };

    std::vector<WeightedLevel> cluster;
    cluster.push_back(levels.front());
    for (size_t i = 1; i < levels.size(); ++i) {
        const double prev = cluster.back().price;
        if (std::abs(levels[i].price - prev) <= std::abs(prev) * cfg_.tolerance_pct) {
            cluster.push_back(levels[i]);
        } else {
            flush(cluster);
            cluster.clear();
            cluster.push_back(levels[i]);
        }
    }
    flush(cluster);

    std::sort(out.begin(), out.end(), [](const ConfluenceZone& a, const ConfluenceZone& b) {
        if (a.strength != b.strength)
            return a.strength > b.strength;
        return a.level < b.level;
    });
    return out;
}

bool ConfluenceAggregator::contains(const ConfluenceZone& zone, double price,
                                    double tolerance_pct) {
    const double tol = std::abs(price) * tolerance_pct;
    return price >= zone.band.low - tol && price <= zone.band.high + tol;
}
