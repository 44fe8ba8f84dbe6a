#pragma once

#include "signal/SignalTypes.hpp"

#include <utility>
#include <vector>

namespace Confluence {

struct ConfluenceConfig {
    double tolerance_pct = 0.005;
    size_t min_signals = 3;
    double zone_tolerance_pct = 0.002;
};

// Clusters price-sorted levels with a chained tolerance: a level joins the
// open cluster when it is within tolerance of the last level added. Cluster
// span is therefore unbounded.
class ConfluenceAggregator {
public:
    explicit ConfluenceAggregator(const ConfluenceConfig& cfg = ConfluenceConfig());

    std::vector<ConfluenceZone> find_zones(std::vector<WeightedLevel> levels,
                                           size_t min_signals) const;
    std::vector<ConfluenceZone> find_zones(std::vector<WeightedLevel> levels) const {
        return find_zones(std::move(levels), cfg_.min_signals);
    }

    static bool contains(const ConfluenceZone& zone, double price,
                         double tolerance_pct = 0.002);

    bool in_zone(const ConfluenceZone& zone, double price) const {
        return contains(zone, price, cfg_.zone_tolerance_pct);
    }

    const ConfluenceConfig& config() const { return cfg_; }

private:
    ConfluenceConfig cfg_;
};

}
