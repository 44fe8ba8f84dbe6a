#pragma once

#include "profile/ProfileTypes.hpp"
#include "regime/StructureTypes.hpp"
#include "signal/SignalTypes.hpp"
#include "zones/ZoneTypes.hpp"

#include <vector>

namespace Confluence {

struct LevelWeights {
    double order_block = 1.0;       // scaled by zone strength
    double fair_value_gap = 1.0;    // scaled by zone strength
    double vp_poc = 2.0;
    double vp_hvn = 1.5;
    double vp_value_area = 1.0;
    double mp_poc = 2.0;
    double mp_value_area = 1.0;
    double liquidity = 1.0;
    double tpo_extreme = 1.0;
};

struct LevelCollectorConfig {
    LevelWeights weights;
    bool include_liquidity = false;
    bool include_tpo = false;
};

// Gathers the levels in force at one evaluation index. Absent prices are
// skipped.
class LevelCollector {
public:
    explicit LevelCollector(const LevelCollectorConfig& cfg = LevelCollectorConfig());

    void add_zones(const std::vector<Zone>& zones, size_t index);
    void add_volume_profile(const Profile& p);
    void add_market_profile(const MarketProfile& mp);
    void add_structure(const StructureState& st);
    void add_tpo(const TpoProfile& tpo);

    const std::vector<WeightedLevel>& levels() const { return levels_; }
    std::vector<WeightedLevel> take() { return std::move(levels_); }

private:
    void push(const std::optional<double>& price, SignalTag tag, double strength);
    void push_band(const PriceLevel& band, SignalTag tag, double strength);

    LevelCollectorConfig cfg_;
    std::vector<WeightedLevel> levels_;
};

}
