#include "signal/LevelCollector.hpp"

using namespace Confluence;

LevelCollector::LevelCollector(const LevelCollectorConfig& cfg)
    : cfg_(cfg) {}

void LevelCollector::push(const std::optional<double>& price, SignalTag tag, double strength) {
    if (!price)
        return;
    levels_.push_back(WeightedLevel{*price, PriceLevel::point(*price), tag, strength});
}

void LevelCollector::push_band(const PriceLevel& band, SignalTag tag, double strength) {
    levels_.push_back(WeightedLevel{band.mid(), band, tag, strength});
}

void LevelCollector::add_zones(const std::vector<Zone>& zones, size_t index) {
    for (const Zone& z : zones) {
        if (!z.active_at(index))
            continue;
        if (z.kind == ZoneKind::ORDER_BLOCK)
            push_band(z.band, SignalTag::ORDER_BLOCK, cfg_.weights.order_block * z.strength);
        else
            push_band(z.band, SignalTag::FAIR_VALUE_GAP, cfg_.weights.fair_value_gap * z.strength);
    }
}

void LevelCollector::add_volume_profile(const Profile& p) {
    push(p.poc, SignalTag::VP_POC, cfg_.weights.vp_poc);
    push(p.vah, SignalTag::VP_VAH, cfg_.weights.vp_value_area);
    push(p.val, SignalTag::VP_VAL, cfg_.weights.vp_value_area);
    for (double h : p.hvn)
        push(h, SignalTag::VP_HVN, cfg_.weights.vp_hvn);
}

void LevelCollector::add_market_profile(const MarketProfile& mp) {
    push(mp.profile.poc, SignalTag::MP_POC, cfg_.weights.mp_poc);
    push(mp.profile.vah, SignalTag::MP_VAH, cfg_.weights.mp_value_area);
    push(mp.profile.val, SignalTag::MP_VAL, cfg_.weights.mp_value_area);
}

void LevelCollector::add_structure(const StructureState& st) {
    if (!cfg_.include_liquidity)
        return;
    push(st.liquidity_high, SignalTag::LIQUIDITY_HIGH, cfg_.weights.liquidity);
    push(st.liquidity_low, SignalTag::LIQUIDITY_LOW, cfg_.weights.liquidity);
}

void LevelCollector::add_tpo(const TpoProfile& tpo) {
    if (!cfg_.include_tpo)
        return;
    push(tpo.poor_high, SignalTag::TPO_POOR_HIGH, cfg_.weights.tpo_extreme);
    push(tpo.poor_low, SignalTag::TPO_POOR_LOW, cfg_.weights.tpo_extreme);
}
