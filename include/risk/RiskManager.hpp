// =============================================================================
// RiskManager.hpp - position sizing, stops, targets and plan validation
// =============================================================================
// RULES:
//   - Risk per trade is clamped to max_risk_per_trade
//   - Stops prefer a protective zone edge, then ATR, then a flat percentage
//   - A plan with reward:risk below min_risk_reward_ratio is rejected
//   - Trailing stops never loosen
//   - Rejections are typed RiskError values, never exceptions
// =============================================================================
#pragma once

#include "risk/RiskTypes.hpp"
#include "signal/SignalTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Confluence {

struct RiskConfig {
    double risk_per_trade = 0.01;
    double max_risk_per_trade = 0.02;
    double min_risk_reward_ratio = 2.0;
    double atr_stop_multiplier = 1.5;
    double zone_buffer_pct = 0.001;
    double fallback_stop_pct = 0.02;
    double trailing_distance_pct = 0.005;
    double trailing_atr_multiplier = 0.0;   // 0 = percentage trail
    double trailing_floor_pct = 0.01;
};

class RiskManager {
public:
    explicit RiskManager(const RiskConfig& cfg = RiskConfig());

    double position_size(double entry, double stop, double balance, double risk_pct) const;

    double stop_loss(double entry,
                     const std::optional<PriceLevel>& zone_band,
                     const std::optional<double>& atr,
                     TradeDirection direction) const;

    TakeProfit take_profit(double entry,
                           double stop,
                           const std::vector<double>& hvn_levels,
                           const std::vector<Zone>& fvg_zones,
                           const std::optional<PriceLevel>& opposite_zone,
                           TradeDirection direction) const;

    double trailing_stop(double current,
                         double entry,
                         double current_stop,
                         const std::optional<double>& atr,
                         TradeDirection direction) const;

    RiskCheck validate(double entry, double stop, const std::optional<double>& take_profit) const;

    PlanResult plan_trade(const std::string& symbol,
                          TradeDirection direction,
                          double entry,
                          const AccountState& account,
                          const TradeContext& context) const;

    PlanResult plan_zone(const std::string& symbol,
                         const ConfluenceZone& zone,
                         double current_price,
                         const AccountState& account,
                         TradeContext context) const;

    // LONG when price is at or above the zone level.
    static TradeDirection direction_for(const ConfluenceZone& zone, double current_price);

    const RiskConfig& config() const { return cfg_; }

private:
    RiskConfig cfg_;
};

}
