#include "risk/RiskManager.hpp"

#include <algorithm>
#include <cmath>

using namespace Confluence;

namespace {
// Reward:risk computed from a target derived as entry + risk * ratio may land
// a few ulps under the ratio.
constexpr double kRatioEps = 1e-9;
}

const char* Confluence::to_string(TradeDirection d) {
    return d == TradeDirection::LONG ? "LONG" : "SHORT";
}

const char* Confluence::to_string(RiskError e) {
    switch (e) {
        case RiskError::NONE:                      return "NONE";
        case RiskError::DEGENERATE_STOP:           return "DEGENERATE_STOP";
        case RiskError::INVALID_TARGET:            return "INVALID_TARGET";
        case RiskError::INSUFFICIENT_REWARD_RATIO: return "INSUFFICIENT_REWARD_RATIO";
        case RiskError::INSUFFICIENT_CAPITAL:      return "INSUFFICIENT_CAPITAL";
    }
    return "UNKNOWN";
}

RiskManager::RiskManager(const RiskConfig& cfg)
    : cfg_(cfg) {}

double RiskManager::position_size(double entry, double stop, double balance, double risk_pct) const {
    const double distance = std::abs(entry - stop);
    if (distance == 0.0 || balance <= 0.0)
        return 0.0;

    const double pct = std::clamp(risk_pct, 0.0, cfg_.max_risk_per_trade);
    return balance * pct / distance;
}

double RiskManager::stop_loss(double entry,
                              const std::optional<PriceLevel>& zone_band,
                              const std::optional<double>& atr,
                              TradeDirection direction) const
{
    const bool has_atr = atr && *atr > 0.0;

    if (direction == TradeDirection::LONG) {
        if (zone_band && zone_band->low < entry)
            return zone_band->low * (1.0 - cfg_.zone_buffer_pct);
        if (has_atr)
            return entry - *atr * cfg_.atr_stop_multiplier;
        return entry * (1.0 - cfg_.fallback_stop_pct);
    }

    if (zone_band && zone_band->high > entry)
        return zone_band->high * (1.0 + cfg_.zone_buffer_pct);
    if (has_atr)
        return entry + *atr * cfg_.atr_stop_multiplier;
    return entry * (1.0 + cfg_.fallback_stop_pct);
}

TakeProfit RiskManager::take_profit(double entry,
                                    double stop,
                                    const std::vector<double>& hvn_levels,
                                    const std::vector<Zone>& fvg_zones,
                                    const std::optional<PriceLevel>& opposite_zone,
                                    TradeDirection direction) const
{
    const double risk = std::abs(entry - stop);
    const bool is_long = direction == TradeDirection::LONG;
    const Direction fvg_dir = is_long ? Direction::BULLISH : Direction::BEARISH;
    const double tp_min = is_long ? entry + risk * cfg_.min_risk_reward_ratio
                                  : entry - risk * cfg_.min_risk_reward_ratio;

    // Favourable side and at least tp_min away.
    auto reaches = [&](double px) {
        return is_long ? (px > entry && px >= tp_min) : (px < entry && px <= tp_min);
    };
    auto nearer = [&](double a, double b) { return is_long ? a < b : a > b; };

    std::optional<double> tp1;
    auto consider = [&](std::optional<double>& best, double px) {
        if (!best || nearer(px, *best))
            best = px;
    };

    for (double h : hvn_levels) {
        if (reaches(h))
            consider(tp1, h);
    }
    for (const Zone& z : fvg_zones) {
        if (z.kind != ZoneKind::FAIR_VALUE_GAP || z.direction != fvg_dir)
            continue;
        const double near_edge = is_long ? z.band.low : z.band.high;
        if (reaches(near_edge))
            consider(tp1, near_edge);
    }

    TakeProfit tp;
    tp.tp1 = tp1 ? *tp1 : tp_min;

    auto beyond = [&](double px) { return is_long ? px > tp.tp1 : px < tp.tp1; };

    if (opposite_zone) {
        const double near_edge = is_long ? opposite_zone->low : opposite_zone->high;
        const double far_edge = is_long ? opposite_zone->high : opposite_zone->low;
        if (beyond(near_edge))
            tp.tp2 = near_edge;
        else if (beyond(far_edge))
            tp.tp2 = far_edge;
    }

    if (!tp.tp2) {
        std::optional<double> best;
        for (const Zone& z : fvg_zones) {
            if (z.kind != ZoneKind::FAIR_VALUE_GAP || z.direction != fvg_dir)
                continue;
            const double far_edge = is_long ? z.band.high : z.band.low;
            if (beyond(far_edge))
                consider(best, far_edge);
        }
        tp.tp2 = best;
    }

    return tp;
}

double RiskManager::trailing_stop(double current,
                                  double entry,
                                  double current_stop,
                                  const std::optional<double>& atr,
                                  TradeDirection direction) const
{
    double distance = current * cfg_.trailing_distance_pct;
    if (cfg_.trailing_atr_multiplier > 0.0 && atr && *atr > 0.0)
        distance = *atr * cfg_.trailing_atr_multiplier;

    if (direction == TradeDirection::LONG) {
        return std::max({current - distance,
                         current_stop,
                         entry * (1.0 - cfg_.trailing_floor_pct)});
    }
    return std::min({current + distance,
                     current_stop,
                     entry * (1.0 + cfg_.trailing_floor_pct)});
}

RiskCheck RiskManager::validate(double entry, double stop,
                                const std::optional<double>& take_profit) const
{
    RiskCheck check;
    const double risk = std::abs(entry - stop);
    if (risk == 0.0) {
        check.error = RiskError::DEGENERATE_STOP;
        return check;
    }
    if (!take_profit)
        return check;

    const bool is_long = stop < entry;
    const double reward = is_long ? *take_profit - entry : entry - *take_profit;
    if (reward <= 0.0) {
        check.error = RiskError::INVALID_TARGET;
        return check;
    }

    check.risk_reward = reward / risk;
    if (check.risk_reward < cfg_.min_risk_reward_ratio - kRatioEps)
        check.error = RiskError::INSUFFICIENT_REWARD_RATIO;
    return check;
}

PlanResult RiskManager::plan_trade(const std::string& symbol,
                                   TradeDirection direction,
                                   double entry,
                                   const AccountState& account,
                                   const TradeContext& context) const
{
    PlanResult result;
    if (account.balance <= 0.0) {
        result.rejection = RiskError::INSUFFICIENT_CAPITAL;
        return result;
    }

    const double stop = stop_loss(entry, context.protective_band, context.atr, direction);
    const TakeProfit tp = take_profit(entry, stop, context.hvn_levels, context.fvg_zones,
                                      context.opposite_zone, direction);

    const RiskCheck check = validate(entry, stop, tp.tp1);
    if (!check.ok()) {
        result.rejection = check.error;
        return result;
    }

    const double risk_pct = account.risk_pct.value_or(cfg_.risk_per_trade);

    TradePlan plan;
    plan.symbol = symbol;
    plan.direction = direction;
    plan.entry = entry;
    plan.stop_loss = stop;
    plan.take_profit_1 = tp.tp1;
    plan.take_profit_2 = tp.tp2;
    plan.size = position_size(entry, stop, account.balance, risk_pct);
    plan.risk_amount = account.balance * std::clamp(risk_pct, 0.0, cfg_.max_risk_per_trade);
    plan.risk_reward = check.risk_reward;

    result.plan = plan;
    return result;
}

TradeDirection RiskManager::direction_for(const ConfluenceZone& zone, double current_price) {
    return current_price >= zone.level ? TradeDirection::LONG : TradeDirection::SHORT;
}

PlanResult RiskManager::plan_zone(const std::string& symbol,
                                  const ConfluenceZone& zone,
                                  double current_price,
                                  const AccountState& account,
                                  TradeContext context) const
{
    const TradeDirection direction = direction_for(zone, current_price);

    double entry = current_price;
    if (!zone.band.contains(current_price))
        entry = direction == TradeDirection::LONG ? zone.band.high : zone.band.low;

    if (!context.protective_band)
        context.protective_band = zone.band;

    return plan_trade(symbol, direction, entry, account, context);
}
