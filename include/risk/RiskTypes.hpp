#pragma once

#include "market/MarketTypes.hpp"
#include "zones/ZoneTypes.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace Confluence {

enum class TradeDirection : uint8_t {
    LONG  = 0,
    SHORT = 1
};

enum class RiskError : uint8_t {
    NONE                      = 0,
    DEGENERATE_STOP           = 1,
    INVALID_TARGET            = 2,
    INSUFFICIENT_REWARD_RATIO = 3,
    INSUFFICIENT_CAPITAL      = 4
};

const char* to_string(TradeDirection d);
const char* to_string(RiskError e);

struct RiskCheck {
    RiskError error = RiskError::NONE;
    double risk_reward = 0.0;

    bool ok() const { return error == RiskError::NONE; }
};

struct TakeProfit {
    double tp1 = 0.0;
    std::optional<double> tp2;
};

struct TradePlan {
    std::string symbol;
    TradeDirection direction = TradeDirection::LONG;
    double entry = 0.0;
    double stop_loss = 0.0;
    double take_profit_1 = 0.0;
    std::optional<double> take_profit_2;
    double size = 0.0;
    double risk_amount = 0.0;
    double risk_reward = 0.0;
};

struct AccountState {
    double balance = 0.0;
    std::optional<double> risk_pct;     // overrides RiskConfig::risk_per_trade
};

// Market context a plan is built against. Every field may be empty.
struct TradeContext {
    std::optional<double> atr;
    std::optional<PriceLevel> protective_band;
    std::vector<double> hvn_levels;
    std::vector<Zone> fvg_zones;
    std::optional<PriceLevel> opposite_zone;
};

struct PlanResult {
    std::optional<TradePlan> plan;
    RiskError rejection = RiskError::NONE;

    bool ok() const { return plan.has_value(); }
};

}
