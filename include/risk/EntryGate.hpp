// =============================================================================
// EntryGate.hpp - confirms a plan direction against structure and order flow
// =============================================================================
// Checks run in this order and the first failing one is reported:
//   TREND_AGAINST        LONG in a BEARISH trend, SHORT in a BULLISH one
//   OUTSIDE_ORDER_BLOCK  price is not inside an active order block
//   ORDER_BLOCK_AGAINST  the block containing price faces the other way
//   DELTA_AGAINST        last candle's delta is not aligned with the trade
//   NO_ABSORPTION        no absorption at the current price
// Each check can be switched off; a disabled gate lets everything through.
// =============================================================================
#pragma once

#include "micro/DeltaAnalyzer.hpp"
#include "regime/StructureTypes.hpp"
#include "risk/RiskTypes.hpp"
#include "zones/ZoneTypes.hpp"

#include <cstdint>

namespace Confluence {

enum class EntryBlock : uint8_t {
    NONE                = 0,
    TREND_AGAINST       = 1,
    OUTSIDE_ORDER_BLOCK = 2,
    ORDER_BLOCK_AGAINST = 3,
    DELTA_AGAINST       = 4,
    NO_ABSORPTION       = 5
};

const char* to_string(EntryBlock b);

struct EntryGateConfig {
    bool enabled = true;
    bool require_trend = true;
    bool require_order_block = true;
    bool require_delta = true;
    bool require_absorption = false;
};

struct EntryEvidence {
    Trend trend = Trend::RANGE;
    const Zone* order_block = nullptr;  // active block containing price
    DeltaAlignment delta = DeltaAlignment::NEUTRAL;
    Absorption absorption;
};

class EntryGate {
public:
    explicit EntryGate(const EntryGateConfig& cfg = EntryGateConfig());

    EntryBlock check(TradeDirection direction, const EntryEvidence& e) const;

    const EntryGateConfig& config() const { return cfg_; }

private:
    EntryGateConfig cfg_;
};

}
