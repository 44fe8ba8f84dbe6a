#include "risk/EntryGate.hpp"

using namespace Confluence;

const char* Confluence::to_string(EntryBlock b) {
    switch (b) {
        case EntryBlock::NONE:                return "NONE";
        case EntryBlock::TREND_AGAINST:       return "TREND_AGAINST";
        case EntryBlock::OUTSIDE_ORDER_BLOCK: return "OUTSIDE_ORDER_BLOCK";
        case EntryBlock::ORDER_BLOCK_AGAINST: return "ORDER_BLOCK_AGAINST";
        case EntryBlock::DELTA_AGAINST:       return "DELTA_AGAINST";
        case EntryBlock::NO_ABSORPTION:       return "NO_ABSORPTION";
    }
    return "UNKNOWN";
}

EntryGate::EntryGate(const EntryGateConfig& cfg)
    : cfg_(cfg) {}

EntryBlock EntryGate::check(TradeDirection direction, const EntryEvidence& e) const {
    if (!cfg_.enabled)
        return EntryBlock::NONE;

    const bool is_long = direction == TradeDirection::LONG;
    const Direction side = is_long ? Direction::BULLISH : Direction::BEARISH;

    if (cfg_.require_trend) {
        const Trend against = is_long ? Trend::BEARISH : Trend::BULLISH;
        if (e.trend == against)
            return EntryBlock::TREND_AGAINST;
    }

    if (cfg_.require_order_block) {
        if (!e.order_block)
            return EntryBlock::OUTSIDE_ORDER_BLOCK;
        if (e.order_block->direction != side)
            return EntryBlock::ORDER_BLOCK_AGAINST;
    }

    if (cfg_.require_delta) {
        const DeltaAlignment want = is_long ? DeltaAlignment::BULLISH : DeltaAlignment::BEARISH;
        if (e.delta != want)
            return EntryBlock::DELTA_AGAINST;
    }

    if (cfg_.require_absorption && !e.absorption.detected)
        return EntryBlock::NO_ABSORPTION;

    return EntryBlock::NONE;
}
