// =============================================================================
// ConfluenceEngine.hpp - runs the whole pipeline over closed candle series
// =============================================================================
// analyze():       detectors -> profiles -> levels at the last candle ->
//                  confluence zones -> entry gate -> trade plans
// analyze_batch(): the same per symbol on `workers` threads. Each worker
//                  pulls the next symbol from an atomic cursor and writes only
//                  its own result slot.
// =============================================================================
#pragma once

#include "config/EngineConfig.hpp"
#include "market/Candle.hpp"
#include "micro/DeltaAnalyzer.hpp"
#include "profile/ProfileTypes.hpp"
#include "regime/StructureTypes.hpp"
#include "risk/EntryGate.hpp"
#include "risk/RiskTypes.hpp"
#include "signal/SignalTypes.hpp"
#include "zones/ZoneTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace Confluence {

struct SymbolInput {
    std::string symbol;
    CandleSeries series;
};

struct PlanRejection {
    size_t zone_rank = 0;           // index into SymbolAnalysis::zones
    RiskError error = RiskError::NONE;
};

struct BlockedEntry {
    size_t zone_rank = 0;
    TradeDirection direction = TradeDirection::LONG;
    EntryBlock reason = EntryBlock::NONE;
};

struct SymbolAnalysis {
    std::string symbol;
    size_t candle_count = 0;
    int64_t last_timestamp = 0;
    double last_close = 0.0;
    std::optional<double> atr;

    std::vector<Zone> order_blocks;
    std::vector<Zone> fair_value_gaps;
    StructureState structure;       // state at the last candle
    Profile volume_profile;
    MarketProfile market_profile;
    TpoProfile tpo;
    DeltaSummary delta;
    Absorption absorption;          // at last_close

    std::vector<ConfluenceZone> zones;
    std::vector<size_t> zones_at_price;     // ranks of zones holding last_close
    std::vector<TradePlan> plans;
    std::vector<PlanRejection> rejections;
    std::vector<BlockedEntry> blocked;      // stopped before risk checks
};

class ConfluenceEngine {
public:
    explicit ConfluenceEngine(const EngineConfig& cfg = EngineConfig());

    SymbolAnalysis analyze(const std::string& symbol, const CandleSeries& series) const;
    std::vector<SymbolAnalysis> analyze_batch(const std::vector<SymbolInput>& inputs) const;

    const EngineConfig& config() const { return cfg_; }

private:
    EngineConfig cfg_;
};

}
