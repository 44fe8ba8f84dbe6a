#pragma once

#include "micro/DeltaAnalyzer.hpp"
#include "profile/MarketProfileCalculator.hpp"
#include "profile/TpoCalculator.hpp"
#include "profile/VolumeProfileCalculator.hpp"
#include "regime/StructureAnalyzer.hpp"
#include "risk/EntryGate.hpp"
#include "risk/RiskManager.hpp"
#include "signal/ConfluenceAggregator.hpp"
#include "signal/LevelCollector.hpp"
#include "zones/FairValueGapDetector.hpp"
#include "zones/OrderBlockDetector.hpp"

#include <cstddef>

namespace Confluence {

struct EngineSettings {
    size_t atr_period = 14;
    size_t workers = 1;
    double account_balance = 10000.0;
    bool plan_trades = true;
};

// Every tunable of the pipeline. Defaults are the production settings;
// a config file only needs the keys it changes.
struct EngineConfig {
    OrderBlockConfig order_blocks;
    FairValueGapConfig fair_value_gaps;
    StructureConfig structure;
    VolumeProfileConfig volume_profile;
    MarketProfileConfig market_profile;
    TpoConfig tpo;
    ConfluenceConfig confluence;
    LevelCollectorConfig levels;
    DeltaConfig delta;
    EntryGateConfig entry_gate;
    RiskConfig risk;
    EngineSettings engine;
};

}
