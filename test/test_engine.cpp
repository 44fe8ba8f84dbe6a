// ============================================================================
// test_engine.cpp
// Unit tests for ConfigLoader, ConfluenceEngine and SnapshotJson
// ============================================================================

#include "test_fixtures.h"
#include "config/ConfigLoader.hpp"
#include "engine/ConfluenceEngine.hpp"
#include "market/CandleCsvReader.hpp"
#include "report/SnapshotJson.hpp"
#include "signal/ConfluenceAggregator.hpp"

#include <nlohmann/json.hpp>

#include <cassert>
#include <iostream>
#include <sstream>
#include <stdexcept>

using namespace Confluence;
using json = nlohmann::json;

static bool throws_with(const std::string& text, const std::string& needle) {
    try {
        ConfigLoader::parse(text, "test");
    } catch (const std::runtime_error& e) {
        return std::string(e.what()).find(needle) != std::string::npos;
    }
    return false;
}

void TestConfigDefaultsAndOverrides() {
    std::cout << "Testing config overrides..." << std::endl;

    EngineConfig cfg = ConfigLoader::parse(
        R"({"order_blocks": {"lookback": 10},
            "confluence": {"min_signals": 2, "levels": {"include_tpo": true}},
            "engine": {"workers": 3}})");

    assert(cfg.order_blocks.lookback == 10);
    assert(cfg.order_blocks.max_candles == 5);
    assert(cfg.confluence.min_signals == 2);
    assert(cfg.levels.include_tpo);
    assert(cfg.engine.workers == 3);
    assert(cfg.risk.min_risk_reward_ratio == 2.0);
    assert(cfg.volume_profile.bins == 70);
    std::cout << "  missing keys keep defaults [PASS]" << std::endl;

    EngineConfig back = ConfigLoader::from_json(ConfigLoader::to_json(cfg));
    assert(back.order_blocks.lookback == 10);
    assert(back.engine.workers == 3);
    assert(back.levels.include_tpo);
    std::cout << "  to_json round trip [PASS]" << std::endl;
}

void TestConfigErrors() {
    std::cout << "\nTesting config errors..." << std::endl;

    assert(throws_with(R"({"risk": {"risk_per_trade": "high"}})", "risk.risk_per_trade"));
    std::cout << "  wrong type names the key [PASS]" << std::endl;

    assert(throws_with(R"({"order_blocks": {"lookback": -1}})", "order_blocks.lookback"));
    assert(throws_with(R"({"engine": {"plan_trades": 1}})", "engine.plan_trades"));
    assert(throws_with(R"({"tpo": 5})", "tpo"));
    std::cout << "  negative count, non-bool flag, non-object section [PASS]" << std::endl;

    assert(throws_with("{not json", "test"));
    std::cout << "  malformed document [PASS]" << std::endl;

    bool threw = false;
    try {
        ConfigLoader::load_file("/nonexistent/confluence.json");
    } catch (const std::runtime_error&) {
        threw = true;
    }
    assert(threw);
    std::cout << "  missing file [PASS]" << std::endl;
}

void TestAnalyze() {
    std::cout << "\nTesting single-series analysis..." << std::endl;

    CandleSeries s = Fixtures::series(Fixtures::order_block_bars());
    EngineConfig cfg;
    cfg.confluence.min_signals = 2;
    ConfluenceEngine engine(cfg);
    SymbolAnalysis a = engine.analyze("TEST", s);

    assert(a.symbol == "TEST");
    assert(a.candle_count == 100);
    assert(a.last_close == 103.0);
    assert(a.atr.has_value());
    assert(a.order_blocks.size() == 1);
    assert(a.volume_profile.status == ProfileStatus::OK);
    std::cout << "  detectors and profiles populated [PASS]" << std::endl;

    for (size_t i = 1; i < a.zones.size(); ++i)
        assert(a.zones[i - 1].strength >= a.zones[i].strength);
    for (const ConfluenceZone& z : a.zones)
        assert(z.signal_count >= 2);
    std::cout << "  zones ranked by strength above min_signals [PASS]" << std::endl;

    for (const TradePlan& p : a.plans) {
        assert(p.stop_loss != p.entry);
        assert(p.risk_reward >= cfg.risk.min_risk_reward_ratio - 1e-9);
        assert(p.size > 0.0);
    }
    assert(a.plans.size() + a.rejections.size() + a.blocked.size() == a.zones.size());
    for (size_t rank : a.zones_at_price)
        assert(ConfluenceAggregator::contains(a.zones[rank], a.last_close, cfg.confluence.zone_tolerance_pct));
    std::cout << "  every zone planned, rejected or blocked [PASS]" << std::endl;

    SymbolAnalysis empty = engine.analyze("NONE", CandleSeries());
    assert(empty.zones.empty() && empty.plans.empty() && empty.candle_count == 0);
    std::cout << "  empty series [PASS]" << std::endl;
}

void TestBatch() {
    std::cout << "\nTesting batch analysis..." << std::endl;

    EngineConfig cfg;
    cfg.engine.workers = 2;
    ConfluenceEngine engine(cfg);

    std::vector<SymbolInput> inputs;
    inputs.push_back(SymbolInput{"AAA", Fixtures::series(Fixtures::order_block_bars())});
    inputs.push_back(SymbolInput{"BBB", Fixtures::series(Fixtures::mirror(Fixtures::order_block_bars(), 200.0))});
    inputs.push_back(SymbolInput{"CCC", CandleSeries()});

    std::vector<SymbolAnalysis> out = engine.analyze_batch(inputs);
    assert(out.size() == 3);
    assert(out[0].symbol == "AAA" && out[1].symbol == "BBB" && out[2].symbol == "CCC");
    std::cout << "  results keep input order [PASS]" << std::endl;

    for (size_t i = 0; i < inputs.size(); ++i) {
        SymbolAnalysis single = engine.analyze(inputs[i].symbol, inputs[i].series);
        assert(single.order_blocks.size() == out[i].order_blocks.size());
        assert(single.zones.size() == out[i].zones.size());
        assert(single.plans.size() == out[i].plans.size());
    }
    assert(out[1].order_blocks.size() == 1);
    assert(out[1].order_blocks[0].direction == Direction::BEARISH);
    std::cout << "  batch matches single-series analysis [PASS]" << std::endl;

    assert(engine.analyze_batch({}).empty());
    std::cout << "  empty batch [PASS]" << std::endl;
}

void TestSnapshot() {
    std::cout << "\nTesting JSON snapshot..." << std::endl;

    ConfluenceEngine engine;
    SymbolAnalysis a = engine.analyze("TEST", Fixtures::series(Fixtures::order_block_bars()));

    json j = json::parse(emit_snapshot(a));
    assert(j["symbol"] == "TEST");
    assert(j["candles"] == 100);
    assert(j["order_blocks"].size() == 1);
    assert(j["order_blocks"][0]["kind"] == "ORDER_BLOCK");
    assert(j["order_blocks"][0]["valid_until_index"].is_null());
    assert(j["order_blocks"][0]["band"]["low"] == 100.0);
    assert(j["confluence_zones"].is_array());
    assert(j["trade_plans"].size() == a.plans.size());
    std::cout << "  snapshot fields and nulls [PASS]" << std::endl;

    TradePlan p;
    p.symbol = "X";
    p.entry = 10.0;
    json pj = trade_plan_json(p);
    assert(pj["direction"] == "LONG");
    assert(pj["take_profit_2"].is_null());
    std::cout << "  trade plan record [PASS]" << std::endl;
}

void TestEntryGateApplied() {
    std::cout << "\nTesting entry gate in the pipeline..." << std::endl;

    // Last close 103 sits above the only order block, so no entry passes.
    CandleSeries s = Fixtures::series(Fixtures::order_block_bars());
    EngineConfig cfg;
    cfg.confluence.min_signals = 1;
    SymbolAnalysis gated = ConfluenceEngine(cfg).analyze("TEST", s);
    assert(!gated.zones.empty());
    assert(gated.plans.empty() && gated.rejections.empty());
    assert(gated.blocked.size() == gated.zones.size());
    for (size_t i = 0; i < gated.blocked.size(); ++i) {
        assert(gated.blocked[i].zone_rank == i);
        assert(gated.blocked[i].reason != EntryBlock::NONE);
    }
    std::cout << "  entries outside an order block are blocked [PASS]" << std::endl;

    cfg.entry_gate.enabled = false;
    SymbolAnalysis open = ConfluenceEngine(cfg).analyze("TEST", s);
    assert(open.blocked.empty());
    assert(open.plans.size() + open.rejections.size() == open.zones.size());
    std::cout << "  disabled gate sends every zone to risk checks [PASS]" << std::endl;

    // The last candle is a doji, so its delta is neutral.
    assert(open.delta.current_alignment == DeltaAlignment::NEUTRAL);
    assert(!open.absorption.detected);
    std::cout << "  delta summary at the last candle [PASS]" << std::endl;
}

void TestStdoutCarriesOnlyJson() {
    std::cout << "\nTesting stdout holds nothing but the snapshot..." << std::endl;

    std::ostringstream captured;
    std::streambuf* saved = std::cout.rdbuf(captured.rdbuf());

    const EngineConfig cfg = ConfigLoader::parse(R"({"engine": {"workers": 2}, "extra": {}})", "inline");
    std::istringstream csv(
        "timestamp,open,high,low,close,volume\n"
        "60000,100,101,99,100.5,10\n"
        "120000,100.5,101.5,100,101,12\n");
    const CandleSeries series = CandleCsvReader::parse(csv, "inline.csv");
    const ConfluenceEngine engine(cfg);
    const SymbolAnalysis a = engine.analyze("CSV", series);
    engine.analyze_batch({SymbolInput{"CSV", series}});
    std::cout << emit_snapshot(a, 2) << "\n";

    std::cout.rdbuf(saved);

    json j = json::parse(captured.str());
    assert(j["symbol"] == "CSV");
    assert(j["candles"] == 2);
    assert(j["blocked_entries"].is_array());
    assert(j["delta"]["current_alignment"] == "BULLISH");
    std::cout << "  logs stay off stdout and the output parses [PASS]" << std::endl;
}

int main() {
    std::cout << "=== Engine Tests ===" << std::endl;

    TestConfigDefaultsAndOverrides();
    TestConfigErrors();
    TestAnalyze();
    TestBatch();
    TestSnapshot();
    TestEntryGateApplied();
    TestStdoutCarriesOnlyJson();

    std::cout << "\n=== All Engine tests passed! ===" << std::endl;
    return 0;
}
