// ============================================================================
// test_confluence.cpp
// Unit tests for ConfluenceAggregator and LevelCollector
// Tests: chained clustering, distinct-tag counting, ordering, permutation
//        invariance, containment, level collection
// ============================================================================

#include "test_fixtures.h"
#include "signal/ConfluenceAggregator.hpp"
#include "signal/LevelCollector.hpp"

#include <algorithm>
#include <cassert>
#include <iostream>

using namespace Confluence;
using Fixtures::near;

static WeightedLevel lvl(double price, SignalTag tag, double strength) {
    return WeightedLevel{price, PriceLevel::point(price), tag, strength};
}

static std::vector<WeightedLevel> three_sources() {
    WeightedLevel ob = lvl(100.0, SignalTag::ORDER_BLOCK, 1.0);
    ob.band = PriceLevel::band(99.8, 100.2);
    return {ob, lvl(100.3, SignalTag::VP_POC, 2.0), lvl(100.6, SignalTag::MP_POC, 2.0)};
}

void TestBasicCluster() {
    std::cout << "Testing three sources form one zone..." << std::endl;

    std::vector<ConfluenceZone> zones = ConfluenceAggregator().find_zones(three_sources(), 3);
    assert(zones.size() == 1);
    const ConfluenceZone& z = zones[0];
    assert(z.signal_count == 3);
    assert(near(z.strength, 5.0));
    assert(near(z.level, 100.3));
    assert(z.band.low == 99.8 && z.band.high == 100.6);
    std::cout << "  mean level, union band, summed strength [PASS]" << std::endl;
}

void TestChainedTolerance() {
    std::cout << "\nTesting chained tolerance..." << std::endl;

    // A..C is 0.9% apart, but each hop is under 0.5%.
    std::vector<WeightedLevel> levels = {
        lvl(100.0, SignalTag::ORDER_BLOCK, 1.0),
        lvl(100.45, SignalTag::VP_POC, 2.0),
        lvl(100.9, SignalTag::MP_VAH, 1.0)
    };
    std::vector<ConfluenceZone> zones = ConfluenceAggregator().find_zones(levels, 1);
    assert(zones.size() == 1);
    assert(zones[0].band.low == 100.0 && zones[0].band.high == 100.9);
    std::cout << "  A-B-C joined through B [PASS]" << std::endl;

    std::vector<WeightedLevel> ends = {levels[0], levels[2]};
    std::vector<ConfluenceZone> split = ConfluenceAggregator().find_zones(ends, 1);
    assert(split.size() == 2);
    assert(near(split[0].level, 100.0) && near(split[1].level, 100.9));
    assert(split[0].signal_count == 1 && split[1].signal_count == 1);
    std::cout << "  A and C alone stay apart [PASS]" << std::endl;

    levels.push_back(lvl(110.0, SignalTag::VP_HVN, 1.5));
    zones = ConfluenceAggregator().find_zones(levels, 1);
    assert(zones.size() == 2);
    assert(zones[0].strength > zones[1].strength);
    assert(near(zones[1].level, 110.0));
    std::cout << "  distant level opens a new cluster [PASS]" << std::endl;
}

void TestDistinctTags() {
    std::cout << "\nTesting signal_count counts distinct tags..." << std::endl;

    std::vector<WeightedLevel> levels = {
        lvl(100.0, SignalTag::ORDER_BLOCK, 1.0),
        lvl(100.1, SignalTag::ORDER_BLOCK, 1.0),
        lvl(100.2, SignalTag::VP_POC, 2.0)
    };
    std::vector<ConfluenceZone> zones = ConfluenceAggregator().find_zones(levels, 1);
    assert(zones.size() == 1);
    assert(zones[0].signal_count == 2);
    assert(near(zones[0].strength, 4.0));
    std::cout << "  two order blocks count once [PASS]" << std::endl;

    assert(ConfluenceAggregator().find_zones(levels, 3).empty());
    assert(ConfluenceAggregator().find_zones(levels).empty());
    std::cout << "  min_signals filter [PASS]" << std::endl;

    assert(ConfluenceAggregator().find_zones({}, 1).empty());
    std::cout << "  empty input [PASS]" << std::endl;
}

void TestOrderingAndPermutation() {
    std::cout << "\nTesting output order and permutation invariance..." << std::endl;

    std::vector<ConfluenceZone> ties = ConfluenceAggregator().find_zones(
        {lvl(200.0, SignalTag::VP_POC, 1.0), lvl(50.0, SignalTag::MP_POC, 1.0)}, 1);
    assert(ties.size() == 2);
    assert(ties[0].level == 50.0 && ties[1].level == 200.0);
    std::cout << "  equal strength ordered by level [PASS]" << std::endl;

    std::vector<WeightedLevel> levels = three_sources();
    levels.push_back(lvl(120.0, SignalTag::VP_HVN, 1.5));
    levels.push_back(lvl(120.2, SignalTag::VP_VAH, 1.0));
    levels.push_back(lvl(120.3, SignalTag::FAIR_VALUE_GAP, 1.5));

    const std::vector<ConfluenceZone> base = ConfluenceAggregator().find_zones(levels, 1);
    for (int r = 0; r < 6; ++r) {
        std::rotate(levels.begin(), levels.begin() + 1, levels.end());
        if (r % 2)
            std::reverse(levels.begin(), levels.end());
        std::vector<ConfluenceZone> again = ConfluenceAggregator().find_zones(levels, 1);
        assert(again.size() == base.size());
        for (size_t i = 0; i < base.size(); ++i) {
            assert(near(again[i].level, base[i].level));
            assert(near(again[i].strength, base[i].strength));
            assert(again[i].contributing_signals == base[i].contributing_signals);
            assert(again[i].band.low == base[i].band.low);
            assert(again[i].band.high == base[i].band.high);
        }
    }
    std::cout << "  same zones for any input order [PASS]" << std::endl;
}

void TestContains() {
    std::cout << "\nTesting zone containment..." << std::endl;

    ConfluenceZone z = ConfluenceAggregator().find_zones(three_sources(), 3)[0];
    assert(ConfluenceAggregator::contains(z, 100.3));
    assert(ConfluenceAggregator::contains(z, 100.7));
    assert(!ConfluenceAggregator::contains(z, 101.0));
    assert(!ConfluenceAggregator::contains(z, 99.5));
    std::cout << "  band widened by 0.2% of price [PASS]" << std::endl;
}

void TestLevelCollector() {
    std::cout << "\nTesting level collection..." << std::endl;

    Zone active;
    active.kind = ZoneKind::FAIR_VALUE_GAP;
    active.band = PriceLevel::band(99.0, 101.0);
    active.valid_from_index = 5;
    active.strength = 1.5;

    Zone closed = active;
    closed.kind = ZoneKind::ORDER_BLOCK;
    closed.valid_until_index = 8;

    Profile vp;
    vp.status = ProfileStatus::OK;
    vp.poc = 100.0;
    vp.val = 99.0;
    vp.vah = 101.0;
    vp.hvn = {100.0, 102.0};

    StructureState st;
    st.liquidity_high = 105.0;

    LevelCollector collector;
    collector.add_zones({active, closed}, 10);
    collector.add_volume_profile(vp);
    collector.add_market_profile(MarketProfile{});
    collector.add_structure(st);
    collector.add_tpo(TpoProfile{});

    const std::vector<WeightedLevel>& levels = collector.levels();
    assert(levels.size() == 6);
    assert(levels[0].tag == SignalTag::FAIR_VALUE_GAP);
    assert(levels[0].price == 100.0 && near(levels[0].strength, 1.5));
    assert(levels[1].tag == SignalTag::VP_POC && levels[1].strength == 2.0);
    std::cout << "  inactive zones and absent prices skipped [PASS]" << std::endl;

    LevelCollectorConfig cfg;
    cfg.include_liquidity = true;
    LevelCollector with_liq(cfg);
    with_liq.add_structure(st);
    assert(with_liq.levels().size() == 1);
    assert(with_liq.levels()[0].tag == SignalTag::LIQUIDITY_HIGH);
    std::cout << "  liquidity levels when enabled [PASS]" << std::endl;
}

int main() {
    std::cout << "=== Confluence Tests ===" << std::endl;

    TestBasicCluster();
    TestChainedTolerance();
    TestDistinctTags();
    TestOrderingAndPermutation();
    TestContains();
    TestLevelCollector();

    std::cout << "\n=== All Confluence tests passed! ===" << std::endl;
    return 0;
}
