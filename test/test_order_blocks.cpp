// ============================================================================
// test_order_blocks.cpp
// Unit tests for OrderBlockDetector and active-zone queries
// Tests: single block from one consolidation, invalidation, expiry, mirror,
//        growing series
// ============================================================================

#include "test_fixtures.h"
#include "zones/OrderBlockDetector.hpp"

#include <cassert>
#include <iostream>

using namespace Confluence;
using Fixtures::bar;

static std::vector<Zone> by_direction(const std::vector<Zone>& zones, Direction d) {
    std::vector<Zone> out;
    for (const Zone& z : zones)
        if (z.direction == d)
            out.push_back(z);
    return out;
}

void TestSingleBlockFromConsolidation() {
    std::cout << "Testing flat run followed by impulse yields one block..." << std::endl;

    CandleSeries s = Fixtures::series(Fixtures::order_block_bars());
    std::vector<Zone> zones = OrderBlockDetector().detect(s);

    assert(zones.size() == 1);
    const Zone& z = zones[0];
    assert(z.kind == ZoneKind::ORDER_BLOCK);
    assert(z.direction == Direction::BULLISH);
    std::cout << "  exactly one bullish block [PASS]" << std::endl;

    assert(z.origin_index == 22);
    assert(z.band.low == 100.0 && z.band.high == 100.0);
    assert(z.valid_from_index == 23);
    std::cout << "  anchored at the first candle completing the flat run [PASS]" << std::endl;

    assert(z.confirmed_index && *z.confirmed_index == 27);
    std::cout << "  confirmed when the excursion reached 1.5% [PASS]" << std::endl;

    assert(!z.valid_until_index);
    assert(z.end_reason == ZoneEnd::NONE);
    assert(z.active_at(99));
    std::cout << "  still active at the last candle [PASS]" << std::endl;
}

void TestInvalidation() {
    std::cout << "\nTesting close through the block invalidates it..." << std::endl;

    std::vector<Candle> bars = Fixtures::order_block_bars();
    bars[60] = bar(0, 103.0, 103.05, 99.0, 99.5);
    for (size_t i = 61; i < bars.size(); ++i)
        bars[i] = bar(0, 99.5, 99.55, 99.45, 99.5);
    CandleSeries s = Fixtures::series(bars);

    std::vector<Zone> zones = OrderBlockDetector().detect(s);
    std::vector<Zone> bull = by_direction(zones, Direction::BULLISH);
    assert(bull.size() == 1);
    assert(bull[0].origin_index == 22);
    assert(bull[0].valid_until_index && *bull[0].valid_until_index == 60);
    assert(bull[0].end_reason == ZoneEnd::INVALIDATED);
    std::cout << "  invalidated at the first close below the band [PASS]" << std::endl;

    assert(bull[0].active_at(59));
    for (size_t i = 60; i < s.size(); ++i)
        assert(!bull[0].active_at(i));
    std::cout << "  never active again once invalidated [PASS]" << std::endl;

    // Every flat candle from 40 on sees the drop within lookback; 40 is the
    // first one reported.
    std::vector<Zone> bear = by_direction(zones, Direction::BEARISH);
    assert(bear.size() == 1);
    assert(bear[0].origin_index == 40);
    assert(bear[0].band.low == 102.95 && bear[0].band.high == 103.05);
    assert(bear[0].confirmed_index && *bear[0].confirmed_index == 60);
    std::cout << "  bearish block before the drop [PASS]" << std::endl;
}

void TestExpiry() {
    std::cout << "\nTesting max_age expiry..." << std::endl;

    OrderBlockConfig cfg;
    cfg.max_age = 10;
    CandleSeries s = Fixtures::series(Fixtures::order_block_bars());
    std::vector<Zone> zones = OrderBlockDetector(cfg).detect(s);

    assert(zones.size() == 1);
    assert(zones[0].valid_until_index && *zones[0].valid_until_index == 33);
    assert(zones[0].end_reason == ZoneEnd::EXPIRED);
    assert(zones[0].active_at(32) && !zones[0].active_at(33));
    std::cout << "  valid_until = origin + max_age + 1 [PASS]" << std::endl;
}

void TestBearishMirror() {
    std::cout << "\nTesting mirrored series yields a bearish block..." << std::endl;

    CandleSeries s = Fixtures::series(Fixtures::mirror(Fixtures::order_block_bars(), 200.0));
    std::vector<Zone> zones = OrderBlockDetector().detect(s);

    assert(zones.size() == 1);
    assert(zones[0].direction == Direction::BEARISH);
    assert(zones[0].origin_index == 22);
    assert(zones[0].band.low == 100.0 && zones[0].band.high == 100.0);
    std::cout << "  bearish block at 22 [PASS]" << std::endl;
}

void TestShortSeries() {
    std::cout << "\nTesting short series..." << std::endl;

    std::vector<Candle> bars = Fixtures::order_block_bars();
    bars.resize(24);
    assert(OrderBlockDetector().detect(Fixtures::series(bars)).empty());
    assert(OrderBlockDetector().detect(CandleSeries()).empty());
    std::cout << "  fewer than lookback + max_candles candles -> empty [PASS]" << std::endl;
}

void TestActiveZoneQueries() {
    std::cout << "\nTesting active-zone queries..." << std::endl;

    CandleSeries s = Fixtures::series(Fixtures::order_block_bars());
    std::vector<Zone> zones = OrderBlockDetector().detect(s);

    assert(active_zones(zones, 22).empty());
    assert(active_zones(zones, 23).size() == 1);
    std::cout << "  not active before valid_from [PASS]" << std::endl;

    assert(zone_containing(zones, 100.0, 50) != nullptr);
    assert(zone_containing(zones, 100.1, 50) == nullptr);
    assert(zone_containing(zones, 100.0, 10) == nullptr);
    std::cout << "  price containment respects validity [PASS]" << std::endl;
}

void TestGrowingSeries() {
    std::cout << "\nTesting a longer series keeps closed blocks closed..." << std::endl;

    // 5..9 flat at 100, 10 closes just under the band, impulse 11..14.
    std::vector<Candle> bars;
    for (int i = 0; i < 5; ++i) {
        const double c = 98.0 + 0.4 * i;
        bars.push_back(bar(0, c - 0.2, c + 0.5, c - 0.5, c));
    }
    for (int i = 5; i < 10; ++i)
        bars.push_back(bar(0, 100.0, 100.0, 100.0, 100.0));
    bars.push_back(bar(0, 100.0, 100.0, 99.99, 99.99));
    for (int i = 11; i < 15; ++i) {
        const double c = 100.0 + (i - 10);
        bars.push_back(bar(0, c - 1.0, c + 0.1, c - 1.1, c));
    }

    OrderBlockConfig cfg;
    cfg.lookback = 5;
    const OrderBlockDetector det(cfg);

    std::vector<Zone> before = det.detect(Fixtures::series(bars));
    assert(before.size() == 1);
    assert(before[0].origin_index == 7);
    assert(before[0].band.low == 100.0 && before[0].band.high == 100.0);
    assert(before[0].valid_until_index && *before[0].valid_until_index == 10);
    assert(!before[0].active_at(14));
    std::cout << "  block closed by the close under the band [PASS]" << std::endl;

    // Candle 10 becomes a candidate once enough candles follow it; its window
    // overlaps the closed block and must not replace it.
    for (int i = 15; i < 31; ++i)
        bars.push_back(bar(0, 104.0, 104.05, 103.95, 104.0));
    std::vector<Zone> after = det.detect(Fixtures::series(bars));

    for (const Zone& z : before) {
        bool found = false;
        for (const Zone& y : after) {
            if (y.origin_index != z.origin_index || y.direction != z.direction)
                continue;
            found = true;
            assert(y.band.low == z.band.low && y.band.high == z.band.high);
            assert(y.valid_until_index == z.valid_until_index);
            assert(y.end_reason == z.end_reason);
        }
        assert(found);
    }
    std::cout << "  every earlier block kept unchanged [PASS]" << std::endl;

    assert(active_zones(after, 14).empty());
    assert(zone_containing(after, 100.0, 14) == nullptr);
    std::cout << "  nothing reopened over the consolidation [PASS]" << std::endl;
}

int main() {
    std::cout << "=== OrderBlockDetector Tests ===" << std::endl;

    TestSingleBlockFromConsolidation();
    TestInvalidation();
    TestExpiry();
    TestBearishMirror();
    TestShortSeries();
    TestActiveZoneQueries();
    TestGrowingSeries();

    std::cout << "\n=== All OrderBlockDetector tests passed! ===" << std::endl;
    return 0;
}
