#include "engine/ConfluenceEngine.hpp"

#include "market/AtrCalculator.hpp"
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

#include <algorithm>
#include <atomic>
#include <exception>
#include <iostream>
#include <mutex>
#include <sstream>
#include <thread>

using namespace Confluence;

namespace {

// Workers share stderr; one write per line keeps lines whole.
void log_line(const std::string& text) {
    const std::string out = text + "\n";
    std::cerr.write(out.data(), static_cast<std::streamsize>(out.size()));
    std::cerr.flush();
}

// Nearest active order block on the far side of entry, facing the trade.
std::optional<PriceLevel> opposite_block(const std::vector<Zone>& blocks,
                                         size_t index,
                                         double entry,
                                         TradeDirection direction)
{
    std::optional<PriceLevel> best;
    for (const Zone& z : blocks) {
        if (!z.active_at(index))
            continue;
        if (direction == TradeDirection::LONG) {
            if (z.direction != Direction::BEARISH || z.band.low <= entry)
                continue;
            if (!best || z.band.low < best->low)
                best = z.band;
        } else {
            if (z.direction != Direction::BULLISH || z.band.high >= entry)
                continue;
            if (!best || z.band.high > best->high)
                best = z.band;
        }
    }
    return best;
}

}

ConfluenceEngine::ConfluenceEngine(const EngineConfig& cfg)
    : cfg_(cfg) {}

SymbolAnalysis ConfluenceEngine::analyze(const std::string& symbol, const CandleSeries& series) const {
    SymbolAnalysis a;
    a.symbol = symbol;
    a.candle_count = series.size();

    if (series.empty()) {
        log_line("[ENGINE] " + symbol + " no candles");
        return a;
    }

    const size_t last = series.size() - 1;
    a.last_timestamp = series.back().timestamp;
    a.last_close = series.back().close;

    // ---- Detectors ----
    a.atr = AtrCalculator(cfg_.engine.atr_period).latest(series);
    a.order_blocks = OrderBlockDetector(cfg_.order_blocks).detect(series);
    a.fair_value_gaps = FairValueGapDetector(cfg_.fair_value_gaps).detect(series);

    const std::vector<StructureState> states = StructureAnalyzer(cfg_.structure).analyze(series);
    a.structure = states.back();

    a.volume_profile = VolumeProfileCalculator(cfg_.volume_profile).compute_latest(series);
    a.market_profile = MarketProfileCalculator(cfg_.market_profile).compute_latest(series);
    a.tpo = TpoCalculator(cfg_.tpo).compute_latest(series);

    const DeltaAnalyzer delta(cfg_.delta);
    const std::vector<DeltaBar> delta_bars = delta.compute(series);
    a.delta = delta.summary(delta_bars);
    a.absorption = delta.absorption(series, delta_bars, a.last_close);

    // ---- Confluence at the last candle ----
    LevelCollector collector(cfg_.levels);
    collector.add_zones(a.order_blocks, last);
    collector.add_zones(a.fair_value_gaps, last);
    collector.add_volume_profile(a.volume_profile);
    collector.add_market_profile(a.market_profile);
    collector.add_structure(a.structure);
    collector.add_tpo(a.tpo);

    const ConfluenceAggregator aggregator(cfg_.confluence);
    a.zones = aggregator.find_zones(collector.take());
    for (size_t rank = 0; rank < a.zones.size(); ++rank) {
        if (aggregator.in_zone(a.zones[rank], a.last_close))
            a.zones_at_price.push_back(rank);
    }

    // ---- Plans ----
    if (cfg_.engine.plan_trades) {
        const RiskManager risk(cfg_.risk);
        AccountState account;
        account.balance = cfg_.engine.account_balance;

        const std::vector<Zone> live_fvgs = active_zones(a.fair_value_gaps, last);

        const EntryGate gate(cfg_.entry_gate);
        EntryEvidence evidence;
        evidence.trend = a.structure.trend;
        evidence.order_block = zone_containing(a.order_blocks, a.last_close, last);
        evidence.delta = a.delta.current_alignment;
        evidence.absorption = a.absorption;

        for (size_t rank = 0; rank < a.zones.size(); ++rank) {
            const ConfluenceZone& zone = a.zones[rank];
            const TradeDirection dir = RiskManager::direction_for(zone, a.last_close);

            const EntryBlock block = gate.check(dir, evidence);
            if (block != EntryBlock::NONE) {
                a.blocked.push_back(BlockedEntry{rank, dir, block});
                continue;
            }

            TradeContext ctx;
            ctx.atr = a.atr;
            ctx.hvn_levels = a.volume_profile.hvn;
            ctx.fvg_zones = live_fvgs;
            ctx.opposite_zone = opposite_block(a.order_blocks, last, a.last_close, dir);

            PlanResult r = risk.plan_zone(symbol, zone, a.last_close, account, ctx);
            if (r.ok())
                a.plans.push_back(*r.plan);
            else
                a.rejections.push_back(PlanRejection{rank, r.rejection});
        }
    }

    std::ostringstream line;
    line << "[ENGINE] " << symbol
         << " candles=" << a.candle_count
         << " order_blocks=" << a.order_blocks.size()
         << " fvgs=" << a.fair_value_gaps.size()
         << " zones=" << a.zones.size()
         << " plans=" << a.plans.size()
         << " blocked=" << a.blocked.size()
         << " rejected=" << a.rejections.size();
    log_line(line.str());
    return a;
}

std::vector<SymbolAnalysis> ConfluenceEngine::analyze_batch(const std::vector<SymbolInput>& inputs) const {
    std::vector<SymbolAnalysis> results(inputs.size());
    if (inputs.empty())
        return results;

    const size_t workers = std::max<size_t>(1, std::min(cfg_.engine.workers, inputs.size()));
    std::atomic<size_t> cursor{0};
    std::atomic<size_t> done{0};

    std::mutex err_mtx;
    std::exception_ptr first_error;

    auto worker = [&]() {
        for (;;) {
            const size_t i = cursor.fetch_add(1, std::memory_order_relaxed);
            if (i >= inputs.size())
                return;
            try {
                results[i] = analyze(inputs[i].symbol, inputs[i].series);
            } catch (...) {
                std::lock_guard<std::mutex> lk(err_mtx);
                if (!first_error)
                    first_error = std::current_exception();
                return;
            }
            done.fetch_add(1, std::memory_order_relaxed);
        }
    };

    std::cerr << "[ENGINE] batch symbols=" << inputs.size() << " workers=" << workers << "\n";

    std::vector<std::thread> pool;
    pool.reserve(workers);
    for (size_t w = 0; w < workers; ++w)
        pool.emplace_back(worker);
    for (std::thread& t : pool)
        t.join();

    if (first_error)
        std::rethrow_exception(first_error);

    std::cerr << "[ENGINE] batch complete analysed=" << done.load() << "\n";
    return results;
}
