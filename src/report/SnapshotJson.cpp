#include "report/SnapshotJson.hpp"

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace Confluence {

namespace {

template <typename T>
json opt(const std::optional<T>& v) {
    return v ? json(*v) : json(nullptr);
}

json band_json(const PriceLevel& b) {
    return json{{"low", b.low}, {"high", b.high}};
}

json break_json(const std::optional<BreakEvent>& e) {
    if (!e)
        return nullptr;
    return json{{"kind", to_string(e->kind)}, {"direction", to_string(e->direction)}};
}

}

json zone_json(const Zone& z) {
    json j;
    j["kind"] = to_string(z.kind);
    j["direction"] = to_string(z.direction);
    j["band"] = band_json(z.band);
    j["origin_index"] = z.origin_index;
    j["valid_from_index"] = z.valid_from_index;
    j["valid_until_index"] = opt(z.valid_until_index);
    j["end_reason"] = to_string(z.end_reason);
    j["strength"] = z.strength;
    j["size_pct"] = z.size_pct;
    if (z.kind == ZoneKind::ORDER_BLOCK)
        j["confirmed_index"] = opt(z.confirmed_index);
    else
        j["strong"] = z.strong;
    return j;
}

json confluence_zone_json(const ConfluenceZone& z) {
    json signals = json::array();
    for (SignalTag t : z.contributing_signals)
        signals.push_back(to_string(t));

    return json{
        {"level", z.level},
        {"band", band_json(z.band)},
        {"signals", signals},
        {"signal_count", z.signal_count},
        {"strength", z.strength}
    };
}

json trade_plan_json(const TradePlan& p) {
    return json{
        {"symbol", p.symbol},
        {"direction", to_string(p.direction)},
        {"entry", p.entry},
        {"stop_loss", p.stop_loss},
        {"take_profit_1", p.take_profit_1},
        {"take_profit_2", opt(p.take_profit_2)},
        {"size", p.size},
        {"risk_amount", p.risk_amount},
        {"risk_reward", p.risk_reward}
    };
}

json profile_json(const Profile& p) {
    return json{
        {"status", to_string(p.status)},
        {"poc", opt(p.poc)},
        {"val", opt(p.val)},
        {"vah", opt(p.vah)},
        {"total_volume", p.total_volume},
        {"hvn", p.hvn},
        {"lvn", p.lvn},
        {"profile_high", opt(p.profile_high)},
        {"profile_low", opt(p.profile_low)}
    };
}

json structure_json(const StructureState& s) {
    return json{
        {"trend", to_string(s.trend)},
        {"last_swing_high", opt(s.last_swing_high)},
        {"last_swing_low", opt(s.last_swing_low)},
        {"bos", break_json(s.bos)},
        {"choch", break_json(s.choch)},
        {"liquidity_high", opt(s.liquidity_high)},
        {"liquidity_low", opt(s.liquidity_low)}
    };
}

json snapshot_json(const SymbolAnalysis& a) {
    json j;
    j["symbol"] = a.symbol;
    j["candles"] = a.candle_count;
    j["ts"] = a.last_timestamp;
    j["last_close"] = a.last_close;
    j["atr"] = opt(a.atr);

    json obs = json::array();
    for (const Zone& z : a.order_blocks)
        obs.push_back(zone_json(z));
    j["order_blocks"] = obs;

    json fvgs = json::array();
    for (const Zone& z : a.fair_value_gaps)
        fvgs.push_back(zone_json(z));
    j["fair_value_gaps"] = fvgs;

    j["structure"] = structure_json(a.structure);
    j["volume_profile"] = profile_json(a.volume_profile);

    json mp = profile_json(a.market_profile.profile);
    mp["market_state"] = to_string(a.market_profile.market_state);
    j["market_profile"] = mp;

    j["tpo"] = {
        {"status", to_string(a.tpo.status)},
        {"single_prints", a.tpo.single_prints},
        {"poor_high", opt(a.tpo.poor_high)},
        {"poor_low", opt(a.tpo.poor_low)},
        {"ib_high", opt(a.tpo.ib_high)},
        {"ib_low", opt(a.tpo.ib_low)}
    };

    j["delta"] = {
        {"avg_delta", a.delta.avg_delta},
        {"avg_delta_pct", opt(a.delta.avg_delta_pct)},
        {"alignment", to_string(a.delta.alignment)},
        {"current_alignment", to_string(a.delta.current_alignment)},
        {"current_delta", a.delta.current_delta},
        {"divergence_detected", a.delta.divergence_detected},
        {"absorption", a.absorption.detected},
        {"absorption_direction", a.absorption.direction ? json(to_string(*a.absorption.direction)) : json(nullptr)}
    };

    json zones = json::array();
    for (const ConfluenceZone& z : a.zones)
        zones.push_back(confluence_zone_json(z));
    j["confluence_zones"] = zones;
    j["zones_at_price"] = a.zones_at_price;

    json plans = json::array();
    for (const TradePlan& p : a.plans)
        plans.push_back(trade_plan_json(p));
    j["trade_plans"] = plans;

    json rejected = json::array();
    for (const PlanRejection& r : a.rejections)
        rejected.push_back(json{{"zone", r.zone_rank}, {"error", to_string(r.error)}});
    j["rejected_plans"] = rejected;

    json blocked = json::array();
    for (const BlockedEntry& b : a.blocked) {
        blocked.push_back(json{
            {"zone", b.zone_rank},
            {"direction", to_string(b.direction)},
            {"reason", to_string(b.reason)}
        });
    }
    j["blocked_entries"] = blocked;

    return j;
}

std::string emit_snapshot(const SymbolAnalysis& a, int indent) {
    return snapshot_json(a).dump(indent);
}

}
