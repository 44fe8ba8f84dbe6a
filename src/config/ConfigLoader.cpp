#include "config/ConfigLoader.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

using json = nlohmann::json;

namespace Confluence {

namespace {

[[noreturn]] void bad_type(const std::string& section, const char* key, const char* expected) {
    throw std::runtime_error("[CONFIG] " + section + "." + key + ": expected " + expected);
}

void read(const json& s, const std::string& section, const char* key, double& out) {
    if (!s.contains(key)) return;
    const json& v = s.at(key);
    if (!v.is_number()) bad_type(section, key, "number");
    out = v.get<double>();
}

void read(const json& s, const std::string& section, const char* key, size_t& out) {
    if (!s.contains(key)) return;
    const json& v = s.at(key);
    if (!v.is_number_unsigned()) bad_type(section, key, "non-negative integer");
    out = v.get<size_t>();
}

void read(const json& s, const std::string& section, const char* key, bool& out) {
    if (!s.contains(key)) return;
    const json& v = s.at(key);
    if (!v.is_boolean()) bad_type(section, key, "boolean");
    out = v.get<bool>();
}

const json* section_of(const json& root, const char* name) {
    if (!root.contains(name))
        return nullptr;
    const json& s = root.at(name);
    if (!s.is_object())
        throw std::runtime_error(std::string("[CONFIG] section ") + name + " must be an object");
    return &s;
}

const char* const kSections[] = {
    "order_blocks", "fair_value_gaps", "structure", "volume_profile",
    "market_profile", "tpo", "confluence", "delta", "entry_gate", "risk", "engine"
};

}

EngineConfig ConfigLoader::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in.is_open())
        throw std::runtime_error("[CONFIG] Cannot open file: " + path);

    std::stringstream buf;
    buf << in.rdbuf();
    return parse(buf.str(), path);
}

EngineConfig ConfigLoader::parse(const std::string& text, const std::string& source) {
    json root;
    try {
        root = json::parse(text);
    } catch (const json::parse_error& e) {
        throw std::runtime_error("[CONFIG] " + source + ": " + e.what());
    }
    if (!root.is_object())
        throw std::runtime_error("[CONFIG] " + source + ": top level must be an object");

    size_t known = 0;
    for (auto it = root.begin(); it != root.end(); ++it) {
        bool found = false;
        for (const char* name : kSections)
            found = found || it.key() == name;
        if (found)
            ++known;
        else
            std::cerr << "[CONFIG] ignoring unknown section " << it.key() << "\n";
    }

    EngineConfig cfg = from_json(root);
    std::cerr << "[CONFIG] loaded " << source << " sections=" << known << "\n";
    return cfg;
}

EngineConfig ConfigLoader::from_json(const json& root) {
    EngineConfig cfg;

    if (const json* s = section_of(root, "order_blocks")) {
        OrderBlockConfig& c = cfg.order_blocks;
        read(*s, "order_blocks", "min_candles", c.min_candles);
        read(*s, "order_blocks", "max_candles", c.max_candles);
        read(*s, "order_blocks", "impulse_threshold_pct", c.impulse_threshold_pct);
        read(*s, "order_blocks", "lookback", c.lookback);
        read(*s, "order_blocks", "max_age", c.max_age);
        read(*s, "order_blocks", "consolidation_range_mult", c.consolidation_range_mult);
    }

    if (const json* s = section_of(root, "fair_value_gaps")) {
        FairValueGapConfig& c = cfg.fair_value_gaps;
        read(*s, "fair_value_gaps", "min_size_pct", c.min_size_pct);
        read(*s, "fair_value_gaps", "strong_threshold_pct", c.strong_threshold_pct);
        read(*s, "fair_value_gaps", "max_age_bars", c.max_age_bars);
        read(*s, "fair_value_gaps", "strong_weight", c.strong_weight);
    }

    if (const json* s = section_of(root, "structure")) {
        read(*s, "structure", "swing_lookback", cfg.structure.swing_lookback);
        read(*s, "structure", "liquidity_buffer_pct", cfg.structure.liquidity_buffer_pct);
    }

    if (const json* s = section_of(root, "volume_profile")) {
        VolumeProfileConfig& c = cfg.volume_profile;
        read(*s, "volume_profile", "bins", c.bins);
        read(*s, "volume_profile", "value_area_percent", c.value_area_percent);
        read(*s, "volume_profile", "hvn_multiplier", c.hvn_multiplier);
        read(*s, "volume_profile", "lvn_multiplier", c.lvn_multiplier);
        read(*s, "volume_profile", "period", c.period);
    }

    if (const json* s = section_of(root, "market_profile")) {
        MarketProfileConfig& c = cfg.market_profile;
        read(*s, "market_profile", "bins", c.bins);
        read(*s, "market_profile", "value_area_percent", c.value_area_percent);
        read(*s, "market_profile", "period", c.period);
        read(*s, "market_profile", "time_weighted", c.time_weighted);
        read(*s, "market_profile", "hvn_multiplier", c.hvn_multiplier);
        read(*s, "market_profile", "lvn_multiplier", c.lvn_multiplier);
    }

    if (const json* s = section_of(root, "tpo")) {
        read(*s, "tpo", "bins", cfg.tpo.bins);
        read(*s, "tpo", "ib_periods", cfg.tpo.ib_periods);
        read(*s, "tpo", "extreme_fraction", cfg.tpo.extreme_fraction);
        read(*s, "tpo", "period", cfg.tpo.period);
    }

    if (const json* s = section_of(root, "confluence")) {
        read(*s, "confluence", "tolerance_pct", cfg.confluence.tolerance_pct);
        read(*s, "confluence", "min_signals", cfg.confluence.min_signals);
        read(*s, "confluence", "zone_tolerance_pct", cfg.confluence.zone_tolerance_pct);

        if (const json* l = section_of(*s, "levels")) {
            LevelCollectorConfig& c = cfg.levels;
            read(*l, "confluence.levels", "include_liquidity", c.include_liquidity);
            read(*l, "confluence.levels", "include_tpo", c.include_tpo);
            read(*l, "confluence.levels", "order_block", c.weights.order_block);
            read(*l, "confluence.levels", "fair_value_gap", c.weights.fair_value_gap);
            read(*l, "confluence.levels", "vp_poc", c.weights.vp_poc);
            read(*l, "confluence.levels", "vp_hvn", c.weights.vp_hvn);
            read(*l, "confluence.levels", "vp_value_area", c.weights.vp_value_area);
            read(*l, "confluence.levels", "mp_poc", c.weights.mp_poc);
            read(*l, "confluence.levels", "mp_value_area", c.weights.mp_value_area);
            read(*l, "confluence.levels", "liquidity", c.weights.liquidity);
            read(*l, "confluence.levels", "tpo_extreme", c.weights.tpo_extreme);
        }
    }

    if (const json* s = section_of(root, "delta")) {
        DeltaConfig& c = cfg.delta;
        read(*s, "delta", "dominant_share", c.dominant_share);
        read(*s, "delta", "threshold_pct", c.threshold_pct);
        read(*s, "delta", "divergence_lookback", c.divergence_lookback);
        read(*s, "delta", "absorption_lookback", c.absorption_lookback);
        read(*s, "delta", "absorption_tolerance_pct", c.absorption_tolerance_pct);
        read(*s, "delta", "summary_lookback", c.summary_lookback);
    }

    if (const json* s = section_of(root, "entry_gate")) {
        EntryGateConfig& c = cfg.entry_gate;
        read(*s, "entry_gate", "enabled", c.enabled);
        read(*s, "entry_gate", "require_trend", c.require_trend);
        read(*s, "entry_gate", "require_order_block", c.require_order_block);
        read(*s, "entry_gate", "require_delta", c.require_delta);
        read(*s, "entry_gate", "require_absorption", c.require_absorption);
    }

    if (const json* s = section_of(root, "risk")) {
        RiskConfig& c = cfg.risk;
        read(*s, "risk", "risk_per_trade", c.risk_per_trade);
        read(*s, "risk", "max_risk_per_trade", c.max_risk_per_trade);
        read(*s, "risk", "min_risk_reward_ratio", c.min_risk_reward_ratio);
        read(*s, "risk", "atr_stop_multiplier", c.atr_stop_multiplier);
        read(*s, "risk", "zone_buffer_pct", c.zone_buffer_pct);
        read(*s, "risk", "fallback_stop_pct", c.fallback_stop_pct);
        read(*s, "risk", "trailing_distance_pct", c.trailing_distance_pct);
        read(*s, "risk", "trailing_atr_multiplier", c.trailing_atr_multiplier);
        read(*s, "risk", "trailing_floor_pct", c.trailing_floor_pct);
    }

    if (const json* s = section_of(root, "engine")) {
        read(*s, "engine", "atr_period", cfg.engine.atr_period);
        read(*s, "engine", "workers", cfg.engine.workers);
        read(*s, "engine", "account_balance", cfg.engine.account_balance);
        read(*s, "engine", "plan_trades", cfg.engine.plan_trades);
    }

    return cfg;
}

json ConfigLoader::to_json(const EngineConfig& cfg) {
    json j;

    const OrderBlockConfig& ob = cfg.order_blocks;
    j["order_blocks"] = {
        {"min_candles", ob.min_candles},
        {"max_candles", ob.max_candles},
        {"impulse_threshold_pct", ob.impulse_threshold_pct},
        {"lookback", ob.lookback},
        {"max_age", ob.max_age},
        {"consolidation_range_mult", ob.consolidation_range_mult}
    };

    const FairValueGapConfig& fvg = cfg.fair_value_gaps;
    j["fair_value_gaps"] = {
        {"min_size_pct", fvg.min_size_pct},
        {"strong_threshold_pct", fvg.strong_threshold_pct},
        {"max_age_bars", fvg.max_age_bars},
        {"strong_weight", fvg.strong_weight}
    };

    j["structure"] = {
        {"swing_lookback", cfg.structure.swing_lookback},
        {"liquidity_buffer_pct", cfg.structure.liquidity_buffer_pct}
    };

    const VolumeProfileConfig& vp = cfg.volume_profile;
    j["volume_profile"] = {
        {"bins", vp.bins},
        {"value_area_percent", vp.value_area_percent},
        {"hvn_multiplier", vp.hvn_multiplier},
        {"lvn_multiplier", vp.lvn_multiplier},
        {"period", vp.period}
    };

    const MarketProfileConfig& mp = cfg.market_profile;
    j["market_profile"] = {
        {"bins", mp.bins},
        {"value_area_percent", mp.value_area_percent},
        {"period", mp.period},
        {"time_weighted", mp.time_weighted},
        {"hvn_multiplier", mp.hvn_multiplier},
        {"lvn_multiplier", mp.lvn_multiplier}
    };

    j["tpo"] = {
        {"bins", cfg.tpo.bins},
        {"ib_periods", cfg.tpo.ib_periods},
        {"extreme_fraction", cfg.tpo.extreme_fraction},
        {"period", cfg.tpo.period}
    };

    const LevelWeights& w = cfg.levels.weights;
    j["confluence"] = {
        {"tolerance_pct", cfg.confluence.tolerance_pct},
        {"min_signals", cfg.confluence.min_signals},
        {"zone_tolerance_pct", cfg.confluence.zone_tolerance_pct},
        {"levels", {
            {"include_liquidity", cfg.levels.include_liquidity},
            {"include_tpo", cfg.levels.include_tpo},
            {"order_block", w.order_block},
            {"fair_value_gap", w.fair_value_gap},
            {"vp_poc", w.vp_poc},
            {"vp_hvn", w.vp_hvn},
            {"vp_value_area", w.vp_value_area},
            {"mp_poc", w.mp_poc},
            {"mp_value_area", w.mp_value_area},
            {"liquidity", w.liquidity},
            {"tpo_extreme", w.tpo_extreme}
        }}
    };

    const DeltaConfig& d = cfg.delta;
    j["delta"] = {
        {"dominant_share", d.dominant_share},
        {"threshold_pct", d.threshold_pct},
        {"divergence_lookback", d.divergence_lookback},
        {"absorption_lookback", d.absorption_lookback},
        {"absorption_tolerance_pct", d.absorption_tolerance_pct},
        {"summary_lookback", d.summary_lookback}
    };

    const EntryGateConfig& g = cfg.entry_gate;
    j["entry_gate"] = {
        {"enabled", g.enabled},
        {"require_trend", g.require_trend},
        {"require_order_block", g.require_order_block},
        {"require_delta", g.require_delta},
        {"require_absorption", g.require_absorption}
    };

    const RiskConfig& r = cfg.risk;
    j["risk"] = {
        {"risk_per_trade", r.risk_per_trade},
        {"max_risk_per_trade", r.max_risk_per_trade},
        {"min_risk_reward_ratio", r.min_risk_reward_ratio},
        {"atr_stop_multiplier", r.atr_stop_multiplier},
        {"zone_buffer_pct", r.zone_buffer_pct},
        {"fallback_stop_pct", r.fallback_stop_pct},
        {"trailing_distance_pct", r.trailing_distance_pct},
        {"trailing_atr_multiplier", r.trailing_atr_multiplier},
        {"trailing_floor_pct", r.trailing_floor_pct}
    };

    j["engine"] = {
        {"atr_period", cfg.engine.atr_period},
        {"workers", cfg.engine.workers},
        {"account_balance", cfg.engine.account_balance},
        {"plan_trades", cfg.engine.plan_trades}
    };

    return j;
}

}
