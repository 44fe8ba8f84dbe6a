#pragma once

#include "engine/ConfluenceEngine.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace Confluence {

// Plain JSON records for presentation collaborators. Absent values are null.
nlohmann::json zone_json(const Zone& z);
nlohmann::json confluence_zone_json(const ConfluenceZone& z);
nlohmann::json trade_plan_json(const TradePlan& p);
nlohmann::json profile_json(const Profile& p);
nlohmann::json structure_json(const StructureState& s);
nlohmann::json snapshot_json(const SymbolAnalysis& a);

// indent < 0 emits a single line.
std::string emit_snapshot(const SymbolAnalysis& a, int indent = -1);

}
