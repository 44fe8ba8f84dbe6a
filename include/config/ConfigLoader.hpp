#pragma once

#include "config/EngineConfig.hpp"

#include <nlohmann/json_fwd.hpp>

#include <string>

namespace Confluence {

// JSON sections: order_blocks, fair_value_gaps, structure, volume_profile,
// market_profile, tpo, confluence (with nested "levels"), risk, engine.
// Missing keys keep their defaults. A value of the wrong type throws
// std::runtime_error naming the section and key.
class ConfigLoader {
public:
    static EngineConfig load_file(const std::string& path);
    static EngineConfig parse(const std::string& text, const std::string& source = "<memory>");
    static EngineConfig from_json(const nlohmann::json& root);
    static nlohmann::json to_json(const EngineConfig& cfg);
};

}
