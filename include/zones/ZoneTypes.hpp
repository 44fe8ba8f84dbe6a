#pragma once

#include "market/MarketTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace Confluence {

enum class ZoneKind : uint8_t {
    ORDER_BLOCK    = 0,
    FAIR_VALUE_GAP = 1
};

enum class ZoneEnd : uint8_t {
    NONE        = 0,
    INVALIDATED = 1,
    FILLED      = 2,
    EXPIRED     = 3
};

const char* to_string(ZoneKind k);
const char* to_string(ZoneEnd e);

struct Zone {
    ZoneKind kind = ZoneKind::ORDER_BLOCK;
    Direction direction = Direction::BULLISH;
    PriceLevel band;

    size_t origin_index = 0;
    size_t valid_from_index = 0;
    std::optional<size_t> valid_until_index;   // first index no longer valid
    ZoneEnd end_reason = ZoneEnd::NONE;

    double strength = 1.0;
    double size_pct = 0.0;                     // (high - low) / low * 100

    std::optional<size_t> confirmed_index;     // order blocks
    bool strong = false;                       // fair value gaps

    bool active_at(size_t index) const {
        if (index < valid_from_index)
            return false;
        return !valid_until_index || index < *valid_until_index;
    }
};

// Zones active at `index`, in input order.
std::vector<Zone> active_zones(const std::vector<Zone>& zones, size_t index);

// First zone active at `index` whose band contains `price`; nullptr if none.
const Zone* zone_containing(const std::vector<Zone>& zones, double price, size_t index);

double band_size_pct(const PriceLevel& band);

}
