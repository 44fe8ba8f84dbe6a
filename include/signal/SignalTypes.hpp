#pragma once

#include "market/MarketTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <set>

namespace Confluence {

// One tag per independent signal source. Distinct tags are what a confluence
// zone counts.
enum class SignalTag : uint8_t {
    ORDER_BLOCK    = 0,
    FAIR_VALUE_GAP = 1,
    VP_POC         = 2,
    VP_VAH         = 3,
    VP_VAL         = 4,
    VP_HVN         = 5,
    MP_POC         = 6,
    MP_VAH         = 7,
    MP_VAL         = 8,
    LIQUIDITY_HIGH = 9,
    LIQUIDITY_LOW  = 10,
    TPO_POOR_HIGH  = 11,
    TPO_POOR_LOW   = 12
};

const char* to_string(SignalTag t);

struct WeightedLevel {
    double price = 0.0;
    PriceLevel band;
    SignalTag tag = SignalTag::ORDER_BLOCK;
    double strength = 1.0;
};

struct ConfluenceZone {
    double level = 0.0;
    PriceLevel band;
    std::set<SignalTag> contributing_signals;
    double strength = 0.0;
    size_t signal_count = 0;
};

}
