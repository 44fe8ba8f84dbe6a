#pragma once

#include "market/MarketTypes.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>

namespace Confluence {

enum class Trend : uint8_t {
    RANGE   = 0,
    BULLISH = 1,
    BEARISH = 2
};

enum class SwingKind : uint8_t {
    HIGH = 0,
    LOW  = 1
};

enum class BreakKind : uint8_t {
    BOS   = 0,
    CHOCH = 1
};

const char* to_string(Trend t);
const char* to_string(SwingKind k);
const char* to_string(BreakKind k);

struct SwingPoint {
    size_t index = 0;
    double price = 0.0;
    SwingKind kind = SwingKind::HIGH;
};

struct BreakEvent {
    BreakKind kind = BreakKind::BOS;
    Direction direction = Direction::BULLISH;
};

// Structure as known at the close of one candle.
struct StructureState {
    Trend trend = Trend::RANGE;
    std::optional<double> last_swing_high;
    std::optional<double> last_swing_low;
    std::optional<BreakEvent> bos;
    std::optional<BreakEvent> choch;
    std::optional<double> liquidity_high;
    std::optional<double> liquidity_low;

    std::optional<BreakEvent> break_event() const { return bos ? bos : choch; }
};

}
