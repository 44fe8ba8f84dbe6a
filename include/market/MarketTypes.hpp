#pragma once

#include <algorithm>
#include <cstdint>

namespace Confluence {

enum class Direction : uint8_t {
    BULLISH = 0,
    BEARISH = 1
};

inline const char* to_string(Direction d) {
    return d == Direction::BULLISH ? "BULLISH" : "BEARISH";
}

// A single price or a closed [low, high] band.
struct PriceLevel {
    double low  = 0.0;
    double high = 0.0;

    static PriceLevel point(double price) { return PriceLevel{price, price}; }
    static PriceLevel band(double a, double b) {
        return PriceLevel{std::min(a, b), std::max(a, b)};
    }

    double mid()   const { return (low + high) * 0.5; }
    double width() const { return high - low; }
    bool is_point() const { return low == high; }
    bool contains(double price) const { return price >= low && price <= high; }
};

}
