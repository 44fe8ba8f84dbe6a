#include "zones/ZoneTypes.hpp"

namespace Confluence {

const char* to_string(ZoneKind k) {
    return k == ZoneKind::ORDER_BLOCK ? "ORDER_BLOCK" : "FAIR_VALUE_GAP";
}

const char* to_string(ZoneEnd e) {
    switch (e) {
        case ZoneEnd::NONE:        return "NONE";
        case ZoneEnd::INVALIDATED: return "INVALIDATED";
        case ZoneEnd::FILLED:      return "FILLED";
        case ZoneEnd::EXPIRED:     return "EXPIRED";
    }
    return "UNKNOWN";
}

std::vector<Zone> active_zones(const std::vector<Zone>& zones, size_t index) {
    std::vector<Zone> out;
    for (const Zone& z : zones) {
        if (z.active_at(index))
            out.push_back(z);
    }
    return out;
}

const Zone* zone_containing(const std::vector<Zone>& zones, double price, size_t index) {
    for (const Zone& z : zones) {
        if (z.active_at(index) && z.band.contains(price))
            return &z;
    }
    return nullptr;
}

double band_size_pct(const PriceLevel& band) {
    if (band.low <= 0.0)
        return 0.0;
    return band.width() / band.low * 100.0;
}

}
