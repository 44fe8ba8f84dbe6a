#pragma once

#include <cstdint>
#include <optional>
#include <vector>

namespace Confluence {

enum class ProfileStatus : uint8_t {
    OK                = 0,
    INSUFFICIENT_DATA = 1,
    DEGENERATE_RANGE  = 2,
    NO_VALUE_AREA     = 3
};

enum class MarketState : uint8_t {
    BALANCED = 0,
    TRENDING = 1
};

const char* to_string(ProfileStatus s);
const char* to_string(MarketState s);

struct ProfileBin {
    double price  = 0.0;   // bucket center
    double volume = 0.0;
};

struct Profile {
    ProfileStatus status = ProfileStatus::INSUFFICIENT_DATA;
    std::optional<double> poc;
    std::optional<double> val;
    std::optional<double> vah;
    std::vector<ProfileBin> bins;
    double total_volume = 0.0;
    std::vector<double> hvn;
    std::vector<double> lvn;
    std::optional<double> profile_high;
    std::optional<double> profile_low;

    bool has_value_area() const { return poc && val && vah; }

    bool in_value_area(double price) const {
        return has_value_area() && price >= *val && price <= *vah;
    }

    // Volume of the bins whose centers lie inside [val, vah].
    double value_area_volume() const {
        double v = 0.0;
        if (!has_value_area())
            return v;
        for (const ProfileBin& b : bins) {
            if (b.price >= *val && b.price <= *vah)
                v += b.volume;
        }
        return v;
    }
};

struct MarketProfile {
    Profile profile;
    MarketState market_state = MarketState::BALANCED;
};

struct TpoProfile {
    ProfileStatus status = ProfileStatus::INSUFFICIENT_DATA;
    std::vector<double> single_prints;
    std::optional<double> poor_high;
    std::optional<double> poor_low;
    std::optional<double> ib_high;
    std::optional<double> ib_low;

    // Inside the initial balance, widened by ib_low * tolerance_pct.
    bool price_in_initial_balance(double price, double tolerance_pct = 0.001) const {
        if (!ib_high || !ib_low)
            return false;
        const double tol = *ib_low * tolerance_pct;
        return price >= *ib_low - tol && price <= *ib_high + tol;
    }
};

}
