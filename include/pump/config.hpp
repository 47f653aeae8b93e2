#ifndef PUMP_CONFIG_HPP
#define PUMP_CONFIG_HPP

#include <stdexcept>
#include <string>
#include <string_view>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"

namespace pump {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// General engine settings
struct GeneralConfig {
    std::string log_level = "info";
};

// Curve parameterization copied into every token record at creation.
// Invariant: bonding_supply < virtual_token_reserve, so the effective token
// reserve (virtual_token_reserve - tokens_sold) never reaches zero.
struct CurveConfig {
    Amount virtual_base_reserve = from_whole(12500000);
    Amount virtual_token_reserve = from_whole(1000000000);
    Amount total_supply = from_whole(1000000000);
    Amount bonding_supply = from_whole(800000000);
    Amount graduation_threshold = from_whole(40000000);
};

struct FeeConfig {
    uint32_t buy_fee_bps = 100;
    uint32_t sell_fee_bps = 100;
    uint32_t max_fee_bps = 500;
    Amount creation_fee = from_whole(100);
    uint32_t referral_share_bps = 5000;  // referrer's share of the fee
};

struct GraduationConfig {
    uint32_t burn_bps = 1000;
    uint32_t liquidity_bps = 8000;
    uint32_t creator_bps = 500;
    Address lp_recipient = addresses::BURN_SINK;
    uint64_t liquidity_deadline_secs = 300;
};

struct AccountsConfig {
    Address owner = addresses::from_index(1);
    Address treasury = addresses::from_index(2);
};

class LaunchpadConfig {
public:
    GeneralConfig general;
    CurveConfig curve;
    FeeConfig fees;
    GraduationConfig graduation;
    AccountsConfig accounts;

    LaunchpadConfig() = default;

    // Load from TOML file
    static LaunchpadConfig from_file(std::string_view path);

    // Load from TOML string
    static LaunchpadConfig from_toml(std::string_view content);

    // Throws ConfigError when the parameter set is inconsistent
    void validate() const;

    // Builder methods
    LaunchpadConfig& with_curve(Amount virtual_base, Amount virtual_tokens,
                                Amount graduation_threshold) {
        curve.virtual_base_reserve = virtual_base;
        curve.virtual_token_reserve = virtual_tokens;
        curve.graduation_threshold = graduation_threshold;
        return *this;
    }

    LaunchpadConfig& with_supply(Amount total, Amount bonding) {
        curve.total_supply = total;
        curve.bonding_supply = bonding;
        return *this;
    }

    LaunchpadConfig& with_fees(uint32_t buy_bps, uint32_t sell_bps) {
        fees.buy_fee_bps = buy_bps;
        fees.sell_fee_bps = sell_bps;
        return *this;
    }

    LaunchpadConfig& with_creation_fee(Amount fee) {
        fees.creation_fee = fee;
        return *this;
    }

    LaunchpadConfig& with_allocation(uint32_t burn_bps, uint32_t liquidity_bps,
                                     uint32_t creator_bps) {
        graduation.burn_bps = burn_bps;
        graduation.liquidity_bps = liquidity_bps;
        graduation.creator_bps = creator_bps;
        return *this;
    }

    LaunchpadConfig& with_owner(const Address& owner) {
        accounts.owner = owner;
        return *this;
    }

    LaunchpadConfig& with_treasury(const Address& treasury) {
        accounts.treasury = treasury;
        return *this;
    }

    LaunchpadConfig& set_log_level(std::string level) {
        general.log_level = std::move(level);
        return *this;
    }
};

void to_json(nlohmann::json& j, const LaunchpadConfig& config);
void from_json(const nlohmann::json& j, LaunchpadConfig& config);

}  // namespace pump

#endif // PUMP_CONFIG_HPP
