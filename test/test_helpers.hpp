// pump-engine - shared test fixtures

#ifndef PUMP_TEST_HELPERS_HPP
#define PUMP_TEST_HELPERS_HPP

#include <catch2/catch.hpp>

#include <memory>
#include <string>

#include "pump/launchpad.hpp"

namespace Catch {

template <>
struct StringMaker<unsigned __int128> {
    static std::string convert(unsigned __int128 value) { return pump::to_string(value); }
};

template <>
struct StringMaker<pump::ErrorCode> {
    static std::string convert(pump::ErrorCode code) { return pump::to_string(code); }
};

template <>
struct StringMaker<pump::Address> {
    static std::string convert(const pump::Address& addr) { return pump::to_hex(addr); }
};

} // namespace Catch

namespace pump {
namespace testing {

constexpr uint64_t FIXED_NOW = 1700000000;

// vB 12,500,000 / vT 250,000,000, threshold 50,000,000, 100 bps fees,
// raw base units (no WAD scaling)
inline LaunchpadConfig scenario_config() {
    LaunchpadConfig config;
    config.with_curve(12500000, 250000000, 50000000)
          .with_supply(1000000000, 249000000)
          .with_fees(100, 100)
          .with_creation_fee(1000)
          .set_log_level("off");
    return config;
}

// Launchpad with a local venue, one launched token and funded traders
struct LaunchFixture {
    LaunchpadConfig config;
    Launchpad launchpad;
    std::shared_ptr<LocalVenue> venue;

    Address owner;
    Address treasury;
    Address creator = addresses::from_index(100);
    Address alice = addresses::from_index(200);
    Address bob = addresses::from_index(201);
    Address carol = addresses::from_index(202);

    TokenId token = 0;

    explicit LaunchFixture(const LaunchpadConfig& cfg = scenario_config())
        : config(cfg),
          launchpad(cfg, [] { return FIXED_NOW; }),
          venue(std::make_shared<LocalVenue>(addresses::from_index(0x7E000001),
                                             [] { return FIXED_NOW; })),
          owner(cfg.accounts.owner),
          treasury(cfg.accounts.treasury) {
        launchpad.set_liquidity_venue(CallContext{owner}, venue);

        Amount fee = cfg.fees.creation_fee;
        if (fee > 0) {
            launchpad.vault().deposit(creator, fee);
        }
        token = launchpad.create_token(CallContext{creator, fee}, "Test Token", "TEST",
                                       "fixture token", "ipfs://test").value;
    }

    void fund(const Address& who, Amount amount) {
        launchpad.vault().deposit(who, amount);
    }

    TokenRecord record() const { return *launchpad.token(token); }

    Amount vault_balance(const Address& who) const { return launchpad.vault().balance(who); }

    // Sum of all ledger balances of the fixture token
    Amount ledger_sum() const {
        Amount sum = 0;
        for (const auto& [owner_addr, amount] : launchpad.ledger().balances(token)) {
            sum += amount;
        }
        return sum;
    }
};

} // namespace testing
} // namespace pump

#endif // PUMP_TEST_HELPERS_HPP
