#ifndef PUMP_VENUE_HPP
#define PUMP_VENUE_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <unordered_map>

#include "types.hpp"

namespace pump {

// Venue-side status codes
namespace venue_errors {
constexpr int32_t OK = 0;
constexpr int32_t ZERO_AMOUNT = -1;
constexpr int32_t BELOW_MINIMUM = -2;
constexpr int32_t EXPIRED = -3;
constexpr int32_t UNAVAILABLE = -4;
} // namespace venue_errors

struct VenueResult {
    int32_t code = venue_errors::OK;
    uint64_t pool_ref = 0;

    bool ok() const { return code == venue_errors::OK; }
};

// =============================================================================
// ILiquidityVenue - External AMM receiving graduated liquidity
// =============================================================================

class ILiquidityVenue {
public:
    virtual ~ILiquidityVenue() = default;

    // Account that must hold the token and base amounts before the call
    virtual Address account() const = 0;

    // Deposit both sides into the token's pool. The LP receipt goes to
    // `recipient`. Fails if either amount would fall below its minimum or
    // `deadline` (unix seconds) has passed.
    virtual VenueResult add_liquidity(TokenId token, Amount token_amount, Amount base_amount,
                                      Amount min_token, Amount min_base,
                                      const Address& recipient, uint64_t deadline) = 0;
};

// =============================================================================
// LocalVenue - In-process constant-product pools
// =============================================================================

class LocalVenue : public ILiquidityVenue {
public:
    using Clock = std::function<uint64_t()>;

    explicit LocalVenue(const Address& account = addresses::from_index(0x7E000001),
                        Clock clock = current_timestamp);

    Address account() const override { return account_; }

    VenueResult add_liquidity(TokenId token, Amount token_amount, Amount base_amount,
                              Amount min_token, Amount min_base,
                              const Address& recipient, uint64_t deadline) override;

    struct Pool {
        uint64_t ref;
        TokenId token;
        Amount token_reserve;
        Amount base_reserve;
        Amount lp_supply;
        std::unordered_map<Address, Amount, AddressHash> lp_balances;
    };

    std::optional<Pool> pool(uint64_t ref) const;
    std::optional<Pool> pool_for_token(TokenId token) const;
    size_t pool_count() const;

    // Make every subsequent add_liquidity fail (or throw) until cleared
    void set_failing(bool failing) { failing_.store(failing); }
    void set_throwing(bool throwing) { throwing_.store(throwing); }

private:
    Address account_;
    Clock clock_;

    std::unordered_map<uint64_t, Pool> pools_;
    std::unordered_map<TokenId, uint64_t> pool_by_token_;
    uint64_t next_ref_{1};
    mutable std::mutex mutex_;

    std::atomic<bool> failing_{false};
    std::atomic<bool> throwing_{false};
};

} // namespace pump

#endif // PUMP_VENUE_HPP
