#ifndef PUMP_LAUNCHPAD_HPP
#define PUMP_LAUNCHPAD_HPP

// =============================================================================
// Launchpad - Bonding-Curve Token Launch Engine
//
// Components:
//   TokenRegistry         records + per-token locks
//   TokenLedger           per-token balances and allowances
//   BaseVault             base-currency custody (curve escrow, treasury, payees)
//   AdminControls         owner-gated fees, pause, venue
//   curve / fees / graduation   pure pricing and allocation steps
//
// Lock order inside one operation: token slot -> ledger book -> vault.
// A graduating buy calls the liquidity venue holding only the token slot.
// =============================================================================

#include <atomic>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include <nlohmann/json_fwd.hpp>

#include "types.hpp"
#include "config.hpp"
#include "curve.hpp"
#include "fees.hpp"
#include "ledger.hpp"
#include "vault.hpp"
#include "venue.hpp"
#include "admin.hpp"
#include "graduation.hpp"
#include "registry.hpp"

namespace pump {

// =============================================================================
// Events
// =============================================================================

struct TradeEvent {
    TokenId token;
    Address trader;
    bool is_buy;
    Amount base_amount;   // gross paid (buy) or gross released (sell)
    Amount token_amount;
    Amount fee;
    Amount referrer_cut;
    std::optional<Address> referrer;
    Amount price_after;
    uint64_t timestamp;
};

struct BurnEvent {
    TokenId token;
    Address holder;
    Amount token_amount;
    Amount base_out;
    uint64_t timestamp;
};

// Per-address trading totals across all tokens. Referrers are credited
// from trades that named them and paid them a cut.
struct UserStats {
    Amount total_volume = 0;
    Amount total_buy_value = 0;
    Amount total_sell_value = 0;
    uint64_t trade_count = 0;
    uint64_t buy_count = 0;
    uint64_t sell_count = 0;
    uint64_t referral_count = 0;
    Amount referral_volume = 0;
    Amount referral_earnings = 0;
    uint64_t last_trade_time = 0;
};

// Delivered after commit, with no engine lock held
class LaunchListener {
public:
    virtual ~LaunchListener() = default;
    virtual void on_token_created(const TokenRecord& token) = 0;
    virtual void on_trade(const TradeEvent& trade) = 0;
    virtual void on_burn(const BurnEvent& burn) = 0;
    virtual void on_graduated(const TokenRecord& token, const GraduationPlan& plan) = 0;
};

// No-op listener for when notifications aren't needed
class NullLaunchListener : public LaunchListener {
public:
    void on_token_created(const TokenRecord&) override {}
    void on_trade(const TradeEvent&) override {}
    void on_burn(const BurnEvent&) override {}
    void on_graduated(const TokenRecord&, const GraduationPlan&) override {}
};

// =============================================================================
// Launchpad - Unified Controller
// =============================================================================

class Launchpad {
public:
    using Clock = std::function<uint64_t()>;

    explicit Launchpad(const LaunchpadConfig& config = LaunchpadConfig{},
                       Clock clock = current_timestamp);
    ~Launchpad() = default;

    // Non-copyable
    Launchpad(const Launchpad&) = delete;
    Launchpad& operator=(const Launchpad&) = delete;

    // =========================================================================
    // Component Access
    // =========================================================================

    AdminControls& admin() { return admin_; }
    const AdminControls& admin() const { return admin_; }

    BaseVault& vault() { return vault_; }
    const BaseVault& vault() const { return vault_; }

    TokenLedger& ledger() { return ledger_; }
    const TokenLedger& ledger() const { return ledger_; }

    const TokenRegistry& registry() const { return registry_; }
    const LaunchpadConfig& config() const { return config_; }

    void set_listener(LaunchListener* listener);

    // =========================================================================
    // Token Creation
    // =========================================================================

    // ctx.value must cover the creation fee; exactly the fee is charged
    // from the caller's vault balance to treasury.
    Result<TokenId> create_token(const CallContext& ctx, const std::string& name,
                                 const std::string& symbol, const std::string& description,
                                 const std::string& metadata_uri);

    // =========================================================================
    // Trading
    //
    // Checks run in this order: InvalidToken, AlreadyGraduated, Paused,
    // ZeroAmount, balance/allowance, curve limits, slippage, payment.
    // =========================================================================

    // Spend base_in (fee included) from the caller's vault balance.
    // Crossing the graduation threshold graduates the token in the same call.
    Result<Amount> buy(const CallContext& ctx, TokenId token, Amount base_in,
                       Amount min_tokens_out,
                       const std::optional<Address>& referrer = std::nullopt);

    // Sell the caller's tokens; value is base received after the fee
    Result<Amount> sell(const CallContext& ctx, TokenId token, Amount tokens_in,
                        Amount min_base_out,
                        const std::optional<Address>& referrer = std::nullopt);

    // Sell `owner`'s tokens using the allowance owner granted the caller.
    // Proceeds go to the caller.
    Result<Amount> sell_from(const CallContext& ctx, TokenId token, const Address& owner,
                             Amount tokens_in, Amount min_base_out,
                             const std::optional<Address>& referrer = std::nullopt);

    // Pro-rata redemption against the real reserve, no fee
    Result<Amount> burn(const CallContext& ctx, TokenId token, Amount tokens_in);
    Result<Amount> burn_from(const CallContext& ctx, TokenId token, const Address& owner,
                             Amount tokens_in);

    // =========================================================================
    // Quotes & Reads
    // =========================================================================

    // Tokens out for a gross base input, after the buy fee
    Result<Amount> quote_buy(TokenId token, Amount base_in) const;

    // Base out for tokens_in, after the sell fee
    Result<Amount> quote_sell(TokenId token, Amount tokens_in) const;

    Result<Amount> price(TokenId token) const;
    Result<curve::Progress> progress(TokenId token) const;
    std::optional<TokenRecord> token(TokenId token) const;

    // =========================================================================
    // Ledger Passthrough
    // =========================================================================

    ErrorCode transfer(const CallContext& ctx, TokenId token, const Address& to, Amount amount);
    ErrorCode approve(const CallContext& ctx, TokenId token, const Address& spender, Amount amount);
    ErrorCode transfer_from(const CallContext& ctx, TokenId token, const Address& from,
                            const Address& to, Amount amount);

    Amount balance_of(TokenId token, const Address& owner) const;
    Amount allowance(TokenId token, const Address& owner, const Address& spender) const;
    uint64_t holder_count(TokenId token) const;

    // =========================================================================
    // Admin Passthrough
    // =========================================================================

    ErrorCode set_fees(const CallContext& ctx, uint32_t buy_fee_bps, uint32_t sell_fee_bps,
                       uint32_t creator_bps, uint32_t burn_bps, uint32_t liquidity_bps) {
        return admin_.set_fees(ctx, buy_fee_bps, sell_fee_bps, creator_bps, burn_bps, liquidity_bps);
    }

    ErrorCode set_paused(const CallContext& ctx, bool paused) {
        return admin_.set_paused(ctx, paused);
    }

    ErrorCode set_liquidity_venue(const CallContext& ctx, std::shared_ptr<ILiquidityVenue> venue) {
        return admin_.set_liquidity_venue(ctx, std::move(venue));
    }

    // =========================================================================
    // State
    // =========================================================================

    // Token table, balances table and vault accounts; amounts as decimal strings
    nlohmann::json export_state() const;

    // Loads a snapshot into an empty launchpad. InvalidParameter on malformed
    // input, on a non-empty launchpad, or when balances do not reconcile with
    // the token records.
    ErrorCode import_state(const nlohmann::json& state);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t tokens_created;
        uint64_t tokens_graduated;
        uint64_t buys;
        uint64_t sells;
        uint64_t burns;
        uint64_t failed_graduations;
        Amount total_volume;
    };
    Stats get_stats() const;

    // Zeroed for an address that never traded or referred
    UserStats user_stats(const Address& user) const;

private:
    LaunchpadConfig config_;
    Clock clock_;

    TokenRegistry registry_;
    TokenLedger ledger_;
    BaseVault vault_;
    AdminControls admin_;

    LaunchListener* listener_{nullptr};

    std::atomic<uint64_t> tokens_created_{0};
    std::atomic<uint64_t> tokens_graduated_{0};
    std::atomic<uint64_t> buys_{0};
    std::atomic<uint64_t> sells_{0};
    std::atomic<uint64_t> burns_{0};
    std::atomic<uint64_t> failed_graduations_{0};

    std::unordered_map<Address, UserStats, AddressHash> user_stats_;
    mutable std::mutex user_stats_mutex_;  // leaf; taken with no engine lock held

    void record_trade(const TradeEvent& trade);

    Result<Amount> sell_impl(const CallContext& ctx, TokenId token, const Address& owner,
                             Amount tokens_in, Amount min_base_out,
                             const std::optional<Address>& referrer);
    Result<Amount> burn_impl(const CallContext& ctx, TokenId token, const Address& owner,
                             Amount tokens_in);

    uint64_t now() const { return clock_ ? clock_() : current_timestamp(); }
};

} // namespace pump

#endif // PUMP_LAUNCHPAD_HPP
