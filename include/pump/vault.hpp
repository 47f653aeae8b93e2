#ifndef PUMP_VAULT_HPP
#define PUMP_VAULT_HPP

#include <atomic>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>
#include <vector>

#include "types.hpp"

namespace pump {

// Single base-currency movement
struct Transfer {
    Address from;
    Address to;
    Amount amount;
};

// =============================================================================
// BaseVault - Base-currency custody (PLS-equivalent)
//
// Holds trader funds, the curve escrow, treasury and payout balances. Batches
// are all-or-nothing: every leg is validated against a working copy before
// anything is written.
// =============================================================================

class BaseVault {
public:
    BaseVault() = default;
    ~BaseVault() = default;

    // Non-copyable
    BaseVault(const BaseVault&) = delete;
    BaseVault& operator=(const BaseVault&) = delete;

    // =========================================================================
    // Custody
    // =========================================================================

    ErrorCode deposit(const Address& account, Amount amount);
    ErrorCode withdraw(const Address& account, Amount amount);
    ErrorCode transfer(const Address& from, const Address& to, Amount amount);

    Amount balance(const Address& account) const;

    // Sum of all balances plus funds debited by open holds; constant under
    // transfers
    Amount total_balance() const;

    // Non-zero balances, for state export
    std::vector<std::pair<Address, Amount>> accounts() const;

    // =========================================================================
    // Atomic Batches
    // =========================================================================

    // Runs after every leg validated and before any is written, under the
    // vault lock. A non-Ok return aborts the batch. Must not call back into
    // the vault.
    using PreCommit = std::function<ErrorCode()>;

    ErrorCode apply(const std::vector<Transfer>& batch, const PreCommit& before_commit = nullptr);

    // =========================================================================
    // Held Batches
    //
    // For hand-offs where a payee must hold funds before it can confirm.
    // hold() validates every leg of both lists, writes `immediate` and debits
    // the payers of `deferred`. settle() then credits the deferred payees;
    // release() refunds the deferred payers and reverses `immediate`.
    // No vault lock is held between the calls.
    // =========================================================================

    Result<uint64_t> hold(const std::vector<Transfer>& immediate,
                          const std::vector<Transfer>& deferred);

    // Payees accepted by hold() are credited even if they since started
    // rejecting receipts. InvalidParameter for an unknown hold.
    ErrorCode settle(uint64_t hold_id);

    // InsufficientBalance if an immediate payee no longer holds what it was
    // given; the hold then stays open and nothing is written.
    ErrorCode release(uint64_t hold_id);

    size_t open_holds() const;

    // =========================================================================
    // Payee Behaviour
    // =========================================================================

    // An account flagged here refuses incoming transfers; any batch paying
    // it fails with ExternalTransferFailed.
    void set_reject_receipts(const Address& account, bool reject);
    bool rejects_receipts(const Address& account) const;

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_accounts;
        uint64_t batches_applied;
        uint64_t batches_rejected;
        uint64_t holds_settled;
        uint64_t holds_released;
    };
    Stats get_stats() const;

private:
    using Balances = std::unordered_map<Address, Amount, AddressHash>;

    struct Hold {
        std::vector<Transfer> immediate;
        std::vector<Transfer> deferred;
    };

    Balances balances_;
    std::unordered_set<Address, AddressHash> rejecting_;
    std::unordered_map<uint64_t, Hold> holds_;
    uint64_t next_hold_{1};
    Amount held_{0};  // debited by open holds, not yet credited
    mutable std::shared_mutex mutex_;

    std::atomic<uint64_t> batches_applied_{0};
    std::atomic<uint64_t> batches_rejected_{0};
    std::atomic<uint64_t> holds_settled_{0};
    std::atomic<uint64_t> holds_released_{0};

    Amount balance_locked(const Address& account) const;

    // Plays `legs` onto `working`. Payees are credited only when `credit`
    // is set; rejecting payees are refused only when `check_payees` is set.
    ErrorCode stage_locked(const std::vector<Transfer>& legs, Balances& working,
                           bool credit, bool check_payees) const;
};

} // namespace pump

#endif // PUMP_VAULT_HPP
