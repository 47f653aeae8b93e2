// =============================================================================
// vault.cpp - BaseVault Custody Implementation
// =============================================================================

#include "pump/vault.hpp"

namespace pump {

Amount BaseVault::balance_locked(const Address& account) const {
    auto it = balances_.find(account);
    return it != balances_.end() ? it->second : 0;
}

// =============================================================================
// Custody
// =============================================================================

ErrorCode BaseVault::deposit(const Address& account, Amount amount) {
    if (amount == 0) {
        return ErrorCode::ZeroAmount;
    }

    std::unique_lock lock(mutex_);
    balances_[account] += amount;
    return ErrorCode::Ok;
}

ErrorCode BaseVault::withdraw(const Address& account, Amount amount) {
    if (amount == 0) {
        return ErrorCode::ZeroAmount;
    }

    std::unique_lock lock(mutex_);
    auto it = balances_.find(account);
    if (it == balances_.end() || it->second < amount) {
        return ErrorCode::InsufficientBalance;
    }
    it->second -= amount;
    return ErrorCode::Ok;
}

ErrorCode BaseVault::transfer(const Address& from, const Address& to, Amount amount) {
    return apply({Transfer{from, to, amount}});
}

Amount BaseVault::balance(const Address& account) const {
    std::shared_lock lock(mutex_);
    return balance_locked(account);
}

Amount BaseVault::total_balance() const {
    std::shared_lock lock(mutex_);
    Amount total = held_;
    for (const auto& [account, amount] : balances_) {
        total += amount;
    }
    return total;
}

std::vector<std::pair<Address, Amount>> BaseVault::accounts() const {
    std::shared_lock lock(mutex_);
    std::vector<std::pair<Address, Amount>> result;
    result.reserve(balances_.size());
    for (const auto& [account, amount] : balances_) {
        if (amount > 0) result.emplace_back(account, amount);
    }
    return result;
}

// =============================================================================
// Atomic Batches
// =============================================================================

ErrorCode BaseVault::stage_locked(const std::vector<Transfer>& legs, Balances& working,
                                  bool credit, bool check_payees) const {
    auto current = [&](const Address& account) -> Amount& {
        auto it = working.find(account);
        if (it == working.end()) {
            it = working.emplace(account, balance_locked(account)).first;
        }
        return it->second;
    };

    for (const auto& leg : legs) {
        if (leg.amount == 0) continue;
        if (check_payees && rejecting_.count(leg.to) != 0) {
            return ErrorCode::ExternalTransferFailed;
        }
        Amount& from_bal = current(leg.from);
        if (from_bal < leg.amount) {
            return ErrorCode::InsufficientPayment;
        }
        from_bal -= leg.amount;
        if (credit) {
            current(leg.to) += leg.amount;
        }
    }
    return ErrorCode::Ok;
}

ErrorCode BaseVault::apply(const std::vector<Transfer>& batch, const PreCommit& before_commit) {
    std::unique_lock lock(mutex_);

    // Validate every leg against a working copy of the touched accounts
    Balances working;
    ErrorCode err = stage_locked(batch, working, true, true);
    if (err != ErrorCode::Ok) {
        batches_rejected_.fetch_add(1, std::memory_order_relaxed);
        return err;
    }

    if (before_commit) {
        err = before_commit();
        if (err != ErrorCode::Ok) {
            batches_rejected_.fetch_add(1, std::memory_order_relaxed);
            return err;
        }
    }

    for (const auto& [account, amount] : working) {
        balances_[account] = amount;
    }
    batches_applied_.fetch_add(1, std::memory_order_relaxed);
    return ErrorCode::Ok;
}

// =============================================================================
// Held Batches
// =============================================================================

Result<uint64_t> BaseVault::hold(const std::vector<Transfer>& immediate,
                                 const std::vector<Transfer>& deferred) {
    std::unique_lock lock(mutex_);

    Balances working;
    ErrorCode err = stage_locked(immediate, working, true, true);
    if (err == ErrorCode::Ok) {
        err = stage_locked(deferred, working, false, true);
    }
    if (err != ErrorCode::Ok) {
        batches_rejected_.fetch_add(1, std::memory_order_relaxed);
        return Result<uint64_t>::failure(err);
    }

    for (const auto& [account, amount] : working) {
        balances_[account] = amount;
    }
    for (const auto& leg : deferred) {
        held_ += leg.amount;
    }

    uint64_t id = next_hold_++;
    holds_.emplace(id, Hold{immediate, deferred});
    return Result<uint64_t>::success(id);
}

ErrorCode BaseVault::settle(uint64_t hold_id) {
    std::unique_lock lock(mutex_);
    auto it = holds_.find(hold_id);
    if (it == holds_.end()) {
        return ErrorCode::InvalidParameter;
    }

    for (const auto& leg : it->second.deferred) {
        if (leg.amount == 0) continue;
        balances_[leg.to] += leg.amount;
        held_ -= leg.amount;
    }
    holds_.erase(it);
    holds_settled_.fetch_add(1, std::memory_order_relaxed);
    batches_applied_.fetch_add(1, std::memory_order_relaxed);
    return ErrorCode::Ok;
}

ErrorCode BaseVault::release(uint64_t hold_id) {
    std::unique_lock lock(mutex_);
    auto it = holds_.find(hold_id);
    if (it == holds_.end()) {
        return ErrorCode::InvalidParameter;
    }
    const Hold& h = it->second;

    // Refund deferred payers first, then undo immediate legs last-first;
    // refunds ignore reject flags
    Balances working;
    for (const auto& leg : h.deferred) {
        if (leg.amount == 0) continue;
        auto cur = working.find(leg.from);
        if (cur == working.end()) {
            cur = working.emplace(leg.from, balance_locked(leg.from)).first;
        }
        cur->second += leg.amount;
    }

    std::vector<Transfer> reversal;
    reversal.reserve(h.immediate.size());
    for (auto leg = h.immediate.rbegin(); leg != h.immediate.rend(); ++leg) {
        reversal.push_back(Transfer{leg->to, leg->from, leg->amount});
    }
    if (stage_locked(reversal, working, true, false) != ErrorCode::Ok) {
        return ErrorCode::InsufficientBalance;
    }

    for (const auto& [account, amount] : working) {
        balances_[account] = amount;
    }
    for (const auto& leg : h.deferred) {
        held_ -= leg.amount;
    }
    holds_.erase(it);
    holds_released_.fetch_add(1, std::memory_order_relaxed);
    batches_rejected_.fetch_add(1, std::memory_order_relaxed);
    return ErrorCode::Ok;
}

size_t BaseVault::open_holds() const {
    std::shared_lock lock(mutex_);
    return holds_.size();
}

// =============================================================================
// Payee Behaviour
// =============================================================================

void BaseVault::set_reject_receipts(const Address& account, bool reject) {
    std::unique_lock lock(mutex_);
    if (reject) {
        rejecting_.insert(account);
    } else {
        rejecting_.erase(account);
    }
}

bool BaseVault::rejects_receipts(const Address& account) const {
    std::shared_lock lock(mutex_);
    return rejecting_.count(account) != 0;
}

BaseVault::Stats BaseVault::get_stats() const {
    std::shared_lock lock(mutex_);
    return Stats{
        static_cast<uint64_t>(balances_.size()),
        batches_applied_.load(std::memory_order_relaxed),
        batches_rejected_.load(std::memory_order_relaxed),
        holds_settled_.load(std::memory_order_relaxed),
        holds_released_.load(std::memory_order_relaxed),
    };
}

} // namespace pump
