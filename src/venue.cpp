// =============================================================================
// venue.cpp - In-process Liquidity Venue
// =============================================================================

#include "pump/venue.hpp"
#include "pump/math.hpp"

#include <stdexcept>

namespace pump {

LocalVenue::LocalVenue(const Address& account, Clock clock)
    : account_(account), clock_(std::move(clock)) {}

VenueResult LocalVenue::add_liquidity(TokenId token, Amount token_amount, Amount base_amount,
                                      Amount min_token, Amount min_base,
                                      const Address& recipient, uint64_t deadline) {
    if (throwing_.load()) {
        throw std::runtime_error("liquidity venue unreachable");
    }
    if (failing_.load()) {
        return VenueResult{venue_errors::UNAVAILABLE, 0};
    }
    if (token_amount == 0 || base_amount == 0) {
        return VenueResult{venue_errors::ZERO_AMOUNT, 0};
    }
    if (clock_ && clock_() > deadline) {
        return VenueResult{venue_errors::EXPIRED, 0};
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto existing = pool_by_token_.find(token);
    if (existing == pool_by_token_.end()) {
        // First deposit sets the price; LP units track the base side
        uint64_t ref = next_ref_++;
        Pool pool;
        pool.ref = ref;
        pool.token = token;
        pool.token_reserve = token_amount;
        pool.base_reserve = base_amount;
        pool.lp_supply = base_amount;
        pool.lp_balances[recipient] = base_amount;
        pools_.emplace(ref, std::move(pool));
        pool_by_token_[token] = ref;
        return VenueResult{venue_errors::OK, ref};
    }

    // Subsequent deposits are taken at the pool ratio
    Pool& pool = pools_.at(existing->second);
    Amount base_used = base_amount;
    Amount token_used = math::mul_div(base_amount, pool.token_reserve, pool.base_reserve);
    if (token_used > token_amount) {
        token_used = token_amount;
        base_used = math::mul_div(token_amount, pool.base_reserve, pool.token_reserve);
    }
    if (token_used < min_token || base_used < min_base) {
        return VenueResult{venue_errors::BELOW_MINIMUM, 0};
    }

    Amount minted = math::mul_div(base_used, pool.lp_supply, pool.base_reserve);
    pool.token_reserve += token_used;
    pool.base_reserve += base_used;
    pool.lp_supply += minted;
    pool.lp_balances[recipient] += minted;
    return VenueResult{venue_errors::OK, pool.ref};
}

std::optional<LocalVenue::Pool> LocalVenue::pool(uint64_t ref) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pools_.find(ref);
    if (it == pools_.end()) return std::nullopt;
    return it->second;
}

std::optional<LocalVenue::Pool> LocalVenue::pool_for_token(TokenId token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pool_by_token_.find(token);
    if (it == pool_by_token_.end()) return std::nullopt;
    return pools_.at(it->second);
}

size_t LocalVenue::pool_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pools_.size();
}

} // namespace pump
