// =============================================================================
// launchpad.cpp - Launchpad controller
// =============================================================================

#include "pump/launchpad.hpp"
#include "pump/log.hpp"

namespace pump {

Launchpad::Launchpad(const LaunchpadConfig& config, Clock clock)
    : config_(config), clock_(std::move(clock)), admin_(config) {
    config_.validate();
    log::set_level(log::level_from_string(config_.general.log_level));
}

void Launchpad::set_listener(LaunchListener* listener) {
    listener_ = listener;
}

// =============================================================================
// Token Creation
// =============================================================================

Result<TokenId> Launchpad::create_token(const CallContext& ctx, const std::string& name,
                                        const std::string& symbol, const std::string& description,
                                        const std::string& metadata_uri) {
    if (admin_.paused()) {
        return Result<TokenId>::failure(ErrorCode::Paused);
    }
    if (name.empty() || symbol.empty() || addresses::is_zero(ctx.caller)) {
        return Result<TokenId>::failure(ErrorCode::InvalidParameter);
    }

    FeeSchedule schedule = admin_.schedule();
    if (ctx.value < schedule.creation_fee) {
        return Result<TokenId>::failure(ErrorCode::InsufficientPayment);
    }

    ErrorCode err = vault_.apply({Transfer{ctx.caller, schedule.treasury, schedule.creation_fee}});
    if (err != ErrorCode::Ok) {
        return Result<TokenId>::failure(err);
    }

    TokenRecord record;
    record.creator = ctx.caller;
    record.name = name;
    record.symbol = symbol;
    record.description = description;
    record.metadata_uri = metadata_uri;
    record.virtual_base_reserve = config_.curve.virtual_base_reserve;
    record.virtual_token_reserve = config_.curve.virtual_token_reserve;
    record.total_supply = config_.curve.total_supply;
    record.bonding_supply = config_.curve.bonding_supply;
    record.graduation_threshold = config_.curve.graduation_threshold;
    record.created_at = now();

    TokenId id = registry_.create(record, [this](TokenId new_id) {
        if (!ledger_.open(new_id)) {
            log::warn("ledger book for token " + std::to_string(new_id) + " already open");
        }
    });
    record.id = id;
    tokens_created_.fetch_add(1, std::memory_order_relaxed);

    log::info("token " + std::to_string(id) + " created: " + symbol + " by " + to_hex(ctx.caller));
    if (listener_) {
        listener_->on_token_created(record);
    }
    return Result<TokenId>::success(id);
}

// =============================================================================
// Trading
// =============================================================================

Result<Amount> Launchpad::buy(const CallContext& ctx, TokenId token, Amount base_in,
                              Amount min_tokens_out, const std::optional<Address>& referrer) {
    TradeEvent event{};
    std::optional<GraduationPlan> plan;
    TokenRecord graduated;

    {
        auto slot = registry_.lock(token);
        if (!slot.valid()) {
            return Result<Amount>::failure(ErrorCode::InvalidToken);
        }
        TokenRecord& live = slot.record();
        if (!live.is_active()) {
            return Result<Amount>::failure(ErrorCode::AlreadyGraduated);
        }
        if (admin_.paused()) {
            return Result<Amount>::failure(ErrorCode::Paused);
        }
        if (base_in == 0) {
            return Result<Amount>::failure(ErrorCode::ZeroAmount);
        }

        FeeSchedule schedule = admin_.schedule();
        uint32_t fee_bps = admin_.is_fee_exempt(ctx.caller) ? 0 : schedule.buy_fee_bps;
        FeeSplit split = fees::split(base_in, fee_bps, schedule.referral_share_bps,
                                     referrer, ctx.caller);

        auto quote = curve::quote_buy(live, split.net);
        if (!quote) {
            return Result<Amount>::failure(quote.error);
        }
        Amount tokens_out = quote.value;
        if (tokens_out < min_tokens_out) {
            return Result<Amount>::failure(ErrorCode::SlippageExceeded);
        }

        TokenRecord staged = live;
        curve::apply_buy(staged, split.net, tokens_out, base_in);

        std::vector<Transfer> legs;
        legs.push_back(Transfer{ctx.caller, addresses::CURVE_ESCROW, split.net});
        for (auto& leg : fees::payouts(split, ctx.caller, schedule.treasury)) {
            legs.push_back(leg);
        }

        uint64_t timestamp = now();
        std::shared_ptr<ILiquidityVenue> venue;
        Address venue_account = addresses::ZERO;
        plan = graduation::plan(staged, schedule);
        if (plan) {
            venue = admin_.venue();
            if (plan->needs_venue() && !venue) {
                failed_graduations_.fetch_add(1, std::memory_order_relaxed);
                log::warn("buy on token " + std::to_string(token) +
                          " reverted: graduation needs a liquidity venue");
                return Result<Amount>::failure(ErrorCode::ExternalTransferFailed);
            }
            if (venue) {
                venue_account = venue->account();
            }
        }

        auto book = ledger_.lock(token);
        if (!book.valid()) {
            return Result<Amount>::failure(ErrorCode::InvalidToken);
        }

        uint64_t pool_ref = 0;
        if (plan && plan->needs_venue()) {
            // The venue must hold its allocation when it is called. Principal
            // and the venue legs are written now; fees, burn and creator
            // reward wait on the venue's answer.
            std::vector<Transfer> immediate{legs.front()};
            std::vector<Transfer> deferred(legs.begin() + 1, legs.end());
            for (auto& leg : graduation::transfers(*plan, staged.creator, venue_account)) {
                (leg.to == venue_account ? immediate : deferred).push_back(leg);
            }

            auto held = vault_.hold(immediate, deferred);
            if (!held) {
                if (held.error == ErrorCode::ExternalTransferFailed) {
                    failed_graduations_.fetch_add(1, std::memory_order_relaxed);
                }
                return Result<Amount>::failure(held.error);
            }
            book.mint(venue_account, plan->liquidity_tokens);

            // Only the token's own slot stays locked across the external call
            book.unlock();
            auto added = graduation::add_liquidity(*plan, venue.get(), schedule, timestamp);
            book = ledger_.lock(token);

            if (!added) {
                failed_graduations_.fetch_add(1, std::memory_order_relaxed);
                ErrorCode burned = book.burn(venue_account, plan->liquidity_tokens);
                ErrorCode released = vault_.release(held.value);
                if (burned != ErrorCode::Ok || released != ErrorCode::Ok) {
                    log::error("graduation of token " + std::to_string(token) +
                               " failed but the venue kept custody: tokens " +
                               to_string(burned) + ", base " + to_string(released));
                }
                return Result<Amount>::failure(added.error);
            }

            ErrorCode settled = vault_.settle(held.value);
            if (settled != ErrorCode::Ok) {
                log::error("graduation of token " + std::to_string(token) +
                           " could not settle hold " + std::to_string(held.value) + ": " +
                           to_string(settled));
            }
            pool_ref = added.value;
        } else {
            if (plan) {
                for (auto& leg : graduation::transfers(*plan, staged.creator, venue_account)) {
                    legs.push_back(leg);
                }
            }
            ErrorCode err = vault_.apply(legs);
            if (err != ErrorCode::Ok) {
                if (plan && err == ErrorCode::ExternalTransferFailed) {
                    failed_graduations_.fetch_add(1, std::memory_order_relaxed);
                }
                return Result<Amount>::failure(err);
            }
        }

        // Committed: vault legs are written, the rest cannot fail
        book.mint(ctx.caller, tokens_out);
        if (plan) {
            graduation::finalize(staged, *plan, pool_ref, timestamp);
        }
        live = staged;

        event = TradeEvent{token, ctx.caller, true, base_in, tokens_out, split.fee,
                           split.referrer_cut, split.referrer, curve::price(staged), timestamp};
        if (plan) {
            graduated = staged;
        }
    }

    buys_.fetch_add(1, std::memory_order_relaxed);
    record_trade(event);
    if (log::enabled(log::Level::Debug)) {
        log::debug("buy token=" + std::to_string(token) + " trader=" + to_hex(ctx.caller) +
                   " in=" + to_string(base_in) + " out=" + to_string(event.token_amount));
    }

    if (plan) {
        tokens_graduated_.fetch_add(1, std::memory_order_relaxed);
        log::info("token " + std::to_string(token) + " graduated: pool_ref=" +
                  std::to_string(graduated.pool_ref) + " liquidity_base=" +
                  to_string(plan->liquidity_base) + " liquidity_tokens=" +
                  to_string(plan->liquidity_tokens));
    }

    if (listener_) {
        listener_->on_trade(event);
        if (plan) {
            listener_->on_graduated(graduated, *plan);
        }
    }
    return Result<Amount>::success(event.token_amount);
}

Result<Amount> Launchpad::sell(const CallContext& ctx, TokenId token, Amount tokens_in,
                               Amount min_base_out, const std::optional<Address>& referrer) {
    return sell_impl(ctx, token, ctx.caller, tokens_in, min_base_out, referrer);
}

Result<Amount> Launchpad::sell_from(const CallContext& ctx, TokenId token, const Address& owner,
                                    Amount tokens_in, Amount min_base_out,
                                    const std::optional<Address>& referrer) {
    return sell_impl(ctx, token, owner, tokens_in, min_base_out, referrer);
}

Result<Amount> Launchpad::sell_impl(const CallContext& ctx, TokenId token, const Address& owner,
                                    Amount tokens_in, Amount min_base_out,
                                    const std::optional<Address>& referrer) {
    TradeEvent event{};

    {
        auto slot = registry_.lock(token);
        if (!slot.valid()) {
            return Result<Amount>::failure(ErrorCode::InvalidToken);
        }
        TokenRecord& live = slot.record();
        if (!live.is_active()) {
            return Result<Amount>::failure(ErrorCode::AlreadyGraduated);
        }
        if (admin_.paused()) {
            return Result<Amount>::failure(ErrorCode::Paused);
        }
        if (tokens_in == 0) {
            return Result<Amount>::failure(ErrorCode::ZeroAmount);
        }

        auto book = ledger_.lock(token);
        if (!book.valid()) {
            return Result<Amount>::failure(ErrorCode::InvalidToken);
        }
        ErrorCode err = book.can_spend(ctx.caller, owner, tokens_in);
        if (err != ErrorCode::Ok) {
            return Result<Amount>::failure(err);
        }

        auto quote = curve::quote_sell(live, tokens_in);
        if (!quote) {
            return Result<Amount>::failure(quote.error);
        }

        FeeSchedule schedule = admin_.schedule();
        uint32_t fee_bps = admin_.is_fee_exempt(owner) ? 0 : schedule.sell_fee_bps;
        FeeSplit split = fees::split(quote.value, fee_bps, schedule.referral_share_bps,
                                     referrer, owner);
        if (split.net < min_base_out) {
            return Result<Amount>::failure(ErrorCode::SlippageExceeded);
        }

        TokenRecord staged = live;
        curve::apply_sell(staged, tokens_in, quote.value);

        std::vector<Transfer> legs;
        legs.push_back(Transfer{addresses::CURVE_ESCROW, ctx.caller, split.net});
        for (auto& leg : fees::payouts(split, addresses::CURVE_ESCROW, schedule.treasury)) {
            legs.push_back(leg);
        }

        err = vault_.apply(legs, [&]() -> ErrorCode {
            ErrorCode burned = book.burn(owner, tokens_in);
            if (burned == ErrorCode::Ok) {
                book.consume_allowance(owner, ctx.caller, tokens_in);
            }
            return burned;
        });
        if (err != ErrorCode::Ok) {
            return Result<Amount>::failure(err);
        }
        live = staged;

        event = TradeEvent{token, owner, false, quote.value, tokens_in, split.fee,
                           split.referrer_cut, split.referrer, curve::price(staged), now()};
    }

    sells_.fetch_add(1, std::memory_order_relaxed);
    record_trade(event);
    if (log::enabled(log::Level::Debug)) {
        log::debug("sell token=" + std::to_string(token) + " trader=" + to_hex(owner) +
                   " in=" + to_string(tokens_in) + " out=" +
                   to_string(event.base_amount - event.fee));
    }

    if (listener_) {
        listener_->on_trade(event);
    }
    return Result<Amount>::success(event.base_amount - event.fee);
}

Result<Amount> Launchpad::burn(const CallContext& ctx, TokenId token, Amount tokens_in) {
    return burn_impl(ctx, token, ctx.caller, tokens_in);
}

Result<Amount> Launchpad::burn_from(const CallContext& ctx, TokenId token, const Address& owner,
                                    Amount tokens_in) {
    return burn_impl(ctx, token, owner, tokens_in);
}

Result<Amount> Launchpad::burn_impl(const CallContext& ctx, TokenId token, const Address& owner,
                                    Amount tokens_in) {
    BurnEvent event{};

    {
        auto slot = registry_.lock(token);
        if (!slot.valid()) {
            return Result<Amount>::failure(ErrorCode::InvalidToken);
        }
        TokenRecord& live = slot.record();
        if (!live.is_active()) {
            return Result<Amount>::failure(ErrorCode::AlreadyGraduated);
        }
        if (admin_.paused()) {
            return Result<Amount>::failure(ErrorCode::Paused);
        }
        if (tokens_in == 0) {
            return Result<Amount>::failure(ErrorCode::ZeroAmount);
        }

        auto book = ledger_.lock(token);
        if (!book.valid()) {
            return Result<Amount>::failure(ErrorCode::InvalidToken);
        }
        ErrorCode err = book.can_spend(ctx.caller, owner, tokens_in);
        if (err != ErrorCode::Ok) {
            return Result<Amount>::failure(err);
        }

        auto quote = curve::quote_burn(live, tokens_in);
        if (!quote) {
            return Result<Amount>::failure(quote.error);
        }

        TokenRecord staged = live;
        curve::apply_burn(staged, tokens_in, quote.value);

        std::vector<Transfer> legs;
        if (quote.value > 0) {
            legs.push_back(Transfer{addresses::CURVE_ESCROW, ctx.caller, quote.value});
        }

        err = vault_.apply(legs, [&]() -> ErrorCode {
            ErrorCode burned = book.burn(owner, tokens_in);
            if (burned == ErrorCode::Ok) {
                book.consume_allowance(owner, ctx.caller, tokens_in);
            }
            return burned;
        });
        if (err != ErrorCode::Ok) {
            return Result<Amount>::failure(err);
        }
        live = staged;

        event = BurnEvent{token, owner, tokens_in, quote.value, now()};
    }

    burns_.fetch_add(1, std::memory_order_relaxed);
    if (log::enabled(log::Level::Debug)) {
        log::debug("burn token=" + std::to_string(token) + " holder=" + to_hex(owner) +
                   " tokens=" + to_string(tokens_in) + " out=" + to_string(event.base_out));
    }

    if (listener_) {
        listener_->on_burn(event);
    }
    return Result<Amount>::success(event.base_out);
}

// =============================================================================
// Quotes & Reads
// =============================================================================

Result<Amount> Launchpad::quote_buy(TokenId token, Amount base_in) const {
    auto record = registry_.get(token);
    if (!record) {
        return Result<Amount>::failure(ErrorCode::InvalidToken);
    }
    if (!record->is_active()) {
        return Result<Amount>::failure(ErrorCode::AlreadyGraduated);
    }
    if (base_in == 0) {
        return Result<Amount>::failure(ErrorCode::ZeroAmount);
    }

    Amount fee = math::apply_bps(base_in, admin_.schedule().buy_fee_bps);
    return curve::quote_buy(*record, base_in - fee);
}

Result<Amount> Launchpad::quote_sell(TokenId token, Amount tokens_in) const {
    auto record = registry_.get(token);
    if (!record) {
        return Result<Amount>::failure(ErrorCode::InvalidToken);
    }
    if (!record->is_active()) {
        return Result<Amount>::failure(ErrorCode::AlreadyGraduated);
    }

    auto gross = curve::quote_sell(*record, tokens_in);
    if (!gross) {
        return gross;
    }
    Amount fee = math::apply_bps(gross.value, admin_.schedule().sell_fee_bps);
    return Result<Amount>::success(gross.value - fee);
}

Result<Amount> Launchpad::price(TokenId token) const {
    auto record = registry_.get(token);
    if (!record) {
        return Result<Amount>::failure(ErrorCode::InvalidToken);
    }
    return Result<Amount>::success(curve::price(*record));
}

Result<curve::Progress> Launchpad::progress(TokenId token) const {
    auto record = registry_.get(token);
    if (!record) {
        return Result<curve::Progress>::failure(ErrorCode::InvalidToken);
    }
    return Result<curve::Progress>::success(curve::progress(*record));
}

std::optional<TokenRecord> Launchpad::token(TokenId token) const {
    return registry_.get(token);
}

// =============================================================================
// Ledger Passthrough
// =============================================================================

ErrorCode Launchpad::transfer(const CallContext& ctx, TokenId token, const Address& to,
                              Amount amount) {
    return ledger_.transfer(ctx, token, to, amount);
}

ErrorCode Launchpad::approve(const CallContext& ctx, TokenId token, const Address& spender,
                             Amount amount) {
    return ledger_.approve(ctx, token, spender, amount);
}

ErrorCode Launchpad::transfer_from(const CallContext& ctx, TokenId token, const Address& from,
                                   const Address& to, Amount amount) {
    return ledger_.transfer_from(ctx, token, from, to, amount);
}

Amount Launchpad::balance_of(TokenId token, const Address& owner) const {
    return ledger_.balance_of(token, owner);
}

Amount Launchpad::allowance(TokenId token, const Address& owner, const Address& spender) const {
    return ledger_.allowance(token, owner, spender);
}

uint64_t Launchpad::holder_count(TokenId token) const {
    return ledger_.holder_count(token);
}

// =============================================================================
// Statistics
// =============================================================================

Launchpad::Stats Launchpad::get_stats() const {
    Stats stats{};
    stats.tokens_created = tokens_created_.load(std::memory_order_relaxed);
    stats.tokens_graduated = tokens_graduated_.load(std::memory_order_relaxed);
    stats.buys = buys_.load(std::memory_order_relaxed);
    stats.sells = sells_.load(std::memory_order_relaxed);
    stats.burns = burns_.load(std::memory_order_relaxed);
    stats.failed_graduations = failed_graduations_.load(std::memory_order_relaxed);

    for (const auto& record : registry_.list(0, registry_.count())) {
        stats.total_volume += record.trade_volume;
    }
    return stats;
}

UserStats Launchpad::user_stats(const Address& user) const {
    std::lock_guard<std::mutex> lock(user_stats_mutex_);
    auto it = user_stats_.find(user);
    return it == user_stats_.end() ? UserStats{} : it->second;
}

void Launchpad::record_trade(const TradeEvent& trade) {
    std::lock_guard<std::mutex> lock(user_stats_mutex_);
    UserStats& trader = user_stats_[trade.trader];
    trader.total_volume += trade.base_amount;
    if (trade.is_buy) {
        trader.total_buy_value += trade.base_amount;
        trader.buy_count++;
    } else {
        trader.total_sell_value += trade.base_amount;
        trader.sell_count++;
    }
    trader.trade_count++;
    trader.last_trade_time = trade.timestamp;

    if (trade.referrer && trade.referrer_cut > 0) {
        UserStats& referrer = user_stats_[*trade.referrer];
        referrer.referral_count++;
        referrer.referral_volume += trade.base_amount;
        referrer.referral_earnings += trade.referrer_cut;
    }
}

} // namespace pump
