// pump-engine - Launchpad Operation Tests

#include <catch2/catch.hpp>

#include "test_helpers.hpp"

#include <vector>

using namespace pump;
using namespace pump::testing;

namespace {

class CountingListener : public LaunchListener {
public:
    void on_token_created(const TokenRecord& token) override { created.push_back(token.id); }
    void on_trade(const TradeEvent& trade) override { trades.push_back(trade); }
    void on_burn(const BurnEvent& burn) override { burns.push_back(burn); }
    void on_graduated(const TokenRecord& token, const GraduationPlan&) override {
        graduated.push_back(token.id);
    }

    std::vector<TokenId> created;
    std::vector<TradeEvent> trades;
    std::vector<BurnEvent> burns;
    std::vector<TokenId> graduated;
};

} // namespace

TEST_CASE("Token creation", "[launchpad]") {
    LaunchFixture f;
    Address dave = addresses::from_index(300);

    REQUIRE(f.token == 1);
    REQUIRE(f.vault_balance(f.treasury) == 1000);

    TokenRecord t = f.record();
    REQUIRE(t.creator == f.creator);
    REQUIRE(t.symbol == "TEST");
    REQUIRE(t.virtual_base_reserve == 12500000);
    REQUIRE(t.virtual_token_reserve == 250000000);
    REQUIRE(t.graduation_threshold == 50000000);
    REQUIRE(t.created_at == FIXED_NOW);
    REQUIRE(t.status == TokenStatus::Active);
    REQUIRE(f.launchpad.ledger().has(f.token));

    SECTION("Attached value below the creation fee") {
        f.fund(dave, 5000);
        auto r = f.launchpad.create_token(CallContext{dave, 999}, "D", "D", "", "");
        REQUIRE(r.error == ErrorCode::InsufficientPayment);
        REQUIRE(f.vault_balance(dave) == 5000);
        REQUIRE(f.launchpad.registry().count() == 1);
    }

    SECTION("Declared value without the funds") {
        auto r = f.launchpad.create_token(CallContext{dave, 1000}, "D", "D", "", "");
        REQUIRE(r.error == ErrorCode::InsufficientPayment);
        REQUIRE(f.launchpad.registry().count() == 1);
    }

    SECTION("Overpaying charges exactly the fee") {
        f.fund(dave, 5000);
        auto r = f.launchpad.create_token(CallContext{dave, 5000}, "D", "D", "", "");
        REQUIRE(r.ok());
        REQUIRE(r.value == 2);
        REQUIRE(f.vault_balance(dave) == 4000);
        REQUIRE(f.vault_balance(f.treasury) == 2000);
        REQUIRE(f.launchpad.registry().by_creator(dave) == std::vector<TokenId>{2});
    }

    SECTION("Missing name or symbol") {
        f.fund(dave, 5000);
        REQUIRE(f.launchpad.create_token(CallContext{dave, 1000}, "", "D", "", "").error ==
                ErrorCode::InvalidParameter);
        REQUIRE(f.launchpad.create_token(CallContext{dave, 1000}, "D", "", "", "").error ==
                ErrorCode::InvalidParameter);
    }

    SECTION("Paused launchpad") {
        f.fund(dave, 5000);
        REQUIRE(f.launchpad.set_paused(CallContext{f.owner}, true) == ErrorCode::Ok);
        REQUIRE(f.launchpad.create_token(CallContext{dave, 1000}, "D", "D", "", "").error ==
                ErrorCode::Paused);
    }

    SECTION("Treasury refusing the fee") {
        f.fund(dave, 5000);
        f.launchpad.vault().set_reject_receipts(f.treasury, true);
        REQUIRE(f.launchpad.create_token(CallContext{dave, 1000}, "D", "D", "", "").error ==
                ErrorCode::ExternalTransferFailed);
        REQUIRE(f.vault_balance(dave) == 5000);
    }
}

TEST_CASE("Scenario A: first buy", "[launchpad]") {
    LaunchFixture f;
    f.fund(f.alice, 10000000);
    Amount price_before = f.launchpad.price(f.token).value;

    auto quote = f.launchpad.quote_buy(f.token, 10000000);
    REQUIRE(quote.ok());

    auto r = f.launchpad.buy(CallContext{f.alice}, f.token, 10000000, 0);
    REQUIRE(r.ok());
    REQUIRE(r.value == Amount(250000000) - Amount(12500000) * 250000000 / (12500000 + 9900000));
    REQUIRE(r.value == quote.value);
    REQUIRE(f.launchpad.price(f.token).value > price_before);

    TokenRecord t = f.record();
    REQUIRE(t.real_reserve == 9900000);
    REQUIRE(t.tokens_sold == r.value);
    REQUIRE(t.trade_volume == 10000000);
    REQUIRE(t.trade_count == 1);

    REQUIRE(f.launchpad.balance_of(f.token, f.alice) == r.value);
    REQUIRE(f.vault_balance(f.alice) == 0);
    REQUIRE(f.vault_balance(addresses::CURVE_ESCROW) == 9900000);
    REQUIRE(f.vault_balance(f.treasury) == 1000 + 100000);

    auto progress = f.launchpad.progress(f.token);
    REQUIRE(progress.ok());
    REQUIRE(progress.value.raised == 9900000);
    REQUIRE(progress.value.target == 50000000);
    REQUIRE(progress.value.progress_bps == 1980);
}

TEST_CASE("Referral payouts", "[launchpad]") {
    LaunchFixture f;
    f.fund(f.alice, 10000000);

    SECTION("Scenario C: self-referral pays treasury the whole fee") {
        auto r = f.launchpad.buy(CallContext{f.alice}, f.token, 10000000, 0, f.alice);
        REQUIRE(r.ok());
        REQUIRE(f.vault_balance(f.treasury) == 1000 + 100000);
        REQUIRE(f.vault_balance(f.alice) == 0);
    }

    SECTION("Distinct referrer splits the fee") {
        auto r = f.launchpad.buy(CallContext{f.alice}, f.token, 10000000, 0, f.carol);
        REQUIRE(r.ok());
        REQUIRE(f.vault_balance(f.treasury) == 1000 + 50000);
        REQUIRE(f.vault_balance(f.carol) == 50000);
    }

    SECTION("Referrer refusing payment aborts the whole trade") {
        f.launchpad.vault().set_reject_receipts(f.carol, true);
        auto r = f.launchpad.buy(CallContext{f.alice}, f.token, 10000000, 0, f.carol);
        REQUIRE(r.error == ErrorCode::ExternalTransferFailed);
        REQUIRE(f.vault_balance(f.alice) == 10000000);
        REQUIRE(f.vault_balance(f.treasury) == 1000);
        REQUIRE(f.record().real_reserve == 0);
        REQUIRE(f.launchpad.balance_of(f.token, f.alice) == 0);
    }

    SECTION("Sell referrals are paid from the curve output") {
        auto bought = f.launchpad.buy(CallContext{f.alice}, f.token, 10000000, 0);
        REQUIRE(bought.ok());
        Amount treasury_before = f.vault_balance(f.treasury);

        auto sold = f.launchpad.sell(CallContext{f.alice}, f.token, bought.value, 0, f.carol);
        REQUIRE(sold.ok());
        REQUIRE(sold.value == 9801000);
        REQUIRE(f.vault_balance(f.carol) == 49500);
        REQUIRE(f.vault_balance(f.treasury) - treasury_before == 49500);
    }
}

TEST_CASE("Buy validation order", "[launchpad]") {
    LaunchFixture f;
    f.fund(f.alice, 1000);

    REQUIRE(f.launchpad.buy(CallContext{f.alice}, 99, 1000, 0).error == ErrorCode::InvalidToken);

    REQUIRE(f.launchpad.set_paused(CallContext{f.owner}, true) == ErrorCode::Ok);
    REQUIRE(f.launchpad.buy(CallContext{f.alice}, 99, 0, 0).error == ErrorCode::InvalidToken);
    REQUIRE(f.launchpad.buy(CallContext{f.alice}, f.token, 0, 0).error == ErrorCode::Paused);
    REQUIRE(f.launchpad.set_paused(CallContext{f.owner}, false) == ErrorCode::Ok);

    REQUIRE(f.launchpad.buy(CallContext{f.alice}, f.token, 0, 0).error == ErrorCode::ZeroAmount);
    REQUIRE(f.launchpad.buy(CallContext{f.alice}, f.token, 5000, 0).error ==
            ErrorCode::InsufficientPayment);
    REQUIRE(f.launchpad.buy(CallContext{f.alice}, f.token, 1000, AMOUNT_MAX).error ==
            ErrorCode::SlippageExceeded);

    REQUIRE(f.vault_balance(f.alice) == 1000);
    REQUIRE(f.record().trade_count == 0);

    SECTION("Exceeding the bonding supply") {
        f.fund(f.bob, from_whole(1));
        REQUIRE(f.launchpad.buy(CallContext{f.bob}, f.token, from_whole(1), 0).error ==
                ErrorCode::InsufficientLiquidity);
    }
}

TEST_CASE("Selling", "[launchpad]") {
    LaunchFixture f;
    f.fund(f.alice, 10000000);
    Amount held = f.launchpad.buy(CallContext{f.alice}, f.token, 10000000, 0).value;

    SECTION("Scenario D: minimum one unit above the quote") {
        auto quote = f.launchpad.quote_sell(f.token, held);
        REQUIRE(quote.ok());
        TokenRecord before = f.record();

        auto r = f.launchpad.sell(CallContext{f.alice}, f.token, held, quote.value + 1);
        REQUIRE(r.error == ErrorCode::SlippageExceeded);

        TokenRecord after = f.record();
        REQUIRE(after.real_reserve == before.real_reserve);
        REQUIRE(after.tokens_sold == before.tokens_sold);
        REQUIRE(f.launchpad.balance_of(f.token, f.alice) == held);

        auto exact = f.launchpad.sell(CallContext{f.alice}, f.token, held, quote.value);
        REQUIRE(exact.ok());
        REQUIRE(exact.value == quote.value);
    }

    SECTION("Full exit") {
        Amount price_before = f.launchpad.price(f.token).value;
        auto r = f.launchpad.sell(CallContext{f.alice}, f.token, held, 0);
        REQUIRE(r.ok());
        REQUIRE(r.value == 9801000);
        REQUIRE(f.launchpad.price(f.token).value < price_before);
        REQUIRE(f.vault_balance(f.alice) == 9801000);
        REQUIRE(f.launchpad.balance_of(f.token, f.alice) == 0);
        REQUIRE(f.record().tokens_sold == 0);
        REQUIRE(f.record().real_reserve == 0);
        REQUIRE(f.vault_balance(addresses::CURVE_ESCROW) == 0);
    }

    SECTION("More than held") {
        REQUIRE(f.launchpad.sell(CallContext{f.alice}, f.token, held + 1, 0).error ==
                ErrorCode::InsufficientBalance);
        REQUIRE(f.launchpad.sell(CallContext{f.bob}, f.token, 1, 0).error ==
                ErrorCode::InsufficientBalance);
    }

    SECTION("Zero tokens") {
        REQUIRE(f.launchpad.sell(CallContext{f.alice}, f.token, 0, 0).error ==
                ErrorCode::ZeroAmount);
    }

    SECTION("Selling on behalf of an owner needs an allowance") {
        REQUIRE(f.launchpad.sell_from(CallContext{f.bob}, f.token, f.alice, 1000, 0).error ==
                ErrorCode::AllowanceExceeded);

        REQUIRE(f.launchpad.approve(CallContext{f.alice}, f.token, f.bob, 5000) == ErrorCode::Ok);
        auto r = f.launchpad.sell_from(CallContext{f.bob}, f.token, f.alice, 1000, 0);
        REQUIRE(r.ok());
        REQUIRE(f.vault_balance(f.bob) == r.value);
        REQUIRE(f.launchpad.balance_of(f.token, f.alice) == held - 1000);
        REQUIRE(f.launchpad.allowance(f.token, f.alice, f.bob) == 4000);
    }

    SECTION("Fee-exempt seller keeps the gross output") {
        REQUIRE(f.launchpad.admin().set_fee_exempt(CallContext{f.owner}, f.alice, true) ==
                ErrorCode::Ok);
        auto r = f.launchpad.sell(CallContext{f.alice}, f.token, held, 0);
        REQUIRE(r.ok());
        REQUIRE(r.value == 9900000);
    }

    SECTION("Paused launchpad rejects sells") {
        REQUIRE(f.launchpad.set_paused(CallContext{f.owner}, true) == ErrorCode::Ok);
        REQUIRE(f.launchpad.sell(CallContext{f.alice}, f.token, held, 0).error ==
                ErrorCode::Paused);
    }
}

TEST_CASE("Burning", "[launchpad]") {
    LaunchFixture f;
    f.fund(f.alice, 10000000);
    Amount held = f.launchpad.buy(CallContext{f.alice}, f.token, 10000000, 0).value;
    TokenRecord before = f.record();

    Amount half = held / 2;
    auto r = f.launchpad.burn(CallContext{f.alice}, f.token, half);
    REQUIRE(r.ok());
    REQUIRE(r.value == half * before.real_reserve / before.tokens_sold);

    TokenRecord after = f.record();
    REQUIRE(after.total_burned == half);
    REQUIRE(after.tokens_sold == before.tokens_sold);
    REQUIRE(after.real_reserve == before.real_reserve - r.value);
    REQUIRE(f.vault_balance(f.alice) == r.value);
    REQUIRE(f.vault_balance(addresses::CURVE_ESCROW) == after.real_reserve);
    REQUIRE(f.ledger_sum() == after.tokens_sold - after.total_burned);

    SECTION("Burning more than held") {
        REQUIRE(f.launchpad.burn(CallContext{f.alice}, f.token, held).error ==
                ErrorCode::InsufficientBalance);
    }

    SECTION("Burning on behalf of an owner") {
        REQUIRE(f.launchpad.burn_from(CallContext{f.bob}, f.token, f.alice, 10).error ==
                ErrorCode::AllowanceExceeded);
        REQUIRE(f.launchpad.approve(CallContext{f.alice}, f.token, f.bob, 10) == ErrorCode::Ok);
        REQUIRE(f.launchpad.burn_from(CallContext{f.bob}, f.token, f.alice, 10).ok());
        REQUIRE(f.launchpad.allowance(f.token, f.alice, f.bob) == 0);
    }
}

TEST_CASE("Supply stays conserved over mixed activity", "[launchpad]") {
    LaunchFixture f;
    const Address traders[] = {f.alice, f.bob, f.carol};
    const Amount buys[] = {1234567, 3000000, 777, 4500000, 250000};

    for (int round = 0; round < 4; ++round) {
        for (size_t i = 0; i < 3; ++i) {
            const Address& who = traders[i];
            Amount amount = buys[(round + i) % 5];
            f.fund(who, amount);
            REQUIRE(f.launchpad.buy(CallContext{who}, f.token, amount, 0).ok());

            Amount held = f.launchpad.balance_of(f.token, who);
            if (round % 2 == 1) {
                REQUIRE(f.launchpad.sell(CallContext{who}, f.token, held / 3, 0).ok());
            } else if (held > 10) {
                REQUIRE(f.launchpad.burn(CallContext{who}, f.token, held / 10).ok());
            }
            if (i == 0) {
                REQUIRE(f.launchpad.transfer(CallContext{who}, f.token, f.bob, 5) == ErrorCode::Ok);
            }

            TokenRecord t = f.record();
            REQUIRE(f.ledger_sum() == t.tokens_sold - t.total_burned);
            REQUIRE(f.vault_balance(addresses::CURVE_ESCROW) == t.real_reserve);
        }
    }
}

TEST_CASE("Listener and statistics", "[launchpad]") {
    LaunchFixture f;
    CountingListener listener;
    f.launchpad.set_listener(&listener);

    f.fund(f.alice, 70000000);
    Amount held = f.launchpad.buy(CallContext{f.alice}, f.token, 10000000, 0).value;
    REQUIRE(f.launchpad.sell(CallContext{f.alice}, f.token, held / 2, 0).ok());
    REQUIRE(f.launchpad.burn(CallContext{f.alice}, f.token, 1000).ok());
    REQUIRE(f.launchpad.buy(CallContext{f.alice}, f.token, 60000000, 0).ok());

    REQUIRE(listener.trades.size() == 3);
    REQUIRE(listener.trades[0].is_buy);
    REQUIRE(listener.trades[0].fee == 100000);
    REQUIRE_FALSE(listener.trades[1].is_buy);
    REQUIRE(listener.burns.size() == 1);
    REQUIRE(listener.burns[0].token_amount == 1000);
    REQUIRE(listener.graduated == std::vector<TokenId>{f.token});

    auto stats = f.launchpad.get_stats();
    REQUIRE(stats.tokens_created == 1);
    REQUIRE(stats.tokens_graduated == 1);
    REQUIRE(stats.buys == 2);
    REQUIRE(stats.sells == 1);
    REQUIRE(stats.burns == 1);
    REQUIRE(stats.total_volume == f.record().trade_volume);

    f.launchpad.set_listener(nullptr);
}

TEST_CASE("Per-address trading statistics", "[launchpad]") {
    LaunchFixture f;
    f.fund(f.alice, 10000000 + 1000);

    Amount bought = f.launchpad.buy(CallContext{f.alice}, f.token, 10000000, 0, f.carol).value;
    REQUIRE(f.launchpad.sell(CallContext{f.alice}, f.token, bought, 0, f.carol).ok());
    REQUIRE(f.launchpad.burn(CallContext{f.alice}, f.token, 0).error == ErrorCode::ZeroAmount);

    // Self-referral earns nothing; a failed trade is not counted
    Amount small = f.launchpad.buy(CallContext{f.alice}, f.token, 1000, 0, f.alice).value;
    REQUIRE(f.launchpad.buy(CallContext{f.alice}, f.token, 1000, AMOUNT_MAX).error ==
            ErrorCode::SlippageExceeded);
    REQUIRE(f.launchpad.burn(CallContext{f.alice}, f.token, small).ok());

    UserStats alice = f.launchpad.user_stats(f.alice);
    REQUIRE(alice.trade_count == 3);
    REQUIRE(alice.buy_count == 2);
    REQUIRE(alice.sell_count == 1);
    REQUIRE(alice.total_buy_value == 10001000);
    REQUIRE(alice.total_sell_value == 9900000);
    REQUIRE(alice.total_volume == alice.total_buy_value + alice.total_sell_value);
    REQUIRE(alice.last_trade_time == FIXED_NOW);
    REQUIRE(alice.referral_count == 0);
    REQUIRE(alice.referral_earnings == 0);

    UserStats carol = f.launchpad.user_stats(f.carol);
    REQUIRE(carol.trade_count == 0);
    REQUIRE(carol.referral_count == 2);
    REQUIRE(carol.referral_volume == 19900000);
    REQUIRE(carol.referral_earnings == 50000 + 49500);
    REQUIRE(carol.referral_earnings == f.vault_balance(f.carol));

    UserStats nobody = f.launchpad.user_stats(f.bob);
    REQUIRE(nobody.trade_count == 0);
    REQUIRE(nobody.total_volume == 0);
    REQUIRE(nobody.last_trade_time == 0);
}

TEST_CASE("Reads on unknown tokens", "[launchpad]") {
    LaunchFixture f;
    REQUIRE(f.launchpad.price(42).error == ErrorCode::InvalidToken);
    REQUIRE(f.launchpad.progress(42).error == ErrorCode::InvalidToken);
    REQUIRE(f.launchpad.quote_buy(42, 1).error == ErrorCode::InvalidToken);
    REQUIRE(f.launchpad.quote_sell(42, 1).error == ErrorCode::InvalidToken);
    REQUIRE_FALSE(f.launchpad.token(42).has_value());
    REQUIRE(f.launchpad.sell(CallContext{f.alice}, 42, 1, 0).error == ErrorCode::InvalidToken);
    REQUIRE(f.launchpad.burn(CallContext{f.alice}, 42, 1).error == ErrorCode::InvalidToken);
    REQUIRE(f.launchpad.holder_count(42) == 0);
}
