// pump-engine - Base Vault Tests

#include <catch2/catch.hpp>

#include "test_helpers.hpp"
#include "pump/vault.hpp"

using namespace pump;

namespace {
const Address A = addresses::from_index(1);
const Address B = addresses::from_index(2);
const Address C = addresses::from_index(3);
} // namespace

TEST_CASE("Deposit and withdraw", "[vault]") {
    BaseVault vault;

    REQUIRE(vault.deposit(A, 1000) == ErrorCode::Ok);
    REQUIRE(vault.balance(A) == 1000);
    REQUIRE(vault.deposit(A, 0) == ErrorCode::ZeroAmount);

    REQUIRE(vault.withdraw(A, 400) == ErrorCode::Ok);
    REQUIRE(vault.balance(A) == 600);
    REQUIRE(vault.withdraw(A, 601) == ErrorCode::InsufficientBalance);
    REQUIRE(vault.withdraw(B, 1) == ErrorCode::InsufficientBalance);
    REQUIRE(vault.balance(A) == 600);
}

TEST_CASE("Single transfer", "[vault]") {
    BaseVault vault;
    REQUIRE(vault.deposit(A, 1000) == ErrorCode::Ok);

    REQUIRE(vault.transfer(A, B, 300) == ErrorCode::Ok);
    REQUIRE(vault.balance(A) == 700);
    REQUIRE(vault.balance(B) == 300);

    REQUIRE(vault.transfer(A, B, 701) == ErrorCode::InsufficientPayment);
    REQUIRE(vault.total_balance() == 1000);
}

TEST_CASE("Batches are all-or-nothing", "[vault]") {
    BaseVault vault;
    REQUIRE(vault.deposit(A, 1000) == ErrorCode::Ok);

    SECTION("Legs may spend funds received earlier in the batch") {
        REQUIRE(vault.apply({{A, B, 600}, {B, C, 500}}) == ErrorCode::Ok);
        REQUIRE(vault.balance(A) == 400);
        REQUIRE(vault.balance(B) == 100);
        REQUIRE(vault.balance(C) == 500);
    }

    SECTION("A failing leg leaves every balance untouched") {
        REQUIRE(vault.apply({{A, B, 600}, {A, C, 500}}) == ErrorCode::InsufficientPayment);
        REQUIRE(vault.balance(A) == 1000);
        REQUIRE(vault.balance(B) == 0);
        REQUIRE(vault.balance(C) == 0);
    }

    SECTION("A payee rejecting receipts aborts the batch") {
        vault.set_reject_receipts(C, true);
        REQUIRE(vault.rejects_receipts(C));
        REQUIRE(vault.apply({{A, B, 100}, {A, C, 100}}) == ErrorCode::ExternalTransferFailed);
        REQUIRE(vault.balance(A) == 1000);
        REQUIRE(vault.balance(B) == 0);

        vault.set_reject_receipts(C, false);
        REQUIRE(vault.apply({{A, C, 100}}) == ErrorCode::Ok);
    }

    SECTION("Pre-commit failure aborts after validation") {
        bool called = false;
        ErrorCode err = vault.apply({{A, B, 100}}, [&] {
            called = true;
            return ErrorCode::ExternalTransferFailed;
        });
        REQUIRE(called);
        REQUIRE(err == ErrorCode::ExternalTransferFailed);
        REQUIRE(vault.balance(A) == 1000);
    }

    SECTION("Pre-commit is skipped when a leg is invalid") {
        bool called = false;
        ErrorCode err = vault.apply({{A, B, 5000}}, [&] {
            called = true;
            return ErrorCode::Ok;
        });
        REQUIRE(err == ErrorCode::InsufficientPayment);
        REQUIRE_FALSE(called);
    }

    SECTION("Zero legs are ignored") {
        REQUIRE(vault.apply({{B, C, 0}}) == ErrorCode::Ok);
    }

    auto stats = vault.get_stats();
    REQUIRE(stats.batches_applied + stats.batches_rejected >= 1);
}

TEST_CASE("Account enumeration", "[vault]") {
    BaseVault vault;
    REQUIRE(vault.deposit(A, 10) == ErrorCode::Ok);
    REQUIRE(vault.deposit(B, 20) == ErrorCode::Ok);
    REQUIRE(vault.transfer(A, C, 10) == ErrorCode::Ok);

    auto accounts = vault.accounts();
    REQUIRE(accounts.size() == 2);  // A is empty now
    REQUIRE(vault.total_balance() == 30);
}

TEST_CASE("Held batches", "[vault]") {
    const Address D = addresses::from_index(4);
    BaseVault vault;
    REQUIRE(vault.deposit(A, 1000) == ErrorCode::Ok);

    // A pays B up front; C and D are paid only on settle
    auto held = vault.hold({{A, B, 500}}, {{A, C, 100}, {B, D, 200}});
    REQUIRE(held.ok());
    REQUIRE(vault.open_holds() == 1);
    REQUIRE(vault.balance(A) == 400);
    REQUIRE(vault.balance(B) == 300);
    REQUIRE(vault.balance(C) == 0);
    REQUIRE(vault.balance(D) == 0);
    REQUIRE(vault.total_balance() == 1000);

    SECTION("Settle credits the deferred payees") {
        vault.set_reject_receipts(D, true);
        REQUIRE(vault.settle(held.value) == ErrorCode::Ok);
        REQUIRE(vault.balance(C) == 100);
        REQUIRE(vault.balance(D) == 200);
        REQUIRE(vault.open_holds() == 0);
        REQUIRE(vault.total_balance() == 1000);
        REQUIRE(vault.settle(held.value) == ErrorCode::InvalidParameter);
        REQUIRE(vault.get_stats().holds_settled == 1);
    }

    SECTION("Release restores every balance") {
        REQUIRE(vault.release(held.value) == ErrorCode::Ok);
        REQUIRE(vault.balance(A) == 1000);
        REQUIRE(vault.balance(B) == 0);
        REQUIRE(vault.balance(C) == 0);
        REQUIRE(vault.open_holds() == 0);
        REQUIRE(vault.total_balance() == 1000);
        REQUIRE(vault.get_stats().holds_released == 1);
    }

    SECTION("Release waits while the immediate payee is short") {
        REQUIRE(vault.withdraw(B, 300) == ErrorCode::Ok);
        REQUIRE(vault.release(held.value) == ErrorCode::InsufficientBalance);
        REQUIRE(vault.open_holds() == 1);
        REQUIRE(vault.balance(A) == 400);

        REQUIRE(vault.deposit(B, 300) == ErrorCode::Ok);
        REQUIRE(vault.release(held.value) == ErrorCode::Ok);
        REQUIRE(vault.balance(A) == 1000);
    }
}

TEST_CASE("Held batches validate every leg up front", "[vault]") {
    BaseVault vault;
    REQUIRE(vault.deposit(A, 1000) == ErrorCode::Ok);

    SECTION("Short deferred payer") {
        auto held = vault.hold({{A, B, 500}}, {{A, C, 600}});
        REQUIRE(held.error == ErrorCode::InsufficientPayment);
    }

    SECTION("Rejecting deferred payee") {
        vault.set_reject_receipts(C, true);
        auto held = vault.hold({{A, B, 500}}, {{A, C, 100}});
        REQUIRE(held.error == ErrorCode::ExternalTransferFailed);
    }

    REQUIRE(vault.balance(A) == 1000);
    REQUIRE(vault.balance(B) == 0);
    REQUIRE(vault.open_holds() == 0);
    REQUIRE(vault.total_balance() == 1000);
}
