#ifndef PUMP_LEDGER_HPP
#define PUMP_LEDGER_HPP

#include <memory>
#include <mutex>
#include <shared_mutex>
#include <unordered_map>
#include <utility>
#include <vector>

#include "types.hpp"

namespace pump {

class Launchpad;

// =============================================================================
// TokenLedger - Per-token fungible balances and allowances
//
// Holders may transfer their own balance and grant allowances. Minting and
// burning are private: only the engine (through a locked Handle) can change
// supply, so no external actor can create or destroy tokens directly.
// =============================================================================

class TokenLedger {
public:
    TokenLedger() = default;
    ~TokenLedger() = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    // Unlimited allowance; never decremented by transfer_from
    static constexpr Amount UNLIMITED = AMOUNT_MAX;

private:
    struct Book {
        std::unordered_map<Address, Amount, AddressHash> balances;
        std::unordered_map<Address, std::unordered_map<Address, Amount, AddressHash>, AddressHash> allowances;
        Amount total_supply = 0;
        uint64_t holders = 0;
        mutable std::mutex mutex;
    };

public:
    // Exclusive access to one token's book for the duration of an engine
    // operation. Reads are public; supply changes are engine-only.
    class Handle {
    public:
        Handle(Handle&&) = default;
        Handle& operator=(Handle&&) = default;

        bool valid() const { return book_ != nullptr; }

        // Drops the book lock early; the handle is invalid afterwards
        void unlock() {
            if (lock_.owns_lock()) lock_.unlock();
            book_ = nullptr;
        }

        Amount balance_of(const Address& owner) const;
        Amount allowance(const Address& owner, const Address& spender) const;

        // Checks that `spender` may move `amount` of `owner`'s tokens
        ErrorCode can_spend(const Address& spender, const Address& owner, Amount amount) const;

    private:
        friend class TokenLedger;
        friend class Launchpad;

        Handle() = default;

        void mint(const Address& to, Amount amount);
        ErrorCode burn(const Address& from, Amount amount);
        void consume_allowance(const Address& owner, const Address& spender, Amount amount);

        Book* book_{nullptr};
        std::unique_lock<std::mutex> lock_;
    };

    // =========================================================================
    // Lifecycle
    // =========================================================================

    // Open an empty book for a new token. Returns false if it already exists.
    bool open(TokenId token);
    bool has(TokenId token) const;

    // Lock a token's book. Returned handle is invalid for unknown tokens.
    Handle lock(TokenId token);

    // =========================================================================
    // Holder Operations
    // =========================================================================

    ErrorCode transfer(const CallContext& ctx, TokenId token, const Address& to, Amount amount);
    ErrorCode approve(const CallContext& ctx, TokenId token, const Address& spender, Amount amount);
    ErrorCode transfer_from(const CallContext& ctx, TokenId token, const Address& from,
                            const Address& to, Amount amount);

    // =========================================================================
    // Queries
    // =========================================================================

    Amount balance_of(TokenId token, const Address& owner) const;
    Amount allowance(TokenId token, const Address& owner, const Address& spender) const;
    Amount total_supply(TokenId token) const;
    uint64_t holder_count(TokenId token) const;

    // Non-zero balances, for state export
    std::vector<std::pair<Address, Amount>> balances(TokenId token) const;

private:
    std::unordered_map<TokenId, std::unique_ptr<Book>> books_;
    mutable std::shared_mutex books_mutex_;

    Book* find_book(TokenId token) const;

    static void credit(Book& book, const Address& to, Amount amount);
    static ErrorCode debit(Book& book, const Address& from, Amount amount);
    static Amount read_allowance(const Book& book, const Address& owner, const Address& spender);
};

} // namespace pump

#endif // PUMP_LEDGER_HPP
