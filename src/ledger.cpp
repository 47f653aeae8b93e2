// =============================================================================
// ledger.cpp - TokenLedger balance bookkeeping
// =============================================================================

#include "pump/ledger.hpp"

namespace pump {

// =============================================================================
// Book Helpers (caller holds the book mutex)
// =============================================================================

void TokenLedger::credit(Book& book, const Address& to, Amount amount) {
    if (amount == 0) return;
    Amount& bal = book.balances[to];
    if (bal == 0) ++book.holders;
    bal += amount;
}

ErrorCode TokenLedger::debit(Book& book, const Address& from, Amount amount) {
    if (amount == 0) return ErrorCode::Ok;
    auto it = book.balances.find(from);
    if (it == book.balances.end() || it->second < amount) {
        return ErrorCode::InsufficientBalance;
    }
    it->second -= amount;
    if (it->second == 0) {
        book.balances.erase(it);
        --book.holders;
    }
    return ErrorCode::Ok;
}

Amount TokenLedger::read_allowance(const Book& book, const Address& owner, const Address& spender) {
    auto it = book.allowances.find(owner);
    if (it == book.allowances.end()) return 0;
    auto jt = it->second.find(spender);
    return jt != it->second.end() ? jt->second : 0;
}

TokenLedger::Book* TokenLedger::find_book(TokenId token) const {
    std::shared_lock lock(books_mutex_);
    auto it = books_.find(token);
    return it != books_.end() ? it->second.get() : nullptr;
}

// =============================================================================
// Handle
// =============================================================================

Amount TokenLedger::Handle::balance_of(const Address& owner) const {
    auto it = book_->balances.find(owner);
    return it != book_->balances.end() ? it->second : 0;
}

Amount TokenLedger::Handle::allowance(const Address& owner, const Address& spender) const {
    return read_allowance(*book_, owner, spender);
}

ErrorCode TokenLedger::Handle::can_spend(const Address& spender, const Address& owner,
                                         Amount amount) const {
    if (balance_of(owner) < amount) {
        return ErrorCode::InsufficientBalance;
    }
    if (spender != owner && allowance(owner, spender) < amount) {
        return ErrorCode::AllowanceExceeded;
    }
    return ErrorCode::Ok;
}

void TokenLedger::Handle::mint(const Address& to, Amount amount) {
    credit(*book_, to, amount);
    book_->total_supply += amount;
}

ErrorCode TokenLedger::Handle::burn(const Address& from, Amount amount) {
    ErrorCode err = debit(*book_, from, amount);
    if (err != ErrorCode::Ok) return err;
    book_->total_supply -= amount;
    return ErrorCode::Ok;
}

void TokenLedger::Handle::consume_allowance(const Address& owner, const Address& spender,
                                            Amount amount) {
    if (owner == spender) return;
    Amount& allowed = book_->allowances[owner][spender];
    if (allowed != UNLIMITED) allowed -= amount;
}

// =============================================================================
// Lifecycle
// =============================================================================

bool TokenLedger::open(TokenId token) {
    std::unique_lock lock(books_mutex_);
    if (books_.find(token) != books_.end()) {
        return false;
    }
    books_[token] = std::make_unique<Book>();
    return true;
}

bool TokenLedger::has(TokenId token) const {
    return find_book(token) != nullptr;
}

TokenLedger::Handle TokenLedger::lock(TokenId token) {
    Handle handle;
    Book* book = find_book(token);
    if (!book) return handle;
    handle.lock_ = std::unique_lock<std::mutex>(book->mutex);
    handle.book_ = book;
    return handle;
}

// =============================================================================
// Holder Operations
// =============================================================================

ErrorCode TokenLedger::transfer(const CallContext& ctx, TokenId token, const Address& to,
                                Amount amount) {
    if (addresses::is_zero(to)) return ErrorCode::InvalidParameter;

    Book* book = find_book(token);
    if (!book) return ErrorCode::InvalidToken;

    std::lock_guard<std::mutex> lock(book->mutex);
    ErrorCode err = debit(*book, ctx.caller, amount);
    if (err != ErrorCode::Ok) return err;
    credit(*book, to, amount);
    return ErrorCode::Ok;
}

ErrorCode TokenLedger::approve(const CallContext& ctx, TokenId token, const Address& spender,
                               Amount amount) {
    if (addresses::is_zero(spender)) return ErrorCode::InvalidParameter;

    Book* book = find_book(token);
    if (!book) return ErrorCode::InvalidToken;

    std::lock_guard<std::mutex> lock(book->mutex);
    book->allowances[ctx.caller][spender] = amount;
    return ErrorCode::Ok;
}

ErrorCode TokenLedger::transfer_from(const CallContext& ctx, TokenId token, const Address& from,
                                     const Address& to, Amount amount) {
    if (addresses::is_zero(to)) return ErrorCode::InvalidParameter;

    Book* book = find_book(token);
    if (!book) return ErrorCode::InvalidToken;

    std::lock_guard<std::mutex> lock(book->mutex);

    Amount allowed = read_allowance(*book, from, ctx.caller);
    if (allowed < amount) {
        return ErrorCode::AllowanceExceeded;
    }
    ErrorCode err = debit(*book, from, amount);
    if (err != ErrorCode::Ok) return err;
    credit(*book, to, amount);

    if (allowed != UNLIMITED) {
        book->allowances[from][ctx.caller] = allowed - amount;
    }
    return ErrorCode::Ok;
}

// =============================================================================
// Queries
// =============================================================================

Amount TokenLedger::balance_of(TokenId token, const Address& owner) const {
    Book* book = find_book(token);
    if (!book) return 0;
    std::lock_guard<std::mutex> lock(book->mutex);
    auto it = book->balances.find(owner);
    return it != book->balances.end() ? it->second : 0;
}

Amount TokenLedger::allowance(TokenId token, const Address& owner, const Address& spender) const {
    Book* book = find_book(token);
    if (!book) return 0;
    std::lock_guard<std::mutex> lock(book->mutex);
    return read_allowance(*book, owner, spender);
}

Amount TokenLedger::total_supply(TokenId token) const {
    Book* book = find_book(token);
    if (!book) return 0;
    std::lock_guard<std::mutex> lock(book->mutex);
    return book->total_supply;
}

uint64_t TokenLedger::holder_count(TokenId token) const {
    Book* book = find_book(token);
    if (!book) return 0;
    std::lock_guard<std::mutex> lock(book->mutex);
    return book->holders;
}

std::vector<std::pair<Address, Amount>> TokenLedger::balances(TokenId token) const {
    std::vector<std::pair<Address, Amount>> result;
    Book* book = find_book(token);
    if (!book) return result;
    std::lock_guard<std::mutex> lock(book->mutex);
    result.reserve(book->balances.size());
    for (const auto& [owner, amount] : book->balances) {
        result.emplace_back(owner, amount);
    }
    return result;
}

} // namespace pump
