#ifndef PUMP_REGISTRY_HPP
#define PUMP_REGISTRY_HPP

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"
#include "curve.hpp"

namespace pump {

// =============================================================================
// TokenRegistry - Token records and their per-token locks
//
// Every mutation of a record happens through a Locked handle, which holds
// that token's mutex. Different tokens never contend.
// =============================================================================

class TokenRegistry {
private:
    struct Slot {
        TokenRecord record;
        mutable std::mutex mutex;
    };

public:
    TokenRegistry() = default;
    ~TokenRegistry() = default;

    // Non-copyable
    TokenRegistry(const TokenRegistry&) = delete;
    TokenRegistry& operator=(const TokenRegistry&) = delete;

    // Exclusive access to one record
    class Locked {
    public:
        Locked(Locked&&) = default;
        Locked& operator=(Locked&&) = default;

        bool valid() const { return record_ != nullptr; }
        TokenRecord& record() { return *record_; }
        const TokenRecord& record() const { return *record_; }

    private:
        friend class TokenRegistry;
        Locked() = default;

        TokenRecord* record_{nullptr};
        std::unique_lock<std::mutex> lock_;
    };

    // =========================================================================
    // Creation
    // =========================================================================

    // Assigns the next id (starting at 1). `on_insert` runs before the token
    // becomes visible to lookups.
    TokenId create(TokenRecord record, const std::function<void(TokenId)>& on_insert = nullptr);

    // Insert a record with its existing id (state import). False if taken.
    bool restore(const TokenRecord& record);

    // =========================================================================
    // Access
    // =========================================================================

    // Invalid handle for unknown ids
    Locked lock(TokenId id);

    std::optional<TokenRecord> get(TokenId id) const;
    bool exists(TokenId id) const;
    size_t count() const;

    // Ordered by id
    std::vector<TokenRecord> list(size_t offset, size_t limit) const;

    // Active tokens only, ordered by id
    std::vector<TokenRecord> list_live(size_t offset, size_t limit) const;

    std::vector<TokenId> by_creator(const Address& creator) const;

    // Lowest id carrying `symbol`; symbols are not unique
    std::optional<TokenRecord> find_by_symbol(const std::string& symbol) const;

private:
    std::map<TokenId, std::unique_ptr<Slot>> slots_;
    std::unordered_map<Address, std::vector<TokenId>, AddressHash> creators_;
    TokenId next_id_{1};
    mutable std::shared_mutex mutex_;

    Slot* find_slot(TokenId id) const;
    static TokenRecord snapshot(const Slot& slot);
};

} // namespace pump

#endif // PUMP_REGISTRY_HPP
