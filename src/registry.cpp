// =============================================================================
// registry.cpp - Token record storage
// =============================================================================

#include "pump/registry.hpp"

namespace pump {

TokenRegistry::Slot* TokenRegistry::find_slot(TokenId id) const {
    std::shared_lock lock(mutex_);
    auto it = slots_.find(id);
    return it != slots_.end() ? it->second.get() : nullptr;
}

TokenRecord TokenRegistry::snapshot(const Slot& slot) {
    std::lock_guard<std::mutex> lock(slot.mutex);
    return slot.record;
}

// =============================================================================
// Creation
// =============================================================================

TokenId TokenRegistry::create(TokenRecord record, const std::function<void(TokenId)>& on_insert) {
    std::unique_lock lock(mutex_);

    TokenId id = next_id_++;
    record.id = id;
    Address creator = record.creator;

    if (on_insert) {
        on_insert(id);
    }

    auto slot = std::make_unique<Slot>();
    slot->record = std::move(record);
    slots_.emplace(id, std::move(slot));
    creators_[creator].push_back(id);
    return id;
}

bool TokenRegistry::restore(const TokenRecord& record) {
    std::unique_lock lock(mutex_);
    if (record.id == 0 || slots_.count(record.id) != 0) {
        return false;
    }

    auto slot = std::make_unique<Slot>();
    slot->record = record;
    slots_.emplace(record.id, std::move(slot));
    creators_[record.creator].push_back(record.id);
    if (record.id >= next_id_) {
        next_id_ = record.id + 1;
    }
    return true;
}

// =============================================================================
// Access
// =============================================================================

TokenRegistry::Locked TokenRegistry::lock(TokenId id) {
    Locked locked;
    Slot* slot = find_slot(id);
    if (!slot) return locked;
    locked.lock_ = std::unique_lock<std::mutex>(slot->mutex);
    locked.record_ = &slot->record;
    return locked;
}

std::optional<TokenRecord> TokenRegistry::get(TokenId id) const {
    Slot* slot = find_slot(id);
    if (!slot) return std::nullopt;
    return snapshot(*slot);
}

bool TokenRegistry::exists(TokenId id) const {
    return find_slot(id) != nullptr;
}

size_t TokenRegistry::count() const {
    std::shared_lock lock(mutex_);
    return slots_.size();
}

std::vector<TokenRecord> TokenRegistry::list(size_t offset, size_t limit) const {
    std::vector<TokenRecord> result;
    std::shared_lock lock(mutex_);

    size_t index = 0;
    for (const auto& [id, slot] : slots_) {
        if (result.size() >= limit) break;
        if (index++ < offset) continue;
        result.push_back(snapshot(*slot));
    }
    return result;
}

std::vector<TokenRecord> TokenRegistry::list_live(size_t offset, size_t limit) const {
    std::vector<TokenRecord> result;
    std::shared_lock lock(mutex_);

    size_t index = 0;
    for (const auto& [id, slot] : slots_) {
        if (result.size() >= limit) break;
        TokenRecord record = snapshot(*slot);
        if (!record.is_active()) continue;
        if (index++ < offset) continue;
        result.push_back(std::move(record));
    }
    return result;
}

std::vector<TokenId> TokenRegistry::by_creator(const Address& creator) const {
    std::shared_lock lock(mutex_);
    auto it = creators_.find(creator);
    if (it == creators_.end()) return {};
    return it->second;
}

std::optional<TokenRecord> TokenRegistry::find_by_symbol(const std::string& symbol) const {
    std::shared_lock lock(mutex_);
    for (const auto& [id, slot] : slots_) {
        TokenRecord record = snapshot(*slot);
        if (record.symbol == symbol) {
            return record;
        }
    }
    return std::nullopt;
}

} // namespace pump
