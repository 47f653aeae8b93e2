// =============================================================================
// state.cpp - Launchpad state export/import
// =============================================================================

#include "pump/state.hpp"
#include "pump/launchpad.hpp"
#include "pump/log.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <stdexcept>

namespace pump {

namespace {

Amount read_amount(const nlohmann::json& j, const char* key) {
    auto parsed = amount_from_string(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("bad amount for ") + key);
    }
    return *parsed;
}

Address read_address(const nlohmann::json& j, const char* key) {
    auto parsed = address_from_hex(j.at(key).get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("bad address for ") + key);
    }
    return *parsed;
}

TokenStatus read_status(const std::string& s) {
    if (s == "active") return TokenStatus::Active;
    if (s == "graduated") return TokenStatus::Graduated;
    throw std::invalid_argument("bad token status: " + s);
}

}  // namespace

// =============================================================================
// TokenRecord JSON
// =============================================================================

void to_json(nlohmann::json& j, const TokenRecord& r) {
    j = nlohmann::json{
        {"id", r.id},
        {"creator", to_hex(r.creator)},
        {"name", r.name},
        {"symbol", r.symbol},
        {"description", r.description},
        {"metadata_uri", r.metadata_uri},
        {"virtual_base_reserve", to_string(r.virtual_base_reserve)},
        {"virtual_token_reserve", to_string(r.virtual_token_reserve)},
        {"total_supply", to_string(r.total_supply)},
        {"bonding_supply", to_string(r.bonding_supply)},
        {"graduation_threshold", to_string(r.graduation_threshold)},
        {"real_reserve", to_string(r.real_reserve)},
        {"tokens_sold", to_string(r.tokens_sold)},
        {"total_burned", to_string(r.total_burned)},
        {"graduation_minted", to_string(r.graduation_minted)},
        {"trade_volume", to_string(r.trade_volume)},
        {"trade_count", r.trade_count},
        {"status", to_string(r.status)},
        {"created_at", r.created_at},
        {"graduated_at", r.graduated_at},
        {"pool_ref", r.pool_ref},
    };
}

void from_json(const nlohmann::json& j, TokenRecord& r) {
    r = TokenRecord{};
    r.id = j.at("id").get<TokenId>();
    r.creator = read_address(j, "creator");
    r.name = j.at("name").get<std::string>();
    r.symbol = j.at("symbol").get<std::string>();
    r.description = j.value("description", std::string{});
    r.metadata_uri = j.value("metadata_uri", std::string{});
    r.virtual_base_reserve = read_amount(j, "virtual_base_reserve");
    r.virtual_token_reserve = read_amount(j, "virtual_token_reserve");
    r.total_supply = read_amount(j, "total_supply");
    r.bonding_supply = read_amount(j, "bonding_supply");
    r.graduation_threshold = read_amount(j, "graduation_threshold");
    r.real_reserve = read_amount(j, "real_reserve");
    r.tokens_sold = read_amount(j, "tokens_sold");
    r.total_burned = read_amount(j, "total_burned");
    r.graduation_minted = read_amount(j, "graduation_minted");
    r.trade_volume = read_amount(j, "trade_volume");
    r.trade_count = j.value("trade_count", uint64_t{0});
    r.status = read_status(j.at("status").get<std::string>());
    r.created_at = j.value("created_at", uint64_t{0});
    r.graduated_at = j.value("graduated_at", uint64_t{0});
    r.pool_ref = j.value("pool_ref", uint64_t{0});

    if (r.virtual_base_reserve == 0 || r.bonding_supply >= r.virtual_token_reserve ||
        r.tokens_sold > r.bonding_supply || r.total_burned > r.tokens_sold) {
        throw std::invalid_argument("inconsistent curve state for token " + std::to_string(r.id));
    }
}

// =============================================================================
// Launchpad Export
// =============================================================================

nlohmann::json Launchpad::export_state() const {
    nlohmann::json tokens = nlohmann::json::array();
    nlohmann::json balances = nlohmann::json::array();

    for (const auto& record : registry_.list(0, registry_.count())) {
        tokens.push_back(record);
        for (const auto& [owner, amount] : ledger_.balances(record.id)) {
            balances.push_back({
                {"token", record.id},
                {"owner", to_hex(owner)},
                {"amount", to_string(amount)},
            });
        }
    }

    nlohmann::json vault = nlohmann::json::array();
    for (const auto& [account, amount] : vault_.accounts()) {
        vault.push_back({{"account", to_hex(account)}, {"amount", to_string(amount)}});
    }

    return nlohmann::json{
        {"version", STATE_VERSION},
        {"tokens", std::move(tokens)},
        {"balances", std::move(balances)},
        {"vault", std::move(vault)},
    };
}

// =============================================================================
// Launchpad Import
// =============================================================================

ErrorCode Launchpad::import_state(const nlohmann::json& state) {
    if (registry_.count() != 0 || !vault_.accounts().empty()) {
        log::warn("state import refused: launchpad is not empty");
        return ErrorCode::InvalidParameter;
    }

    std::vector<TokenRecord> records;
    std::map<TokenId, std::vector<std::pair<Address, Amount>>> holdings;
    std::vector<std::pair<Address, Amount>> accounts;

    try {
        if (state.value("version", 0) != STATE_VERSION) {
            throw std::invalid_argument("unsupported state version");
        }
        for (const auto& item : state.at("tokens")) {
            records.push_back(item.get<TokenRecord>());
            if (holdings.count(records.back().id) != 0) {
                throw std::invalid_argument("duplicate token id");
            }
            holdings[records.back().id];
        }
        for (const auto& item : state.at("balances")) {
            TokenId id = item.at("token").get<TokenId>();
            auto it = holdings.find(id);
            if (it == holdings.end()) {
                throw std::invalid_argument("balance for unknown token " + std::to_string(id));
            }
            it->second.emplace_back(read_address(item, "owner"), read_amount(item, "amount"));
        }
        for (const auto& item : state.value("vault", nlohmann::json::array())) {
            accounts.emplace_back(read_address(item, "account"), read_amount(item, "amount"));
        }
    } catch (const nlohmann::json::exception& e) {
        log::warn(std::string("state import refused: ") + e.what());
        return ErrorCode::InvalidParameter;
    } catch (const std::invalid_argument& e) {
        log::warn(std::string("state import refused: ") + e.what());
        return ErrorCode::InvalidParameter;
    }

    // Every token's balances must add up to its circulating supply
    for (const auto& record : records) {
        Amount held = 0;
        for (const auto& [owner, amount] : holdings[record.id]) {
            held += amount;
        }
        if (held != record.circulating()) {
            log::warn("state import refused: balances of token " + std::to_string(record.id) +
                      " do not match its supply");
            return ErrorCode::InvalidParameter;
        }
    }

    // The curve escrow backs exactly the real reserves, graduated tokens included
    Amount reserves = 0;
    for (const auto& record : records) {
        reserves += record.real_reserve;
    }
    Amount escrow = 0;
    for (const auto& [account, amount] : accounts) {
        if (account == addresses::CURVE_ESCROW) escrow += amount;
    }
    if (escrow != reserves) {
        log::warn("state import refused: curve escrow holds " + to_string(escrow) +
                  " against reserves of " + to_string(reserves));
        return ErrorCode::InvalidParameter;
    }

    uint64_t graduated = 0;
    for (const auto& record : records) {
        if (!registry_.restore(record) || !ledger_.open(record.id)) {
            return ErrorCode::InvalidParameter;
        }
        auto book = ledger_.lock(record.id);
        for (const auto& [owner, amount] : holdings[record.id]) {
            book.mint(owner, amount);
        }
        if (!record.is_active()) ++graduated;
    }
    for (const auto& [account, amount] : accounts) {
        ErrorCode err = vault_.deposit(account, amount);
        if (err != ErrorCode::Ok && err != ErrorCode::ZeroAmount) {
            return err;
        }
    }

    tokens_created_.fetch_add(records.size(), std::memory_order_relaxed);
    tokens_graduated_.fetch_add(graduated, std::memory_order_relaxed);
    log::info("state imported: " + std::to_string(records.size()) + " tokens");
    return ErrorCode::Ok;
}

} // namespace pump
