// =============================================================================
// config.cpp - Launchpad configuration loading
// =============================================================================

#include "pump/config.hpp"
#include <nlohmann/json.hpp>
#include <fstream>
#include <sstream>

namespace pump {

// Simple TOML parser (sections, key = value, comments)
namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

std::string unquote(const std::string& s) {
    if (s.size() >= 2 && s[0] == '"' && s.back() == '"') {
        return s.substr(1, s.size() - 2);
    }
    return s;
}

std::string strip_comment(const std::string& s) {
    bool in_quotes = false;
    for (size_t i = 0; i < s.size(); ++i) {
        if (s[i] == '"') in_quotes = !in_quotes;
        if (s[i] == '#' && !in_quotes) return s.substr(0, i);
    }
    return s;
}

Amount parse_amount(const std::string& key, const std::string& value) {
    auto parsed = amount_from_string(value);
    if (!parsed) {
        throw ConfigError("Invalid amount for " + key + ": " + value);
    }
    return *parsed;
}

uint32_t parse_bps(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        unsigned long v = std::stoul(value, &pos);
        if (pos != value.size() || v > BPS_DENOMINATOR) {
            throw ConfigError("Invalid basis points for " + key + ": " + value);
        }
        return static_cast<uint32_t>(v);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid basis points for " + key + ": " + value);
    }
}

uint64_t parse_u64(const std::string& key, const std::string& value) {
    try {
        size_t pos = 0;
        unsigned long long v = std::stoull(value, &pos);
        if (pos != value.size()) {
            throw ConfigError("Invalid integer for " + key + ": " + value);
        }
        return static_cast<uint64_t>(v);
    } catch (const std::logic_error&) {
        throw ConfigError("Invalid integer for " + key + ": " + value);
    }
}

Address parse_address(const std::string& key, const std::string& value) {
    auto addr = address_from_hex(value);
    if (!addr) {
        throw ConfigError("Invalid address for " + key + ": " + value);
    }
    return *addr;
}

}  // namespace

LaunchpadConfig LaunchpadConfig::from_file(std::string_view path) {
    std::string path_str{path};
    std::ifstream file{path_str};
    if (!file.is_open()) {
        throw ConfigError("Cannot open config file: " + path_str);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();
    return from_toml(buffer.str());
}

LaunchpadConfig LaunchpadConfig::from_toml(std::string_view content) {
    LaunchpadConfig config;
    std::string current_section;

    std::string content_str{content};
    std::istringstream stream{content_str};
    std::string line;

    while (std::getline(stream, line)) {
        line = trim(strip_comment(line));

        if (line.empty()) continue;

        // Section header
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end == std::string::npos) {
                throw ConfigError("Malformed section header: " + line);
            }
            current_section = trim(line.substr(1, end - 1));
            continue;
        }

        auto eq = line.find('=');
        if (eq == std::string::npos) {
            throw ConfigError("Expected key = value: " + line);
        }
        std::string key = trim(line.substr(0, eq));
        std::string value = unquote(trim(line.substr(eq + 1)));

        if (current_section == "general") {
            if (key == "log_level") config.general.log_level = value;
        }
        else if (current_section == "curve") {
            if (key == "virtual_base_reserve") config.curve.virtual_base_reserve = parse_amount(key, value);
            else if (key == "virtual_token_reserve") config.curve.virtual_token_reserve = parse_amount(key, value);
            else if (key == "total_supply") config.curve.total_supply = parse_amount(key, value);
            else if (key == "bonding_supply") config.curve.bonding_supply = parse_amount(key, value);
            else if (key == "graduation_threshold") config.curve.graduation_threshold = parse_amount(key, value);
        }
        else if (current_section == "fees") {
            if (key == "buy_fee_bps") config.fees.buy_fee_bps = parse_bps(key, value);
            else if (key == "sell_fee_bps") config.fees.sell_fee_bps = parse_bps(key, value);
            else if (key == "max_fee_bps") config.fees.max_fee_bps = parse_bps(key, value);
            else if (key == "creation_fee") config.fees.creation_fee = parse_amount(key, value);
            else if (key == "referral_share_bps") config.fees.referral_share_bps = parse_bps(key, value);
        }
        else if (current_section == "graduation") {
            if (key == "burn_bps") config.graduation.burn_bps = parse_bps(key, value);
            else if (key == "liquidity_bps") config.graduation.liquidity_bps = parse_bps(key, value);
            else if (key == "creator_bps") config.graduation.creator_bps = parse_bps(key, value);
            else if (key == "lp_recipient") config.graduation.lp_recipient = parse_address(key, value);
            else if (key == "liquidity_deadline_secs") config.graduation.liquidity_deadline_secs = parse_u64(key, value);
        }
        else if (current_section == "accounts") {
            if (key == "owner") config.accounts.owner = parse_address(key, value);
            else if (key == "treasury") config.accounts.treasury = parse_address(key, value);
        }
    }

    config.validate();
    return config;
}

void LaunchpadConfig::validate() const {
    if (curve.virtual_base_reserve == 0 || curve.virtual_token_reserve == 0) {
        throw ConfigError("Virtual reserves must be non-zero");
    }
    if (curve.bonding_supply == 0 || curve.bonding_supply >= curve.virtual_token_reserve) {
        throw ConfigError("bonding_supply must be in (0, virtual_token_reserve)");
    }
    if (curve.bonding_supply > curve.total_supply) {
        throw ConfigError("bonding_supply exceeds total_supply");
    }
    if (curve.graduation_threshold == 0) {
        throw ConfigError("graduation_threshold must be non-zero");
    }
    if (fees.max_fee_bps > BPS_DENOMINATOR) {
        throw ConfigError("max_fee_bps exceeds 10000");
    }
    if (fees.buy_fee_bps > fees.max_fee_bps || fees.sell_fee_bps > fees.max_fee_bps) {
        throw ConfigError("Trade fee exceeds max_fee_bps");
    }
    if (fees.referral_share_bps > BPS_DENOMINATOR) {
        throw ConfigError("referral_share_bps exceeds 10000");
    }
    uint64_t allocation = static_cast<uint64_t>(graduation.burn_bps) +
                          graduation.liquidity_bps + graduation.creator_bps;
    if (allocation > BPS_DENOMINATOR) {
        throw ConfigError("Graduation allocation exceeds 10000 bps");
    }
    if (addresses::is_zero(accounts.owner) || addresses::is_zero(accounts.treasury)) {
        throw ConfigError("owner and treasury must be set");
    }
}

// =============================================================================
// JSON round-trip (amounts as decimal strings)
// =============================================================================

void to_json(nlohmann::json& j, const LaunchpadConfig& config) {
    j = nlohmann::json{
        {"general", {{"log_level", config.general.log_level}}},
        {"curve", {
            {"virtual_base_reserve", to_string(config.curve.virtual_base_reserve)},
            {"virtual_token_reserve", to_string(config.curve.virtual_token_reserve)},
            {"total_supply", to_string(config.curve.total_supply)},
            {"bonding_supply", to_string(config.curve.bonding_supply)},
            {"graduation_threshold", to_string(config.curve.graduation_threshold)},
        }},
        {"fees", {
            {"buy_fee_bps", config.fees.buy_fee_bps},
            {"sell_fee_bps", config.fees.sell_fee_bps},
            {"max_fee_bps", config.fees.max_fee_bps},
            {"creation_fee", to_string(config.fees.creation_fee)},
            {"referral_share_bps", config.fees.referral_share_bps},
        }},
        {"graduation", {
            {"burn_bps", config.graduation.burn_bps},
            {"liquidity_bps", config.graduation.liquidity_bps},
            {"creator_bps", config.graduation.creator_bps},
            {"lp_recipient", to_hex(config.graduation.lp_recipient)},
            {"liquidity_deadline_secs", config.graduation.liquidity_deadline_secs},
        }},
        {"accounts", {
            {"owner", to_hex(config.accounts.owner)},
            {"treasury", to_hex(config.accounts.treasury)},
        }},
    };
}

void from_json(const nlohmann::json& j, LaunchpadConfig& config) {
    config = LaunchpadConfig{};

    if (j.contains("general")) {
        const auto& g = j.at("general");
        config.general.log_level = g.value("log_level", config.general.log_level);
    }
    if (j.contains("curve")) {
        const auto& c = j.at("curve");
        auto amount = [&](const char* key, Amount& out) {
            if (c.contains(key)) out = parse_amount(key, c.at(key).get<std::string>());
        };
        amount("virtual_base_reserve", config.curve.virtual_base_reserve);
        amount("virtual_token_reserve", config.curve.virtual_token_reserve);
        amount("total_supply", config.curve.total_supply);
        amount("bonding_supply", config.curve.bonding_supply);
        amount("graduation_threshold", config.curve.graduation_threshold);
    }
    if (j.contains("fees")) {
        const auto& f = j.at("fees");
        config.fees.buy_fee_bps = f.value("buy_fee_bps", config.fees.buy_fee_bps);
        config.fees.sell_fee_bps = f.value("sell_fee_bps", config.fees.sell_fee_bps);
        config.fees.max_fee_bps = f.value("max_fee_bps", config.fees.max_fee_bps);
        config.fees.referral_share_bps = f.value("referral_share_bps", config.fees.referral_share_bps);
        if (f.contains("creation_fee")) {
            config.fees.creation_fee = parse_amount("creation_fee", f.at("creation_fee").get<std::string>());
        }
    }
    if (j.contains("graduation")) {
        const auto& g = j.at("graduation");
        config.graduation.burn_bps = g.value("burn_bps", config.graduation.burn_bps);
        config.graduation.liquidity_bps = g.value("liquidity_bps", config.graduation.liquidity_bps);
        config.graduation.creator_bps = g.value("creator_bps", config.graduation.creator_bps);
        config.graduation.liquidity_deadline_secs =
            g.value("liquidity_deadline_secs", config.graduation.liquidity_deadline_secs);
        if (g.contains("lp_recipient")) {
            config.graduation.lp_recipient = parse_address("lp_recipient", g.at("lp_recipient").get<std::string>());
        }
    }
    if (j.contains("accounts")) {
        const auto& a = j.at("accounts");
        if (a.contains("owner")) config.accounts.owner = parse_address("owner", a.at("owner").get<std::string>());
        if (a.contains("treasury")) config.accounts.treasury = parse_address("treasury", a.at("treasury").get<std::string>());
    }
}

}  // namespace pump
