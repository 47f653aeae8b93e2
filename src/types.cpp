// =============================================================================
// types.cpp - Amount/Address formatting and error names
// =============================================================================

#include "pump/types.hpp"
#include <algorithm>
#include <cctype>
#include <chrono>

namespace pump {

std::string to_string(Amount v) {
    if (v == 0) return "0";
    std::string out;
    while (v != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(v % 10)));
        v /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

std::optional<Amount> amount_from_string(const std::string& s) {
    if (s.empty()) return std::nullopt;

    size_t exp_pos = s.find_first_of("eE");
    std::string mantissa = s.substr(0, exp_pos);
    if (mantissa.empty()) return std::nullopt;

    Amount value = 0;
    for (char c : mantissa) {
        if (c == '_') continue;  // digit separators
        if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        Amount digit = static_cast<Amount>(c - '0');
        if (value > (AMOUNT_MAX - digit) / 10) return std::nullopt;
        value = value * 10 + digit;
    }

    if (exp_pos != std::string::npos) {
        std::string exp_str = s.substr(exp_pos + 1);
        if (exp_str.empty() || exp_str.size() > 2) return std::nullopt;
        for (char c : exp_str) {
            if (!std::isdigit(static_cast<unsigned char>(c))) return std::nullopt;
        }
        int exp = std::stoi(exp_str);
        for (int i = 0; i < exp; ++i) {
            if (value > AMOUNT_MAX / 10) return std::nullopt;
            value *= 10;
        }
    }
    return value;
}

std::string to_hex(const Address& addr) {
    static const char* digits = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(42);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::optional<Address> address_from_hex(const std::string& hex) {
    std::string body = hex;
    if (body.size() >= 2 && body[0] == '0' && (body[1] == 'x' || body[1] == 'X')) {
        body = body.substr(2);
    }
    if (body.size() != 40) return std::nullopt;

    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = nibble(body[2 * i]);
        int lo = nibble(body[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

uint64_t current_timestamp() {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count());
}

const char* to_string(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::InsufficientPayment: return "InsufficientPayment";
        case ErrorCode::ZeroAmount: return "ZeroAmount";
        case ErrorCode::InvalidToken: return "InvalidToken";
        case ErrorCode::AlreadyGraduated: return "AlreadyGraduated";
        case ErrorCode::SlippageExceeded: return "SlippageExceeded";
        case ErrorCode::InsufficientBalance: return "InsufficientBalance";
        case ErrorCode::AllowanceExceeded: return "AllowanceExceeded";
        case ErrorCode::InsufficientLiquidity: return "InsufficientLiquidity";
        case ErrorCode::Paused: return "Paused";
        case ErrorCode::ExternalTransferFailed: return "ExternalTransferFailed";
        case ErrorCode::Unauthorized: return "Unauthorized";
        case ErrorCode::InvalidParameter: return "InvalidParameter";
    }
    return "Unknown";
}

} // namespace pump
