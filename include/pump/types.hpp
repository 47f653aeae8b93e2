#ifndef PUMP_TYPES_HPP
#define PUMP_TYPES_HPP

#include <cstdint>
#include <array>
#include <string>
#include <optional>
#include <limits>
#include <utility>

namespace pump {

// =============================================================================
// Fixed-Point Amounts (WAD = 18 decimal places)
// =============================================================================

using U128 = unsigned __int128;
using I128 = __int128;
using Amount = U128;

constexpr Amount WAD = 1000000000000000000ULL;  // 1e18
constexpr Amount AMOUNT_MAX = std::numeric_limits<U128>::max();

constexpr uint32_t BPS_DENOMINATOR = 10000;

// Decimal conversion (U128 has no stream support)
std::string to_string(Amount v);

// Parses "1234", "12500000e18". Returns nullopt on malformed input or overflow.
std::optional<Amount> amount_from_string(const std::string& s);

inline Amount from_whole(uint64_t units) {
    return static_cast<Amount>(units) * WAD;
}

// =============================================================================
// Addresses (EVM 20-byte identities)
// =============================================================================

using Address = std::array<uint8_t, 20>;

namespace addresses {

constexpr Address ZERO = {};

// Custody account holding the raised (real) reserve of every curve
constexpr Address CURVE_ESCROW = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xC0,0x01};

// Non-recoverable sink: 0x000000000000000000000000000000000000dEaD
constexpr Address BURN_SINK = {0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0xde,0xad};

constexpr bool is_zero(const Address& addr) {
    for (size_t i = 0; i < addr.size(); ++i) {
        if (addr[i] != 0) return false;
    }
    return true;
}

// Deterministic test/simulation address from a small integer
constexpr Address from_index(uint32_t n) {
    Address addr = {};
    addr[16] = static_cast<uint8_t>((n >> 24) & 0xFF);
    addr[17] = static_cast<uint8_t>((n >> 16) & 0xFF);
    addr[18] = static_cast<uint8_t>((n >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(n & 0xFF);
    addr[0] = 0xA0;
    return addr;
}

} // namespace addresses

std::string to_hex(const Address& addr);
std::optional<Address> address_from_hex(const std::string& hex);

struct AddressHash {
    size_t operator()(const Address& a) const {
        uint64_t h = 0;
        for (auto b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// Unix seconds from the system clock
uint64_t current_timestamp();

// =============================================================================
// Caller Context
// =============================================================================

// Acting identity of a mutating call. `value` is the base-currency payment
// attached to the call (only create_token consumes it).
struct CallContext {
    Address caller;
    Amount value = 0;
};

// =============================================================================
// Token Identity & Lifecycle
// =============================================================================

using TokenId = uint64_t;

enum class TokenStatus : uint8_t {
    Active = 0,
    Graduated = 1
};

inline const char* to_string(TokenStatus s) {
    return s == TokenStatus::Active ? "active" : "graduated";
}

// =============================================================================
// Error Codes
// =============================================================================

enum class ErrorCode : int32_t {
    Ok = 0,
    InsufficientPayment = -1,
    ZeroAmount = -2,
    InvalidToken = -3,
    AlreadyGraduated = -4,
    SlippageExceeded = -5,
    InsufficientBalance = -6,
    AllowanceExceeded = -7,
    InsufficientLiquidity = -8,
    Paused = -9,
    ExternalTransferFailed = -10,
    Unauthorized = -20,
    InvalidParameter = -21
};

const char* to_string(ErrorCode code);

// Tagged operation result. `value` is meaningful only when ok().
template <typename T>
struct Result {
    ErrorCode error = ErrorCode::Ok;
    T value{};

    bool ok() const { return error == ErrorCode::Ok; }
    explicit operator bool() const { return ok(); }

    static Result success(T v) { return {ErrorCode::Ok, std::move(v)}; }
    static Result failure(ErrorCode e) { return {e, T{}}; }
};

} // namespace pump

#endif // PUMP_TYPES_HPP
