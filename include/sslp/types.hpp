#ifndef SSLP_TYPES_HPP
#define SSLP_TYPES_HPP

#include <cstdint>
#include <cstddef>
#include <array>
#include <string>

namespace sslp {

// =============================================================================
// Primitive Types
// =============================================================================

using Address = std::array<uint8_t, 20>;
using Salt = std::array<uint8_t, 32>;

using I128 = __int128;
using U128 = unsigned __int128;

constexpr I128 I128_MAX = static_cast<I128>(~static_cast<U128>(0) >> 1);
constexpr I128 I128_MIN = -I128_MAX - 1;

// Build an address whose last two bytes carry `id` (test and example helper)
constexpr Address make_address(uint16_t id) {
    Address addr = {};
    addr[18] = static_cast<uint8_t>((id >> 8) & 0xFF);
    addr[19] = static_cast<uint8_t>(id & 0xFF);
    return addr;
}

constexpr Salt make_salt(uint64_t v) {
    Salt s = {};
    for (size_t i = 0; i < 8; ++i) {
        s[31 - i] = static_cast<uint8_t>((v >> (8 * i)) & 0xFF);
    }
    return s;
}

inline bool is_zero_address(const Address& a) {
    for (uint8_t b : a) if (b != 0) return false;
    return true;
}

// =============================================================================
// Currency Type (Token Address)
// =============================================================================

struct Currency {
    Address addr;

    Currency() : addr{} {}
    explicit Currency(const Address& a) : addr(a) {}

    bool operator==(const Currency& other) const { return addr == other.addr; }
    bool operator!=(const Currency& other) const { return addr != other.addr; }
    bool operator<(const Currency& other) const { return addr < other.addr; }
};

// =============================================================================
// Asset Slot
// =============================================================================

// Which of the pool's two currencies: A = currency0, B = currency1
enum class Asset : uint8_t {
    A = 0,
    B = 1
};

constexpr size_t index_of(Asset asset) { return static_cast<size_t>(asset); }

constexpr Asset other(Asset asset) { return asset == Asset::A ? Asset::B : Asset::A; }

constexpr const char* asset_name(Asset asset) { return asset == Asset::A ? "A" : "B"; }

// =============================================================================
// Pool Key (Unique Pool Identifier)
// =============================================================================

struct PoolKey {
    Currency currency0;      // Sorted: currency0 < currency1
    Currency currency1;
    uint32_t fee;            // Fee in hundredths of a bip
    int32_t tick_spacing;
    Address hooks;           // Hook address (0 = no hooks)

    // Short digest for display; not unique, never use it to look a pool up
    uint64_t id() const {
        uint64_t h = 0;
        for (auto b : currency0.addr) h = h * 31 + b;
        for (auto b : currency1.addr) h = h * 31 + b;
        h = h * 31 + fee;
        h = h * 31 + static_cast<uint64_t>(static_cast<uint32_t>(tick_spacing));
        for (auto b : hooks) h = h * 31 + b;
        return h;
    }

    const Currency& currency(Asset asset) const {
        return asset == Asset::A ? currency0 : currency1;
    }

    bool operator==(const PoolKey& other) const {
        return currency0 == other.currency0 &&
               currency1 == other.currency1 &&
               fee == other.fee &&
               tick_spacing == other.tick_spacing &&
               hooks == other.hooks;
    }
    bool operator!=(const PoolKey& other) const { return !(*this == other); }

    bool operator<(const PoolKey& other) const {
        if (currency0 != other.currency0) return currency0 < other.currency0;
        if (currency1 != other.currency1) return currency1 < other.currency1;
        if (fee != other.fee) return fee < other.fee;
        if (tick_spacing != other.tick_spacing) return tick_spacing < other.tick_spacing;
        return hooks < other.hooks;
    }
};

// =============================================================================
// Balance Delta (Signed Token Amounts)
// =============================================================================

// Negative: the caller owes the pool manager. Positive: the caller is owed.
struct BalanceDelta {
    I128 amount0;
    I128 amount1;

    I128 get(Asset asset) const { return asset == Asset::A ? amount0 : amount1; }

    static BalanceDelta of(Asset asset, I128 amount) {
        return asset == Asset::A ? BalanceDelta{amount, 0} : BalanceDelta{0, amount};
    }

    bool is_zero() const { return amount0 == 0 && amount1 == 0; }

    BalanceDelta operator+(const BalanceDelta& other) const {
        return {amount0 + other.amount0, amount1 + other.amount1};
    }

    BalanceDelta operator-(const BalanceDelta& other) const {
        return {amount0 - other.amount0, amount1 - other.amount1};
    }

    BalanceDelta operator-() const {
        return {-amount0, -amount1};
    }

    bool operator==(const BalanceDelta& other) const {
        return amount0 == other.amount0 && amount1 == other.amount1;
    }
    bool operator!=(const BalanceDelta& other) const { return !(*this == other); }
};

// =============================================================================
// Position Identity
// =============================================================================

// Composite key: the controller that owns the position plus a salt that
// disambiguates several positions under one controller.
struct PositionId {
    Address controller;
    Salt salt;

    bool operator==(const PositionId& other) const {
        return controller == other.controller && salt == other.salt;
    }
    bool operator!=(const PositionId& other) const { return !(*this == other); }
    bool operator<(const PositionId& other) const {
        return controller < other.controller ||
               (controller == other.controller && salt < other.salt);
    }
};

struct PositionIdHash {
    size_t operator()(const PositionId& p) const {
        uint64_t h = 0;
        for (auto b : p.controller) h = h * 31 + b;
        for (auto b : p.salt) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

struct AddressHash {
    size_t operator()(const Address& a) const {
        uint64_t h = 0;
        for (auto b : a) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// =============================================================================
// Modify Liquidity Parameters
// =============================================================================

struct ModifyLiquidityParams {
    Address controller;      // Owner of the position
    Salt salt;
    bool increase;           // true = add liquidity, false = remove
};

// =============================================================================
// Formatting
// =============================================================================

std::string to_string(I128 value);
std::string to_hex(const Address& addr);
std::string to_hex(const Salt& salt);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;
constexpr int32_t POOL_NOT_INITIALIZED = -1;
constexpr int32_t POOL_ALREADY_INITIALIZED = -2;
constexpr int32_t INVALID_CURRENCY = -6;
constexpr int32_t CURRENCIES_NOT_SORTED = -7;
constexpr int32_t INVALID_AMOUNT = -9;
constexpr int32_t INSUFFICIENT_BALANCE = -10;
constexpr int32_t INSUFFICIENT_UNMATCHED_LIQUIDITY = -11;
constexpr int32_t INVALID_ASSET_SELECTION = -12;
constexpr int32_t PARTIAL_MATCH_REJECTED = -13;
constexpr int32_t AMOUNT_OVERFLOW = -14;
constexpr int32_t TRANSFER_FAILED = -20;
constexpr int32_t SETTLEMENT_FAILED = -21;
constexpr int32_t REENTRANCY = -30;
constexpr int32_t HOOK_FAILED = -31;
constexpr int32_t UNAUTHORIZED = -40;

const char* message(int32_t code);
}

} // namespace sslp

#endif // SSLP_TYPES_HPP
