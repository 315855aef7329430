// =============================================================================
// types.cpp - Error descriptions and value formatting
// =============================================================================

#include "sslp/types.hpp"

namespace sslp {

namespace {

template <size_t N>
std::string hex_bytes(const std::array<uint8_t, N>& bytes) {
    static const char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + N * 2);
    for (uint8_t b : bytes) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

} // anonymous namespace

std::string to_string(I128 value) {
    if (value == 0) return "0";

    bool neg = value < 0;
    // Magnitude as unsigned so the minimum value does not overflow
    U128 mag = neg ? static_cast<U128>(0) - static_cast<U128>(value) : static_cast<U128>(value);

    std::string digits;
    while (mag != 0) {
        digits.push_back(static_cast<char>('0' + static_cast<int>(mag % 10)));
        mag /= 10;
    }
    if (neg) digits.push_back('-');
    return std::string(digits.rbegin(), digits.rend());
}

std::string to_hex(const Address& addr) { return hex_bytes(addr); }

std::string to_hex(const Salt& salt) { return hex_bytes(salt); }

namespace errors {

const char* message(int32_t code) {
    switch (code) {
    case OK: return "ok";
    case POOL_NOT_INITIALIZED: return "pool not initialized";
    case POOL_ALREADY_INITIALIZED: return "pool already initialized";
    case INVALID_CURRENCY: return "invalid currency";
    case CURRENCIES_NOT_SORTED: return "currencies not sorted";
    case INVALID_AMOUNT: return "invalid amount";
    case INSUFFICIENT_BALANCE: return "insufficient balance";
    case INSUFFICIENT_UNMATCHED_LIQUIDITY: return "insufficient unmatched liquidity";
    case INVALID_ASSET_SELECTION: return "invalid asset selection";
    case PARTIAL_MATCH_REJECTED: return "partial match rejected";
    case AMOUNT_OVERFLOW: return "amount overflow";
    case TRANSFER_FAILED: return "transfer failed";
    case SETTLEMENT_FAILED: return "settlement failed";
    case REENTRANCY: return "reentrancy";
    case HOOK_FAILED: return "hook failed";
    case UNAUTHORIZED: return "unauthorized";
    default: return "unknown error";
    }
}

} // namespace errors
} // namespace sslp
