// =============================================================================
// types.cpp - Address, fixed-point and error code helpers
// =============================================================================

#include "nftamm/types.hpp"
#include "wide.hpp"

#include <algorithm>

namespace nftamm {

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

// =============================================================================
// Address Helpers
// =============================================================================

std::string to_hex(const Address& addr) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out = "0x";
    out.reserve(2 + addr.size() * 2);
    for (uint8_t b : addr) {
        out.push_back(digits[b >> 4]);
        out.push_back(digits[b & 0x0F]);
    }
    return out;
}

std::optional<Address> address_from_hex(std::string_view text) {
    if (text.size() >= 2 && text[0] == '0' && (text[1] == 'x' || text[1] == 'X')) {
        text.remove_prefix(2);
    }
    if (text.size() != 40) return std::nullopt;

    Address addr{};
    for (size_t i = 0; i < addr.size(); ++i) {
        int hi = hex_value(text[2 * i]);
        int lo = hex_value(text[2 * i + 1]);
        if (hi < 0 || lo < 0) return std::nullopt;
        addr[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return addr;
}

// =============================================================================
// X18 Arithmetic
// =============================================================================

namespace x18 {

std::optional<U128> fmul(U128 a, U128 b) {
    wide::U256 product = wide::widen(a) * wide::widen(b);
    product /= wide::widen(X18_ONE);
    return wide::narrow(product);
}

std::optional<U128> parse(std::string_view text) {
    if (text.empty()) return std::nullopt;

    auto dot = text.find('.');
    std::string_view whole = text.substr(0, dot);
    std::string_view frac = dot == std::string_view::npos ? std::string_view{}
                                                          : text.substr(dot + 1);
    if (whole.empty() && frac.empty()) return std::nullopt;
    if (frac.size() > 18) return std::nullopt;

    wide::U256 value = 0;
    for (char c : whole) {
        if (c < '0' || c > '9') return std::nullopt;
        value = value * 10 + static_cast<unsigned>(c - '0');
        if (value > wide::widen(U128_MAX)) return std::nullopt;
    }
    value *= wide::widen(X18_ONE);

    wide::U256 scale = wide::widen(X18_ONE);
    for (char c : frac) {
        if (c < '0' || c > '9') return std::nullopt;
        scale /= 10;
        value += scale * static_cast<unsigned>(c - '0');
    }
    return wide::narrow(value);
}

std::string to_string(U128 value) {
    if (value == 0) return "0";
    std::string out;
    while (value != 0) {
        out.push_back(static_cast<char>('0' + static_cast<int>(value % 10)));
        value /= 10;
    }
    std::reverse(out.begin(), out.end());
    return out;
}

} // namespace x18

// =============================================================================
// Enum Names
// =============================================================================

const char* to_string(PairVariant variant) {
    switch (variant) {
        case PairVariant::ENUMERABLE_NATIVE: return "ENUMERABLE_NATIVE";
        case PairVariant::MISSING_ENUMERABLE_NATIVE: return "MISSING_ENUMERABLE_NATIVE";
        case PairVariant::ENUMERABLE_TOKEN: return "ENUMERABLE_TOKEN";
        case PairVariant::MISSING_ENUMERABLE_TOKEN: return "MISSING_ENUMERABLE_TOKEN";
    }
    return "UNKNOWN";
}

const char* to_string(PoolType type) {
    switch (type) {
        case PoolType::TOKEN: return "TOKEN";
        case PoolType::NFT: return "NFT";
        case PoolType::TRADE: return "TRADE";
    }
    return "UNKNOWN";
}

const char* to_string(AssetKind kind) {
    switch (kind) {
        case AssetKind::NATIVE: return "NATIVE";
        case AssetKind::TOKEN: return "TOKEN";
    }
    return "UNKNOWN";
}

// =============================================================================
// Error Classification
// =============================================================================

ErrorKind error_kind(int32_t code) {
    if (code == errors::OK) return ErrorKind::NONE;
    if (code == errors::UNAUTHORIZED) return ErrorKind::AUTHORIZATION;
    if (code <= -30 && code > -40) return ErrorKind::POLICY;
    if (code <= -40 && code > -50) return ErrorKind::TRANSFER;
    return ErrorKind::VALIDATION;
}

const char* error_name(int32_t code) {
    switch (code) {
        case errors::OK: return "OK";
        case errors::ZERO_ADDRESS: return "ZERO_ADDRESS";
        case errors::FEE_MULTIPLIER_TOO_LARGE: return "FEE_MULTIPLIER_TOO_LARGE";
        case errors::INVALID_VARIANT: return "INVALID_VARIANT";
        case errors::INVALID_AMOUNT: return "INVALID_AMOUNT";
        case errors::INVALID_CONFIG: return "INVALID_CONFIG";
        case errors::PAIR_ALREADY_INITIALIZED: return "PAIR_ALREADY_INITIALIZED";
        case errors::INVALID_PAIR_FEE: return "INVALID_PAIR_FEE";
        case errors::INVALID_ASSET_RECIPIENT: return "INVALID_ASSET_RECIPIENT";
        case errors::INVALID_DELTA: return "INVALID_DELTA";
        case errors::INVALID_SPOT_PRICE: return "INVALID_SPOT_PRICE";
        case errors::UNAUTHORIZED: return "UNAUTHORIZED";
        case errors::CURVE_NOT_WHITELISTED: return "CURVE_NOT_WHITELISTED";
        case errors::TARGET_IS_ROUTER: return "TARGET_IS_ROUTER";
        case errors::ROUTER_IS_CALL_TARGET: return "ROUTER_IS_CALL_TARGET";
        case errors::REENTRANCY: return "REENTRANCY";
        case errors::INSUFFICIENT_BALANCE: return "INSUFFICIENT_BALANCE";
        case errors::INSUFFICIENT_ALLOWANCE: return "INSUFFICIENT_ALLOWANCE";
        case errors::NOT_TOKEN_OWNER: return "NOT_TOKEN_OWNER";
        case errors::NOT_APPROVED: return "NOT_APPROVED";
        case errors::RECEIVER_REJECTED: return "RECEIVER_REJECTED";
        case errors::NONEXISTENT_TOKEN: return "NONEXISTENT_TOKEN";
        default: return "UNKNOWN_ERROR";
    }
}

} // namespace nftamm
