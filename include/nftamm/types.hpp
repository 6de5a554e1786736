#ifndef NFTAMM_TYPES_HPP
#define NFTAMM_TYPES_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace nftamm {

// =============================================================================
// Identities (EVM-style 20-byte addresses)
// =============================================================================

using Address = std::array<uint8_t, 20>;

// The all-zero address stands for "null" (and for "self" as an asset recipient)
inline constexpr Address ZERO_ADDRESS{};

namespace addresses {

constexpr bool is_zero(const Address& addr) {
    for (auto b : addr) {
        if (b != 0) return false;
    }
    return true;
}

// Place a 64-bit number in the low bytes (handy for fixtures and configs)
constexpr Address from_u64(uint64_t value) {
    Address addr{};
    for (size_t i = 0; i < 8; ++i) {
        addr[19 - i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
    return addr;
}

} // namespace addresses

struct AddressHash {
    size_t operator()(const Address& addr) const noexcept {
        uint64_t h = 0;
        for (auto b : addr) h = h * 31 + b;
        return static_cast<size_t>(h);
    }
};

// "0x" + 40 lowercase hex digits
std::string to_hex(const Address& addr);

// Accepts an optional 0x prefix followed by exactly 40 hex digits
std::optional<Address> address_from_hex(std::string_view text);

// =============================================================================
// Fixed-Point Amounts (X18 = 18 decimal places)
// =============================================================================

using U128 = unsigned __int128;
using I128 = __int128;

inline constexpr U128 U128_MAX = ~U128(0);
inline constexpr U128 X18_ONE = 1000000000000000000ULL;  // 1e18

namespace x18 {

// floor(a * b / 1e18), exact for the full U128 range of a and b.
// Returns nullopt when the result does not fit in U128.
std::optional<U128> fmul(U128 a, U128 b);

// Parse "0.005", "1", "12.5" into X18; rejects signs, exponents and more than
// 18 fractional digits
std::optional<U128> parse(std::string_view text);

// Decimal rendering of a raw U128 (no scaling)
std::string to_string(U128 value);

} // namespace x18

// Protocol fee cap: 10%
inline constexpr U128 MAX_PROTOCOL_FEE = X18_ONE / 10;

// Trade pool fee cap: a TRADE pair's fee must be strictly below 90%
inline constexpr U128 MAX_PAIR_FEE = X18_ONE * 9 / 10;

// =============================================================================
// Pair Classification
// =============================================================================

enum class AssetKind : uint8_t {
    NATIVE = 0,
    TOKEN = 1
};

enum class PoolType : uint8_t {
    TOKEN = 0,   // buys NFTs from traders
    NFT = 1,     // sells NFTs to traders
    TRADE = 2    // both, charges a per-trade fee
};

enum class PairVariant : uint8_t {
    ENUMERABLE_NATIVE = 0,
    MISSING_ENUMERABLE_NATIVE = 1,
    ENUMERABLE_TOKEN = 2,
    MISSING_ENUMERABLE_TOKEN = 3
};

inline constexpr size_t PAIR_VARIANT_COUNT = 4;

constexpr PairVariant variant_of(AssetKind kind, bool enumerable) {
    if (kind == AssetKind::NATIVE) {
        return enumerable ? PairVariant::ENUMERABLE_NATIVE
                          : PairVariant::MISSING_ENUMERABLE_NATIVE;
    }
    return enumerable ? PairVariant::ENUMERABLE_TOKEN
                      : PairVariant::MISSING_ENUMERABLE_TOKEN;
}

constexpr AssetKind asset_kind_of(PairVariant variant) {
    return (variant == PairVariant::ENUMERABLE_TOKEN ||
            variant == PairVariant::MISSING_ENUMERABLE_TOKEN)
               ? AssetKind::TOKEN
               : AssetKind::NATIVE;
}

constexpr bool is_enumerable(PairVariant variant) {
    return variant == PairVariant::ENUMERABLE_NATIVE ||
           variant == PairVariant::ENUMERABLE_TOKEN;
}

constexpr bool is_known_variant(PairVariant variant) {
    return static_cast<size_t>(variant) < PAIR_VARIANT_COUNT;
}

const char* to_string(PairVariant variant);
const char* to_string(PoolType type);
const char* to_string(AssetKind kind);

// =============================================================================
// Error Codes
// =============================================================================

namespace errors {
constexpr int32_t OK = 0;

// Validation: malformed input, rejected before any state change
constexpr int32_t ZERO_ADDRESS = -1;
constexpr int32_t FEE_MULTIPLIER_TOO_LARGE = -2;
constexpr int32_t INVALID_VARIANT = -3;
constexpr int32_t INVALID_AMOUNT = -4;
constexpr int32_t INVALID_CONFIG = -5;
constexpr int32_t PAIR_ALREADY_INITIALIZED = -10;
constexpr int32_t INVALID_PAIR_FEE = -11;
constexpr int32_t INVALID_ASSET_RECIPIENT = -12;
constexpr int32_t INVALID_DELTA = -13;
constexpr int32_t INVALID_SPOT_PRICE = -14;

// Authorization
constexpr int32_t UNAUTHORIZED = -20;

// Policy
constexpr int32_t CURVE_NOT_WHITELISTED = -30;
constexpr int32_t TARGET_IS_ROUTER = -31;
constexpr int32_t ROUTER_IS_CALL_TARGET = -32;
constexpr int32_t REENTRANCY = -33;

// Transfer
constexpr int32_t INSUFFICIENT_BALANCE = -40;
constexpr int32_t INSUFFICIENT_ALLOWANCE = -41;
constexpr int32_t NOT_TOKEN_OWNER = -42;
constexpr int32_t NOT_APPROVED = -43;
constexpr int32_t RECEIVER_REJECTED = -44;
constexpr int32_t NONEXISTENT_TOKEN = -45;
}

enum class ErrorKind : uint8_t {
    NONE = 0,
    VALIDATION = 1,
    AUTHORIZATION = 2,
    POLICY = 3,
    TRANSFER = 4
};

ErrorKind error_kind(int32_t code);
const char* error_name(int32_t code);

} // namespace nftamm

#endif // NFTAMM_TYPES_HPP
