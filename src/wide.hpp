#ifndef NFTAMM_WIDE_HPP
#define NFTAMM_WIDE_HPP

// 256-bit intermediates for X18 products and curve quotes

#include <boost/multiprecision/cpp_int.hpp>

#include <cstdint>
#include <optional>

#include "nftamm/types.hpp"

namespace nftamm::wide {

using U256 = boost::multiprecision::uint256_t;

inline U256 widen(U128 value) {
    U256 out = static_cast<uint64_t>(value >> 64);
    out <<= 64;
    out |= static_cast<uint64_t>(value);
    return out;
}

inline std::optional<U128> narrow(const U256& value) {
    static const U256 limit = widen(U128_MAX);
    if (value > limit) return std::nullopt;

    const U256 mask = widen(~uint64_t(0));
    U128 hi = (value >> 64).convert_to<uint64_t>();
    U128 lo = (value & mask).convert_to<uint64_t>();
    return (hi << 64) | lo;
}

} // namespace nftamm::wide

#endif // NFTAMM_WIDE_HPP
