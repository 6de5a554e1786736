// =============================================================================
// curve.cpp - LinearCurve pricing
// =============================================================================

#include "nftamm/curve.hpp"
#include "wide.hpp"

namespace nftamm {

namespace {

using wide::U256;

const U256& x18_one() {
    static const U256 one = wide::widen(X18_ONE);
    return one;
}

BuyQuote buy_error(CurveError error) {
    return BuyQuote{error, 0, 0, 0, 0};
}

SellQuote sell_error(CurveError error) {
    return SellQuote{error, 0, 0, 0, 0};
}

} // namespace

// =============================================================================
// Single-step price moves
// =============================================================================

std::optional<U128> LinearCurve::increase_price(U128 spot_price, U128 delta) const {
    if (delta > U128_MAX - spot_price) {
        return std::nullopt;
    }
    return spot_price + delta;
}

U128 LinearCurve::decrease_price(U128 spot_price, U128 delta) const {
    return spot_price >= delta ? spot_price - delta : 0;
}

// =============================================================================
// Buy quote
//
// Item k (1-based) costs spot + k * delta, so n items cost
// n * (spot + delta) + n * (n - 1) * delta / 2.
// =============================================================================

BuyQuote LinearCurve::get_buy_info(U128 spot_price, U128 delta, uint64_t num_items,
                                   U128 fee_multiplier,
                                   U128 protocol_fee_multiplier) const {
    if (num_items == 0) {
        return buy_error(CurveError::INVALID_NUMITEMS);
    }

    const U256 spot = wide::widen(spot_price);
    const U256 step = wide::widen(delta);
    const U256 n = num_items;

    auto new_spot = wide::narrow(spot + step * n);
    if (!new_spot) {
        return buy_error(CurveError::SPOT_PRICE_OVERFLOW);
    }

    const U256 buy_spot = spot + step;
    auto base = wide::narrow(n * buy_spot + (n * (n - 1) * step) / 2);
    if (!base) {
        return buy_error(CurveError::SPOT_PRICE_OVERFLOW);
    }

    const U256 value = wide::widen(*base);
    const U256 protocol_fee = value * wide::widen(protocol_fee_multiplier) / x18_one();
    const U256 trade_fee = value * wide::widen(fee_multiplier) / x18_one();

    auto input = wide::narrow(value + trade_fee + protocol_fee);
    auto protocol = wide::narrow(protocol_fee);
    if (!input || !protocol) {
        return buy_error(CurveError::SPOT_PRICE_OVERFLOW);
    }

    return BuyQuote{CurveError::OK, *new_spot, delta, *input, *protocol};
}

// =============================================================================
// Sell quote
//
// Item k (0-based) pays spot - k * delta. Once the price would go below zero the
// quote is capped at the items sold before reaching it and the new spot is 0.
// =============================================================================

SellQuote LinearCurve::get_sell_info(U128 spot_price, U128 delta, uint64_t num_items,
                                     U128 fee_multiplier,
                                     U128 protocol_fee_multiplier) const {
    if (num_items == 0) {
        return sell_error(CurveError::INVALID_NUMITEMS);
    }

    const U256 spot = wide::widen(spot_price);
    const U256 step = wide::widen(delta);
    U256 n = num_items;

    U128 new_spot = 0;
    const U256 total_decrease = step * n;
    if (spot < total_decrease) {
        // delta > 0 here, otherwise total_decrease would be zero
        n = spot / step + 1;
    } else {
        new_spot = spot_price - static_cast<U128>(*wide::narrow(total_decrease));
    }

    auto base = wide::narrow(spot * n - (n * (n - 1) * step) / 2);
    if (!base) {
        return sell_error(CurveError::SPOT_PRICE_OVERFLOW);
    }

    const U256 value = wide::widen(*base);
    const U256 protocol_fee = value * wide::widen(protocol_fee_multiplier) / x18_one();
    const U256 trade_fee = value * wide::widen(fee_multiplier) / x18_one();

    const U256 deductions = trade_fee + protocol_fee;
    const U256 output = deductions >= value ? U256(0) : value - deductions;

    auto protocol = wide::narrow(protocol_fee);
    if (!protocol) {
        return sell_error(CurveError::SPOT_PRICE_OVERFLOW);
    }

    return SellQuote{CurveError::OK, new_spot, delta, *wide::narrow(output), *protocol};
}

} // namespace nftamm
