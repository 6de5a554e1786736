#ifndef NFTAMM_CURVE_HPP
#define NFTAMM_CURVE_HPP

#include <cstdint>
#include <optional>

#include "types.hpp"

namespace nftamm {

// =============================================================================
// Curve Quotes
// =============================================================================

enum class CurveError : uint8_t {
    OK = 0,
    INVALID_NUMITEMS = 1,     // quote for zero items
    SPOT_PRICE_OVERFLOW = 2   // new spot price or quoted value not representable
};

struct BuyQuote {
    CurveError error;
    U128 new_spot_price;
    U128 new_delta;
    U128 input_value;     // total the trader pays, fees included
    U128 protocol_fee;
};

struct SellQuote {
    CurveError error;
    U128 new_spot_price;
    U128 new_delta;
    U128 output_value;    // total the trader receives, fees deducted
    U128 protocol_fee;
};

// =============================================================================
// BondingCurve - pricing strategy interface
//
// Implementations are pure: every method is a deterministic function of its
// arguments. Price increases must never wrap; an unrepresentable result is
// reported as a failure.
// =============================================================================

class BondingCurve {
public:
    explicit BondingCurve(const Address& address) : address_(address) {}
    virtual ~BondingCurve() = default;

    BondingCurve(const BondingCurve&) = delete;
    BondingCurve& operator=(const BondingCurve&) = delete;

    const Address& address() const { return address_; }

    virtual const char* name() const = 0;

    // Spot price after one step up; nullopt if the result overflows
    virtual std::optional<U128> increase_price(U128 spot_price, U128 delta) const = 0;

    // Spot price after one step down (implementations decide the floor)
    virtual U128 decrease_price(U128 spot_price, U128 delta) const = 0;

    virtual bool validate_delta(U128 delta) const = 0;
    virtual bool validate_spot_price(U128 spot_price) const = 0;

    // Quote for a trader buying num_items NFTs from a pair
    virtual BuyQuote get_buy_info(U128 spot_price, U128 delta, uint64_t num_items,
                                  U128 fee_multiplier,
                                  U128 protocol_fee_multiplier) const = 0;

    // Quote for a trader selling num_items NFTs into a pair
    virtual SellQuote get_sell_info(U128 spot_price, U128 delta, uint64_t num_items,
                                    U128 fee_multiplier,
                                    U128 protocol_fee_multiplier) const = 0;

private:
    Address address_;
};

// =============================================================================
// LinearCurve - price moves by a constant delta per item
// =============================================================================

class LinearCurve final : public BondingCurve {
public:
    explicit LinearCurve(const Address& address) : BondingCurve(address) {}

    const char* name() const override { return "LinearCurve"; }

    std::optional<U128> increase_price(U128 spot_price, U128 delta) const override;

    // Saturates at zero when delta exceeds the spot price
    U128 decrease_price(U128 spot_price, U128 delta) const override;

    // Every delta and spot price is valid on a linear curve
    bool validate_delta(U128) const override { return true; }
    bool validate_spot_price(U128) const override { return true; }

    BuyQuote get_buy_info(U128 spot_price, U128 delta, uint64_t num_items,
                          U128 fee_multiplier,
                          U128 protocol_fee_multiplier) const override;

    SellQuote get_sell_info(U128 spot_price, U128 delta, uint64_t num_items,
                            U128 fee_multiplier,
                            U128 protocol_fee_multiplier) const override;
};

} // namespace nftamm

#endif // NFTAMM_CURVE_HPP
