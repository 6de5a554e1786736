// Linear bonding curve tests

#include <catch2/catch_test_macros.hpp>
#include <nftamm/curve.hpp>

using namespace nftamm;

namespace {
const LinearCurve curve(addresses::from_u64(0xc0));
}

TEST_CASE("LinearCurve single-step price moves", "[curve]") {
    SECTION("Increase adds delta") {
        auto next = curve.increase_price(100, 10);
        REQUIRE(next.has_value());
        REQUIRE(*next == 110);
    }

    SECTION("Increase reports overflow instead of wrapping") {
        REQUIRE_FALSE(curve.increase_price(U128_MAX - 5, 10).has_value());
        REQUIRE(curve.increase_price(U128_MAX - 10, 10) == U128_MAX);
    }

    SECTION("Decrease subtracts delta") {
        REQUIRE(curve.decrease_price(100, 10) == 90);
    }

    SECTION("Decrease saturates at zero") {
        REQUIRE(curve.decrease_price(5, 10) == 0);
        REQUIRE(curve.decrease_price(10, 10) == 0);
    }

    SECTION("Every delta and spot price validates") {
        REQUIRE(curve.validate_delta(0));
        REQUIRE(curve.validate_delta(U128_MAX));
        REQUIRE(curve.validate_spot_price(0));
        REQUIRE(curve.validate_spot_price(U128_MAX));
    }
}

TEST_CASE("LinearCurve buy quotes", "[curve]") {
    SECTION("Two items without fees") {
        // 110 + 120
        BuyQuote quote = curve.get_buy_info(100, 10, 2, 0, 0);
        REQUIRE(quote.error == CurveError::OK);
        REQUIRE(quote.new_spot_price == 120);
        REQUIRE(quote.new_delta == 10);
        REQUIRE(quote.input_value == 230);
        REQUIRE(quote.protocol_fee == 0);
    }

    SECTION("Trade and protocol fees are added") {
        // 10% trade fee = 23, 0.5% protocol fee = 1.15 rounded down
        BuyQuote quote = curve.get_buy_info(100, 10, 2, X18_ONE / 10, X18_ONE / 200);
        REQUIRE(quote.error == CurveError::OK);
        REQUIRE(quote.input_value == 254);
        REQUIRE(quote.protocol_fee == 1);
    }

    SECTION("Zero items is rejected") {
        REQUIRE(curve.get_buy_info(100, 10, 0, 0, 0).error == CurveError::INVALID_NUMITEMS);
    }

    SECTION("Spot price overflow is rejected") {
        BuyQuote quote = curve.get_buy_info(U128_MAX - 5, 10, 1, 0, 0);
        REQUIRE(quote.error == CurveError::SPOT_PRICE_OVERFLOW);
        REQUIRE(quote.input_value == 0);
    }
}

TEST_CASE("LinearCurve sell quotes", "[curve]") {
    SECTION("Three items without fees") {
        // 100 + 90 + 80
        SellQuote quote = curve.get_sell_info(100, 10, 3, 0, 0);
        REQUIRE(quote.error == CurveError::OK);
        REQUIRE(quote.new_spot_price == 70);
        REQUIRE(quote.output_value == 270);
    }

    SECTION("Fees are deducted from the output") {
        // 10% trade fee = 27, 0.5% protocol fee = 1.35 rounded down
        SellQuote quote = curve.get_sell_info(100, 10, 3, X18_ONE / 10, X18_ONE / 200);
        REQUIRE(quote.output_value == 242);
        REQUIRE(quote.protocol_fee == 1);
    }

    SECTION("Selling past zero caps the items priced") {
        // Only 15 and 5 are positive prices
        SellQuote quote = curve.get_sell_info(15, 10, 5, 0, 0);
        REQUIRE(quote.error == CurveError::OK);
        REQUIRE(quote.new_spot_price == 0);
        REQUIRE(quote.output_value == 20);
    }

    SECTION("Zero delta keeps the price flat") {
        SellQuote quote = curve.get_sell_info(100, 0, 3, 0, 0);
        REQUIRE(quote.new_spot_price == 100);
        REQUIRE(quote.output_value == 300);
    }

    SECTION("Zero items is rejected") {
        REQUIRE(curve.get_sell_info(100, 10, 0, 0, 0).error == CurveError::INVALID_NUMITEMS);
    }
}
