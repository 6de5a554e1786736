// Address, fixed-point and error code tests

#include <catch2/catch_test_macros.hpp>
#include <nftamm/types.hpp>

#include <string>

using namespace nftamm;

TEST_CASE("Address hex", "[types]") {
    const Address addr = addresses::from_u64(0xabcdef);
    REQUIRE(to_hex(addr) == "0x0000000000000000000000000000000000abcdef");
    REQUIRE(address_from_hex("0x0000000000000000000000000000000000ABCDEF") == addr);
    REQUIRE(address_from_hex("0000000000000000000000000000000000abcdef") == addr);
    REQUIRE_FALSE(address_from_hex("0xabc").has_value());
    REQUIRE_FALSE(address_from_hex("0x000000000000000000000000000000000000zzzz").has_value());
    REQUIRE(addresses::is_zero(ZERO_ADDRESS));
    REQUIRE_FALSE(addresses::is_zero(addr));
}

TEST_CASE("X18 parsing and multiplication", "[types]") {
    REQUIRE(x18::parse("1") == X18_ONE);
    REQUIRE(x18::parse("0.1") == X18_ONE / 10);
    REQUIRE(x18::parse(".5") == X18_ONE / 2);
    REQUIRE_FALSE(x18::parse("").has_value());
    REQUIRE_FALSE(x18::parse("1e3").has_value());
    REQUIRE_FALSE(x18::parse("0.0000000000000000001").has_value());

    REQUIRE(x18::fmul(1000, X18_ONE / 200) == U128(5));
    REQUIRE_FALSE(x18::fmul(U128_MAX, 2 * X18_ONE).has_value());
    REQUIRE(x18::to_string(X18_ONE) == "1000000000000000000");
}

TEST_CASE("Pair variants", "[types]") {
    REQUIRE(variant_of(AssetKind::NATIVE, true) == PairVariant::ENUMERABLE_NATIVE);
    REQUIRE(variant_of(AssetKind::NATIVE, false) == PairVariant::MISSING_ENUMERABLE_NATIVE);
    REQUIRE(variant_of(AssetKind::TOKEN, true) == PairVariant::ENUMERABLE_TOKEN);
    REQUIRE(variant_of(AssetKind::TOKEN, false) == PairVariant::MISSING_ENUMERABLE_TOKEN);
    REQUIRE(asset_kind_of(PairVariant::MISSING_ENUMERABLE_TOKEN) == AssetKind::TOKEN);
    REQUIRE_FALSE(is_enumerable(PairVariant::MISSING_ENUMERABLE_NATIVE));
    REQUIRE_FALSE(is_known_variant(static_cast<PairVariant>(4)));
}

TEST_CASE("Error classification", "[types]") {
    REQUIRE(error_kind(errors::OK) == ErrorKind::NONE);
    REQUIRE(error_kind(errors::ZERO_ADDRESS) == ErrorKind::VALIDATION);
    REQUIRE(error_kind(errors::UNAUTHORIZED) == ErrorKind::AUTHORIZATION);
    REQUIRE(error_kind(errors::ROUTER_IS_CALL_TARGET) == ErrorKind::POLICY);
    REQUIRE(error_kind(errors::NOT_TOKEN_OWNER) == ErrorKind::TRANSFER);
    REQUIRE(std::string(error_name(errors::CURVE_NOT_WHITELISTED)) == "CURVE_NOT_WHITELISTED");
}
