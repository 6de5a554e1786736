// Ownership, curve whitelist, access lists and protocol fee tests

#include <catch2/catch_test_macros.hpp>

#include <nftamm/access_controller.hpp>
#include <nftamm/curve_registry.hpp>
#include <nftamm/fee_controller.hpp>
#include <nftamm/memory_assets.hpp>

#include <stdexcept>

using namespace nftamm;

namespace {
constexpr Address OWNER = addresses::from_u64(0x01);
constexpr Address STRANGER = addresses::from_u64(0x5e);
constexpr Address TREASURY = addresses::from_u64(0xfa);
constexpr Address RECIPIENT = addresses::from_u64(0xfe);
}

TEST_CASE("Ownable", "[governance]") {
    REQUIRE_THROWS_AS(Ownable(ZERO_ADDRESS), std::invalid_argument);

    Ownable ownable(OWNER);
    REQUIRE(ownable.is_owner(OWNER));
    REQUIRE_FALSE(ownable.is_owner(STRANGER));

    SECTION("Only the owner can hand over") {
        REQUIRE(ownable.transfer_ownership(STRANGER, STRANGER) == errors::UNAUTHORIZED);
        REQUIRE(ownable.owner() == OWNER);
    }

    SECTION("The new owner must not be null") {
        REQUIRE(ownable.transfer_ownership(OWNER, ZERO_ADDRESS) == errors::ZERO_ADDRESS);
    }

    SECTION("Handover moves the gate") {
        REQUIRE(ownable.transfer_ownership(OWNER, STRANGER) == errors::OK);
        REQUIRE(ownable.is_owner(STRANGER));
        REQUIRE_FALSE(ownable.is_owner(OWNER));
    }
}

TEST_CASE("CurveRegistry whitelist", "[governance]") {
    Ownable ownable(OWNER);
    CurveRegistry registry(ownable);
    LinearCurve curve(addresses::from_u64(0xc0));

    SECTION("Non-owner is rejected") {
        REQUIRE(registry.set_allowed(STRANGER, curve, true) == errors::UNAUTHORIZED);
        REQUIRE_FALSE(registry.is_allowed(curve));
    }

    SECTION("Allow is idempotent") {
        REQUIRE(registry.set_allowed(OWNER, curve, true) == errors::OK);
        REQUIRE(registry.set_allowed(OWNER, curve, true) == errors::OK);
        REQUIRE(registry.size() == 1);
        REQUIRE(registry.is_allowed(curve.address()));
        REQUIRE(registry.find(curve.address()) == &curve);
    }

    SECTION("Disallow removes and repeats harmlessly") {
        REQUIRE(registry.set_allowed(OWNER, curve, true) == errors::OK);
        REQUIRE(registry.set_allowed(OWNER, curve, false) == errors::OK);
        REQUIRE(registry.set_allowed(OWNER, curve, false) == errors::OK);
        REQUIRE_FALSE(registry.is_allowed(curve));
        REQUIRE(registry.allowed_curves().empty());
    }

    SECTION("An address is bound to one implementation") {
        LinearCurve impostor(curve.address());
        REQUIRE(registry.set_allowed(OWNER, curve, true) == errors::OK);
        REQUIRE(registry.set_allowed(OWNER, impostor, true) == errors::INVALID_CONFIG);
        REQUIRE_FALSE(registry.is_allowed(impostor));
        REQUIRE(registry.is_allowed(curve));
    }
}

TEST_CASE("AccessController routers and call targets", "[governance]") {
    Ownable ownable(OWNER);
    AccessController access(ownable);
    const Address router = addresses::from_u64(0xa1);
    const Address target = addresses::from_u64(0xc1);

    SECTION("Non-owner is rejected") {
        REQUIRE(access.set_router_allowed(STRANGER, router, true) == errors::UNAUTHORIZED);
        REQUIRE(access.set_call_allowed(STRANGER, target, true) == errors::UNAUTHORIZED);
    }

    SECTION("Null router is rejected") {
        REQUIRE(access.set_router_allowed(OWNER, ZERO_ADDRESS, true) == errors::ZERO_ADDRESS);
    }

    SECTION("A router cannot become a call target") {
        REQUIRE(access.set_router_allowed(OWNER, router, true) == errors::OK);
        REQUIRE(access.set_call_allowed(OWNER, router, true) == errors::TARGET_IS_ROUTER);
        REQUIRE_FALSE(access.is_call_allowed(router));
    }

    SECTION("A call target cannot become a router") {
        REQUIRE(access.set_call_allowed(OWNER, target, true) == errors::OK);
        REQUIRE(access.set_router_allowed(OWNER, target, true) == errors::ROUTER_IS_CALL_TARGET);
        REQUIRE_FALSE(access.is_router_allowed(target));
    }

    SECTION("Disabling never conflicts") {
        REQUIRE(access.set_router_allowed(OWNER, router, true) == errors::OK);
        REQUIRE(access.set_call_allowed(OWNER, router, false) == errors::OK);
        REQUIRE(access.set_call_allowed(OWNER, target, true) == errors::OK);
        REQUIRE(access.set_router_allowed(OWNER, target, false) == errors::OK);
    }

    SECTION("A disabled router may become a call target and keeps its history") {
        REQUIRE(access.set_router_allowed(OWNER, router, true) == errors::OK);
        REQUIRE(access.set_router_allowed(OWNER, router, false) == errors::OK);

        auto status = access.router_status(router);
        REQUIRE(status.has_value());
        REQUIRE_FALSE(status->allowed);
        REQUIRE(status->was_ever_allowed);

        REQUIRE(access.set_call_allowed(OWNER, router, true) == errors::OK);
        REQUIRE(access.is_call_allowed(router));
    }

    SECTION("Unknown routers have no status") {
        REQUIRE_FALSE(access.router_status(router).has_value());
    }

    SECTION("Restoring a router puts back its earlier status") {
        REQUIRE(access.restore_router(STRANGER, router, std::nullopt) == errors::UNAUTHORIZED);

        REQUIRE(access.set_router_allowed(OWNER, router, true) == errors::OK);
        REQUIRE(access.restore_router(OWNER, router, std::nullopt) == errors::OK);
        REQUIRE_FALSE(access.router_status(router).has_value());

        REQUIRE(access.set_router_allowed(OWNER, router, true) == errors::OK);
        REQUIRE(access.restore_router(OWNER, router, RouterStatus{false, true}) == errors::OK);
        auto status = access.router_status(router);
        REQUIRE(status.has_value());
        REQUIRE_FALSE(status->allowed);
        REQUIRE(status->was_ever_allowed);
    }
}

TEST_CASE("FeeController", "[governance]") {
    Ownable ownable(OWNER);
    MemoryNativeLedger native;

    SECTION("Construction validates recipient and cap") {
        REQUIRE_THROWS_AS(FeeController(ownable, native, TREASURY, ZERO_ADDRESS, 0),
                          std::invalid_argument);
        REQUIRE_THROWS_AS(FeeController(ownable, native, TREASURY, RECIPIENT,
                                        MAX_PROTOCOL_FEE + 1),
                          std::invalid_argument);
    }

    FeeController fees(ownable, native, TREASURY, RECIPIENT, X18_ONE / 200);

    SECTION("Multiplier is capped at 10%") {
        REQUIRE(fees.change_multiplier(OWNER, MAX_PROTOCOL_FEE) == errors::OK);
        REQUIRE(fees.change_multiplier(OWNER, MAX_PROTOCOL_FEE + 1) ==
                errors::FEE_MULTIPLIER_TOO_LARGE);
        REQUIRE(fees.multiplier() == MAX_PROTOCOL_FEE);
    }

    SECTION("Recipient changes are owner-only and non-null") {
        REQUIRE(fees.change_recipient(STRANGER, STRANGER) == errors::UNAUTHORIZED);
        REQUIRE(fees.change_recipient(OWNER, ZERO_ADDRESS) == errors::ZERO_ADDRESS);
        REQUIRE(fees.change_recipient(OWNER, STRANGER) == errors::OK);
        REQUIRE(fees.recipient() == STRANGER);
    }

    SECTION("Protocol cut of a trade") {
        auto cut = fees.protocol_fee_for(1000);
        REQUIRE(cut.has_value());
        REQUIRE(*cut == 5);
    }

    SECTION("Native fees are swept to the recipient") {
        native.mint(TREASURY, 500);
        REQUIRE(fees.withdraw_native_fees(STRANGER).status == errors::UNAUTHORIZED);

        FeeWithdrawal result = fees.withdraw_native_fees(OWNER);
        REQUIRE(result.status == errors::OK);
        REQUIRE(result.amount == 500);
        REQUIRE(native.balance_of(RECIPIENT) == 500);
        REQUIRE(native.balance_of(TREASURY) == 0);
    }

    SECTION("Token fees are swept to the recipient") {
        MemoryToken token(addresses::from_u64(0x70), "TKN");
        token.mint(TREASURY, 42);

        FeeWithdrawal result = fees.withdraw_token_fees(OWNER, token);
        REQUIRE(result.status == errors::OK);
        REQUIRE(result.amount == 42);
        REQUIRE(token.balance_of(RECIPIENT) == 42);
    }

    SECTION("Sweeping an empty treasury moves nothing") {
        MemoryToken token(addresses::from_u64(0x70), "TKN");

        FeeWithdrawal native_result = fees.withdraw_native_fees(OWNER);
        REQUIRE(native_result.status == errors::OK);
        REQUIRE(native_result.amount == 0);

        FeeWithdrawal token_result = fees.withdraw_token_fees(OWNER, token);
        REQUIRE(token_result.status == errors::OK);
        REQUIRE(token_result.amount == 0);
        REQUIRE(native.balance_of(RECIPIENT) == 0);
        REQUIRE(token.balance_of(RECIPIENT) == 0);
    }
}
