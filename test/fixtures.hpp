// Shared test fixtures

#ifndef NFTAMM_TEST_FIXTURES_HPP
#define NFTAMM_TEST_FIXTURES_HPP

#include <catch2/catch_test_macros.hpp>

#include <nftamm/memory_assets.hpp>
#include <nftamm/pair_factory.hpp>

#include <utility>
#include <vector>

namespace nftamm::test {

inline constexpr Address OWNER = addresses::from_u64(0x01);
inline constexpr Address ALICE = addresses::from_u64(0xa1);
inline constexpr Address BOB = addresses::from_u64(0xb0);
inline constexpr Address FACTORY = addresses::from_u64(0xfa);
inline constexpr Address FEE_RECIPIENT = addresses::from_u64(0xfe);

inline constexpr U128 DEFAULT_PROTOCOL_FEE = X18_ONE / 200;  // 0.5%

inline TemplateSet default_templates() {
    return TemplateSet{addresses::from_u64(0xe1), addresses::from_u64(0xe2),
                       addresses::from_u64(0xe3), addresses::from_u64(0xe4)};
}

// Records every notification in arrival order
class RecordingListener : public FactoryListener {
public:
    std::vector<NewPairEvent> new_pairs;
    std::vector<Address> token_deposits;
    std::vector<Address> nft_deposits;
    std::vector<Address> fee_recipients;
    std::vector<U128> fee_multipliers;
    std::vector<std::pair<Address, bool>> curve_updates;
    std::vector<std::pair<Address, bool>> call_target_updates;
    std::vector<std::pair<Address, bool>> router_updates;

    void on_new_pair(const NewPairEvent& event) override { new_pairs.push_back(event); }
    void on_token_deposit(const Address& pair) override { token_deposits.push_back(pair); }
    void on_nft_deposit(const Address& pair) override { nft_deposits.push_back(pair); }
    void on_protocol_fee_recipient_update(const Address& recipient) override {
        fee_recipients.push_back(recipient);
    }
    void on_protocol_fee_multiplier_update(U128 multiplier) override {
        fee_multipliers.push_back(multiplier);
    }
    void on_bonding_curve_status_update(const Address& curve, bool allowed) override {
        curve_updates.emplace_back(curve, allowed);
    }
    void on_call_target_status_update(const Address& target, bool allowed) override {
        call_target_updates.emplace_back(target, allowed);
    }
    void on_router_status_update(const Address& router, bool allowed) override {
        router_updates.emplace_back(router, allowed);
    }
};

// A factory with a whitelisted linear curve, an enumerable and a
// non-enumerable collection and a fungible token. ALICE holds NFTs 1-4 of both
// collections, 1000 native units and 1000 tokens, all approved for the factory.
struct FactoryFixture {
    MemoryNativeLedger native;
    ReceiverRegistry receivers;
    PairFactory factory{FACTORY, OWNER, default_templates(), FEE_RECIPIENT,
                        DEFAULT_PROTOCOL_FEE, native, receivers};

    LinearCurve curve{addresses::from_u64(0xc0)};
    MemoryNftCollection enumerable_nft{addresses::from_u64(0x4e), true, &receivers};
    MemoryNftCollection plain_nft{addresses::from_u64(0x4f), false, &receivers};
    MemoryToken token{addresses::from_u64(0x70), "TKN"};

    RecordingListener events;

    FactoryFixture() {
        REQUIRE(factory.set_bonding_curve_allowed(OWNER, curve, true) == errors::OK);
        for (uint64_t id = 1; id <= 4; ++id) {
            REQUIRE(enumerable_nft.mint(ALICE, id) == errors::OK);
            REQUIRE(plain_nft.mint(ALICE, id) == errors::OK);
        }
        enumerable_nft.set_approval_for_all(ALICE, FACTORY, true);
        plain_nft.set_approval_for_all(ALICE, FACTORY, true);
        native.mint(ALICE, 1000);
        token.mint(ALICE, 1000);
        token.approve(ALICE, FACTORY, 1000);
        factory.set_listener(&events);
    }

    CreatePairParams native_params(INftCollection& nft, std::vector<uint64_t> ids,
                                   U128 amount) {
        CreatePairParams params{};
        params.asset_kind = AssetKind::NATIVE;
        params.nft = &nft;
        params.curve = &curve;
        params.token = nullptr;
        params.asset_recipient = ZERO_ADDRESS;
        params.pool_type = PoolType::NFT;
        params.delta = 10;
        params.fee = 0;
        params.spot_price = 100;
        params.initial_nft_ids = std::move(ids);
        params.initial_amount = amount;
        return params;
    }

    CreatePairParams token_params(INftCollection& nft, std::vector<uint64_t> ids,
                                  U128 amount) {
        CreatePairParams params = native_params(nft, std::move(ids), amount);
        params.asset_kind = AssetKind::TOKEN;
        params.token = &token;
        return params;
    }
};

} // namespace nftamm::test

#endif // NFTAMM_TEST_FIXTURES_HPP
