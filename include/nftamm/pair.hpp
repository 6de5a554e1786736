#ifndef NFTAMM_PAIR_HPP
#define NFTAMM_PAIR_HPP

#include <set>
#include <shared_mutex>
#include <vector>

#include "assets.hpp"
#include "curve.hpp"

namespace nftamm {

// =============================================================================
// Immutable pair configuration, fixed when the clone is created
// =============================================================================

struct PairImmutables {
    Address factory;
    const BondingCurve* curve;
    INftCollection* nft;
    PoolType pool_type;
    PairVariant variant;
    IToken* token;            // TOKEN variants only, null otherwise
};

// =============================================================================
// Pair - one trading venue (NFT collection x curve x fungible asset)
//
// Only initialization and holdings are modelled here; buy/sell mechanics live in
// the trading component.
// =============================================================================

class Pair : public INftReceiver {
public:
    Pair(const Address& address, const PairImmutables& immutables,
         const INativeLedger& native);

    Pair(const Pair&) = delete;
    Pair& operator=(const Pair&) = delete;

    const Address& address() const { return address_; }
    const PairImmutables& immutables() const { return immutables_; }
    const Address& factory() const { return immutables_.factory; }
    const BondingCurve& curve() const { return *immutables_.curve; }
    const INftCollection& nft() const { return *immutables_.nft; }
    PoolType pool_type() const { return immutables_.pool_type; }
    PairVariant variant() const { return immutables_.variant; }
    const IToken* token() const { return immutables_.token; }

    // One-shot. TOKEN and NFT pools must have a zero fee; TRADE pools need
    // fee < MAX_PAIR_FEE and a null (self) asset recipient. The curve must
    // accept delta and spot price.
    int32_t initialize(const Address& owner, const Address& asset_recipient,
                       U128 delta, U128 fee, U128 spot_price);

    bool initialized() const;
    Address owner() const;

    // Where trade proceeds go; a null recipient means the pair itself
    Address asset_recipient() const;

    U128 delta() const;
    U128 fee() const;
    U128 spot_price() const;

    std::vector<uint64_t> held_nft_ids() const;
    U128 fungible_balance() const;

    bool on_nft_received(const Address& collection, const Address& operator_addr,
                         const Address& from, uint64_t id) override;

private:
    Address address_;
    PairImmutables immutables_;
    const INativeLedger& native_;

    bool initialized_{false};
    Address owner_{};
    Address asset_recipient_{};
    U128 delta_{0};
    U128 fee_{0};
    U128 spot_price_{0};

    // Ids delivered through on_nft_received; the collection remains the source
    // of truth for ownership
    std::set<uint64_t> received_ids_;

    mutable std::shared_mutex mutex_;
};

} // namespace nftamm

#endif // NFTAMM_PAIR_HPP
