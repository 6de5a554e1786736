// =============================================================================
// pair.cpp - Pair initialization and holdings
// =============================================================================

#include "nftamm/pair.hpp"

#include <mutex>

namespace nftamm {

Pair::Pair(const Address& address, const PairImmutables& immutables,
           const INativeLedger& native)
    : address_(address)
    , immutables_(immutables)
    , native_(native) {}

int32_t Pair::initialize(const Address& owner, const Address& asset_recipient,
                         U128 delta, U128 fee, U128 spot_price) {
    std::unique_lock lock(mutex_);

    if (initialized_) {
        return errors::PAIR_ALREADY_INITIALIZED;
    }
    if (addresses::is_zero(owner)) {
        return errors::ZERO_ADDRESS;
    }

    if (immutables_.pool_type == PoolType::TRADE) {
        if (fee >= MAX_PAIR_FEE) {
            return errors::INVALID_PAIR_FEE;
        }
        if (!addresses::is_zero(asset_recipient)) {
            return errors::INVALID_ASSET_RECIPIENT;
        }
    } else if (fee != 0) {
        return errors::INVALID_PAIR_FEE;
    }

    const BondingCurve& curve = *immutables_.curve;
    if (!curve.validate_delta(delta)) {
        return errors::INVALID_DELTA;
    }
    if (!curve.validate_spot_price(spot_price)) {
        return errors::INVALID_SPOT_PRICE;
    }

    owner_ = owner;
    asset_recipient_ = asset_recipient;
    delta_ = delta;
    fee_ = fee;
    spot_price_ = spot_price;
    initialized_ = true;
    return errors::OK;
}

bool Pair::initialized() const {
    std::shared_lock lock(mutex_);
    return initialized_;
}

Address Pair::owner() const {
    std::shared_lock lock(mutex_);
    return owner_;
}

Address Pair::asset_recipient() const {
    std::shared_lock lock(mutex_);
    return addresses::is_zero(asset_recipient_) ? address_ : asset_recipient_;
}

U128 Pair::delta() const {
    std::shared_lock lock(mutex_);
    return delta_;
}

U128 Pair::fee() const {
    std::shared_lock lock(mutex_);
    return fee_;
}

U128 Pair::spot_price() const {
    std::shared_lock lock(mutex_);
    return spot_price_;
}

std::vector<uint64_t> Pair::held_nft_ids() const {
    const INftCollection& collection = *immutables_.nft;
    if (is_enumerable(immutables_.variant)) {
        return collection.tokens_of_owner(address_);
    }

    std::vector<uint64_t> ids;
    std::shared_lock lock(mutex_);
    for (uint64_t id : received_ids_) {
        auto holder = collection.owner_of(id);
        if (holder && *holder == address_) ids.push_back(id);
    }
    return ids;
}

U128 Pair::fungible_balance() const {
    if (asset_kind_of(immutables_.variant) == AssetKind::TOKEN) {
        return immutables_.token ? immutables_.token->balance_of(address_) : 0;
    }
    return native_.balance_of(address_);
}

bool Pair::on_nft_received(const Address& collection, const Address&,
                           const Address&, uint64_t id) {
    if (!is_enumerable(immutables_.variant) && collection == immutables_.nft->address()) {
        std::unique_lock lock(mutex_);
        received_ids_.insert(id);
    }
    return true;
}

} // namespace nftamm
