// =============================================================================
// ownable.cpp - Owner gate
// =============================================================================

#include "nftamm/ownable.hpp"

#include <mutex>
#include <stdexcept>

namespace nftamm {

Ownable::Ownable(const Address& owner) : owner_(owner) {
    if (addresses::is_zero(owner)) {
        throw std::invalid_argument("Ownable: owner must not be the zero address");
    }
}

Address Ownable::owner() const {
    std::shared_lock lock(mutex_);
    return owner_;
}

bool Ownable::is_owner(const Address& caller) const {
    std::shared_lock lock(mutex_);
    return caller == owner_;
}

int32_t Ownable::transfer_ownership(const Address& caller, const Address& new_owner) {
    std::unique_lock lock(mutex_);
    if (caller != owner_) {
        return errors::UNAUTHORIZED;
    }
    if (addresses::is_zero(new_owner)) {
        return errors::ZERO_ADDRESS;
    }
    owner_ = new_owner;
    return errors::OK;
}

} // namespace nftamm
