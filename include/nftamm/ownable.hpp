#ifndef NFTAMM_OWNABLE_HPP
#define NFTAMM_OWNABLE_HPP

#include <shared_mutex>

#include "types.hpp"

namespace nftamm {

// =============================================================================
// Ownable - single owner gate for administrative operations
// =============================================================================

class Ownable {
public:
    explicit Ownable(const Address& owner);

    Ownable(const Ownable&) = delete;
    Ownable& operator=(const Ownable&) = delete;

    Address owner() const;
    bool is_owner(const Address& caller) const;

    // Owner-only; the new owner must not be null
    int32_t transfer_ownership(const Address& caller, const Address& new_owner);

private:
    Address owner_;
    mutable std::shared_mutex mutex_;
};

} // namespace nftamm

#endif // NFTAMM_OWNABLE_HPP
