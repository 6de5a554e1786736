#ifndef NFTAMM_CURVE_REGISTRY_HPP
#define NFTAMM_CURVE_REGISTRY_HPP

#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "curve.hpp"
#include "ownable.hpp"

namespace nftamm {

// =============================================================================
// CurveRegistry - whitelist of bonding curves usable by new pairs
// =============================================================================

class CurveRegistry {
public:
    explicit CurveRegistry(const Ownable& ownable);

    CurveRegistry(const CurveRegistry&) = delete;
    CurveRegistry& operator=(const CurveRegistry&) = delete;

    // Owner-only. Re-applying the current status leaves the whitelist unchanged.
    // A curve address already bound to a different implementation is rejected
    // with INVALID_CONFIG.
    int32_t set_allowed(const Address& caller, const BondingCurve& curve, bool allowed);

    bool is_allowed(const Address& curve) const;

    // True only if the address is whitelisted for this exact implementation
    bool is_allowed(const BondingCurve& curve) const;

    const BondingCurve* find(const Address& curve) const;
    std::vector<Address> allowed_curves() const;
    size_t size() const;

private:
    const Ownable& ownable_;
    std::unordered_map<Address, const BondingCurve*, AddressHash> allowed_;
    mutable std::shared_mutex mutex_;
};

} // namespace nftamm

#endif // NFTAMM_CURVE_REGISTRY_HPP
