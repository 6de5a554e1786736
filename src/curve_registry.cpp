// =============================================================================
// curve_registry.cpp - Bonding curve whitelist
// =============================================================================

#include "nftamm/curve_registry.hpp"

#include <mutex>

namespace nftamm {

CurveRegistry::CurveRegistry(const Ownable& ownable) : ownable_(ownable) {}

int32_t CurveRegistry::set_allowed(const Address& caller, const BondingCurve& curve,
                                   bool allowed) {
    if (!ownable_.is_owner(caller)) {
        return errors::UNAUTHORIZED;
    }

    std::unique_lock lock(mutex_);

    auto it = allowed_.find(curve.address());
    if (!allowed) {
        if (it != allowed_.end()) allowed_.erase(it);
        return errors::OK;
    }

    if (it != allowed_.end()) {
        return it->second == &curve ? errors::OK : errors::INVALID_CONFIG;
    }
    allowed_.emplace(curve.address(), &curve);
    return errors::OK;
}

bool CurveRegistry::is_allowed(const Address& curve) const {
    std::shared_lock lock(mutex_);
    return allowed_.find(curve) != allowed_.end();
}

bool CurveRegistry::is_allowed(const BondingCurve& curve) const {
    std::shared_lock lock(mutex_);
    auto it = allowed_.find(curve.address());
    return it != allowed_.end() && it->second == &curve;
}

const BondingCurve* CurveRegistry::find(const Address& curve) const {
    std::shared_lock lock(mutex_);
    auto it = allowed_.find(curve);
    return it != allowed_.end() ? it->second : nullptr;
}

std::vector<Address> CurveRegistry::allowed_curves() const {
    std::shared_lock lock(mutex_);
    std::vector<Address> out;
    out.reserve(allowed_.size());
    for (const auto& [addr, curve] : allowed_) {
        out.push_back(addr);
    }
    return out;
}

size_t CurveRegistry::size() const {
    std::shared_lock lock(mutex_);
    return allowed_.size();
}

} // namespace nftamm
