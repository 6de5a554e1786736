#ifndef NFTAMM_ACCESS_CONTROLLER_HPP
#define NFTAMM_ACCESS_CONTROLLER_HPP

#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <unordered_set>

#include "ownable.hpp"

namespace nftamm {

struct RouterStatus {
    bool allowed;
    bool was_ever_allowed;
};

// =============================================================================
// AccessController - arbitrary call targets and trusted routers
//
// Invariant: no address is an allowed call target and an allowed router at the
// same time. Routers move pair assets on a trader's behalf; a target that pairs
// may call arbitrarily must never hold that trust.
// =============================================================================

class AccessController {
public:
    explicit AccessController(const Ownable& ownable);

    AccessController(const AccessController&) = delete;
    AccessController& operator=(const AccessController&) = delete;

    // Owner-only. Enabling fails with TARGET_IS_ROUTER while target is an
    // allowed router.
    int32_t set_call_allowed(const Address& caller, const Address& target, bool allowed);

    // Owner-only. Null router -> ZERO_ADDRESS. Enabling fails with
    // ROUTER_IS_CALL_TARGET while router is an allowed call target.
    int32_t set_router_allowed(const Address& caller, const Address& router, bool allowed);

    // Owner-only. Puts back a status taken earlier with router_status(); nullopt
    // forgets the router entirely.
    int32_t restore_router(const Address& caller, const Address& router,
                           const std::optional<RouterStatus>& previous);

    bool is_call_allowed(const Address& target) const;
    bool is_router_allowed(const Address& router) const;
    std::optional<RouterStatus> router_status(const Address& router) const;

private:
    const Ownable& ownable_;
    std::unordered_set<Address, AddressHash> call_allowed_;
    std::unordered_map<Address, RouterStatus, AddressHash> routers_;
    mutable std::shared_mutex mutex_;

    bool router_allowed_locked(const Address& router) const;
};

} // namespace nftamm

#endif // NFTAMM_ACCESS_CONTROLLER_HPP
