// =============================================================================
// access_controller.cpp - Call target and router whitelists
// =============================================================================

#include "nftamm/access_controller.hpp"

#include <mutex>

namespace nftamm {

AccessController::AccessController(const Ownable& ownable) : ownable_(ownable) {}

bool AccessController::router_allowed_locked(const Address& router) const {
    auto it = routers_.find(router);
    return it != routers_.end() && it->second.allowed;
}

int32_t AccessController::set_call_allowed(const Address& caller, const Address& target,
                                           bool allowed) {
    if (!ownable_.is_owner(caller)) {
        return errors::UNAUTHORIZED;
    }

    std::unique_lock lock(mutex_);

    if (!allowed) {
        call_allowed_.erase(target);
        return errors::OK;
    }
    if (router_allowed_locked(target)) {
        return errors::TARGET_IS_ROUTER;
    }
    call_allowed_.insert(target);
    return errors::OK;
}

int32_t AccessController::set_router_allowed(const Address& caller, const Address& router,
                                             bool allowed) {
    if (!ownable_.is_owner(caller)) {
        return errors::UNAUTHORIZED;
    }
    if (addresses::is_zero(router)) {
        return errors::ZERO_ADDRESS;
    }

    std::unique_lock lock(mutex_);

    if (allowed && call_allowed_.count(router) != 0) {
        return errors::ROUTER_IS_CALL_TARGET;
    }

    auto& status = routers_[router];
    status.allowed = allowed;
    status.was_ever_allowed = status.was_ever_allowed || allowed;
    return errors::OK;
}

int32_t AccessController::restore_router(const Address& caller, const Address& router,
                                         const std::optional<RouterStatus>& previous) {
    if (!ownable_.is_owner(caller)) {
        return errors::UNAUTHORIZED;
    }

    std::unique_lock lock(mutex_);

    if (!previous) {
        routers_.erase(router);
        return errors::OK;
    }
    if (previous->allowed && call_allowed_.count(router) != 0) {
        return errors::ROUTER_IS_CALL_TARGET;
    }
    routers_[router] = *previous;
    return errors::OK;
}

bool AccessController::is_call_allowed(const Address& target) const {
    std::shared_lock lock(mutex_);
    return call_allowed_.count(target) != 0;
}

bool AccessController::is_router_allowed(const Address& router) const {
    std::shared_lock lock(mutex_);
    return router_allowed_locked(router);
}

std::optional<RouterStatus> AccessController::router_status(const Address& router) const {
    std::shared_lock lock(mutex_);
    auto it = routers_.find(router);
    if (it == routers_.end()) return std::nullopt;
    return it->second;
}

} // namespace nftamm
