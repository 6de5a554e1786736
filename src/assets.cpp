// =============================================================================
// assets.cpp - Receiver registry
// =============================================================================

#include "nftamm/assets.hpp"

#include <mutex>

namespace nftamm {

// =============================================================================
// ReceiverRegistry
// =============================================================================

void ReceiverRegistry::register_receiver(const Address& addr, INftReceiver* receiver) {
    if (!receiver || addresses::is_zero(addr)) return;
    std::unique_lock lock(mutex_);
    receivers_[addr] = receiver;
}

void ReceiverRegistry::unregister_receiver(const Address& addr) {
    std::unique_lock lock(mutex_);
    receivers_.erase(addr);
}

INftReceiver* ReceiverRegistry::find(const Address& addr) const {
    std::shared_lock lock(mutex_);
    auto it = receivers_.find(addr);
    return it != receivers_.end() ? it->second : nullptr;
}

} // namespace nftamm
