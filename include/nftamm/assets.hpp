#ifndef NFTAMM_ASSETS_HPP
#define NFTAMM_ASSETS_HPP

#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "types.hpp"

namespace nftamm {

// =============================================================================
// Asset-transfer primitives consumed by the factory
//
// Every transfer is all-or-nothing: it either moves the asset and returns
// errors::OK, or returns a transfer error code and changes nothing.
// =============================================================================

// Acknowledges NFTs delivered with safe_transfer_from
class INftReceiver {
public:
    virtual ~INftReceiver() = default;

    // Return false to reject the transfer
    virtual bool on_nft_received(const Address& collection, const Address& operator_addr,
                                 const Address& from, uint64_t id) = 0;
};

// Address -> receiver lookup shared by collections and the accounts they pay into
class ReceiverRegistry {
public:
    void register_receiver(const Address& addr, INftReceiver* receiver);
    void unregister_receiver(const Address& addr);
    INftReceiver* find(const Address& addr) const;

private:
    std::unordered_map<Address, INftReceiver*, AddressHash> receivers_;
    mutable std::shared_mutex mutex_;
};

class INftCollection {
public:
    virtual ~INftCollection() = default;

    virtual const Address& address() const = 0;

    // Capability check: does the collection support on-chain enumeration
    virtual bool supports_enumeration() const = 0;

    virtual std::optional<Address> owner_of(uint64_t id) const = 0;

    // Only meaningful when supports_enumeration() is true
    virtual std::vector<uint64_t> tokens_of_owner(const Address& owner) const = 0;

    // operator_addr moves id from `from` to `to`; it must be the owner or an
    // approved operator
    virtual int32_t transfer_from(const Address& operator_addr, const Address& from,
                                  const Address& to, uint64_t id) = 0;

    // As transfer_from, then the receiver registered at `to` (if any) must
    // acknowledge the delivery or the transfer is undone
    virtual int32_t safe_transfer_from(const Address& operator_addr, const Address& from,
                                       const Address& to, uint64_t id) = 0;
};

class IToken {
public:
    virtual ~IToken() = default;

    virtual const Address& address() const = 0;
    virtual U128 balance_of(const Address& owner) const = 0;

    // Spends operator_addr's allowance unless operator_addr == from
    virtual int32_t transfer_from(const Address& operator_addr, const Address& from,
                                  const Address& to, U128 amount) = 0;
};

class INativeLedger {
public:
    virtual ~INativeLedger() = default;

    virtual U128 balance_of(const Address& owner) const = 0;
    virtual int32_t transfer(const Address& from, const Address& to, U128 amount) = 0;
};

} // namespace nftamm

#endif // NFTAMM_ASSETS_HPP
