#ifndef NFTAMM_MEMORY_ASSETS_HPP
#define NFTAMM_MEMORY_ASSETS_HPP

#include <map>
#include <set>
#include <shared_mutex>
#include <string>
#include <unordered_map>

#include "assets.hpp"

namespace nftamm {

// =============================================================================
// In-memory asset ledgers
// =============================================================================

class MemoryNativeLedger : public INativeLedger {
public:
    U128 balance_of(const Address& owner) const override;
    int32_t transfer(const Address& from, const Address& to, U128 amount) override;

    // Create funds out of thin air (fixtures, genesis allocation)
    void mint(const Address& to, U128 amount);

private:
    std::unordered_map<Address, U128, AddressHash> balances_;
    mutable std::shared_mutex mutex_;
};

class MemoryToken : public IToken {
public:
    MemoryToken(const Address& address, std::string symbol);

    const Address& address() const override { return address_; }
    const std::string& symbol() const { return symbol_; }

    U128 balance_of(const Address& owner) const override;
    int32_t transfer_from(const Address& operator_addr, const Address& from,
                          const Address& to, U128 amount) override;

    void mint(const Address& to, U128 amount);
    void approve(const Address& owner, const Address& spender, U128 amount);
    U128 allowance(const Address& owner, const Address& spender) const;

private:
    Address address_;
    std::string symbol_;
    std::unordered_map<Address, U128, AddressHash> balances_;
    std::map<std::pair<Address, Address>, U128> allowances_;  // (owner, spender)
    mutable std::shared_mutex mutex_;
};

class MemoryNftCollection : public INftCollection {
public:
    // receivers may be null, in which case deliveries are never acknowledged
    MemoryNftCollection(const Address& address, bool enumerable,
                        ReceiverRegistry* receivers);

    const Address& address() const override { return address_; }
    bool supports_enumeration() const override { return enumerable_; }

    std::optional<Address> owner_of(uint64_t id) const override;
    std::vector<uint64_t> tokens_of_owner(const Address& owner) const override;

    int32_t transfer_from(const Address& operator_addr, const Address& from,
                          const Address& to, uint64_t id) override;
    int32_t safe_transfer_from(const Address& operator_addr, const Address& from,
                               const Address& to, uint64_t id) override;

    int32_t mint(const Address& to, uint64_t id);
    void set_approval_for_all(const Address& owner, const Address& operator_addr,
                              bool approved);
    bool is_approved_for_all(const Address& owner, const Address& operator_addr) const;

private:
    Address address_;
    bool enumerable_;
    ReceiverRegistry* receivers_;

    std::map<uint64_t, Address> owners_;
    std::set<std::pair<Address, Address>> operators_;  // (owner, operator)
    mutable std::shared_mutex mutex_;

    int32_t move_token(const Address& operator_addr, const Address& from,
                       const Address& to, uint64_t id);
};

} // namespace nftamm

#endif // NFTAMM_MEMORY_ASSETS_HPP
