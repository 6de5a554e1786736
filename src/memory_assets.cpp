// =============================================================================
// memory_assets.cpp - In-memory native, token and NFT ledgers
// =============================================================================

#include "nftamm/memory_assets.hpp"

#include <mutex>

namespace nftamm {

// =============================================================================
// MemoryNativeLedger
// =============================================================================

U128 MemoryNativeLedger::balance_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(owner);
    return it != balances_.end() ? it->second : 0;
}

int32_t MemoryNativeLedger::transfer(const Address& from, const Address& to, U128 amount) {
    if (addresses::is_zero(to)) {
        return errors::ZERO_ADDRESS;
    }
    // Nothing moves, so an account without funds may still do it
    if (amount == 0 || from == to) {
        return errors::OK;
    }

    std::unique_lock lock(mutex_);
    auto it = balances_.find(from);
    if (it == balances_.end() || it->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    it->second -= amount;
    balances_[to] += amount;
    return errors::OK;
}

void MemoryNativeLedger::mint(const Address& to, U128 amount) {
    std::unique_lock lock(mutex_);
    balances_[to] += amount;
}

// =============================================================================
// MemoryToken
// =============================================================================

MemoryToken::MemoryToken(const Address& address, std::string symbol)
    : address_(address)
    , symbol_(std::move(symbol)) {}

U128 MemoryToken::balance_of(const Address& owner) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find(owner);
    return it != balances_.end() ? it->second : 0;
}

int32_t MemoryToken::transfer_from(const Address& operator_addr, const Address& from,
                                   const Address& to, U128 amount) {
    if (addresses::is_zero(to)) {
        return errors::ZERO_ADDRESS;
    }
    if (amount == 0) {
        return errors::OK;
    }

    std::unique_lock lock(mutex_);

    auto bal = balances_.find(from);
    if (bal == balances_.end() || bal->second < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }

    if (operator_addr != from) {
        auto allowance = allowances_.find({from, operator_addr});
        if (allowance == allowances_.end() || allowance->second < amount) {
            return errors::INSUFFICIENT_ALLOWANCE;
        }
        allowance->second -= amount;
    }

    if (from == to) {
        return errors::OK;
    }

    bal->second -= amount;
    balances_[to] += amount;
    return errors::OK;
}

void MemoryToken::mint(const Address& to, U128 amount) {
    std::unique_lock lock(mutex_);
    balances_[to] += amount;
}

void MemoryToken::approve(const Address& owner, const Address& spender, U128 amount) {
    std::unique_lock lock(mutex_);
    allowances_[{owner, spender}] = amount;
}

U128 MemoryToken::allowance(const Address& owner, const Address& spender) const {
    std::shared_lock lock(mutex_);
    auto it = allowances_.find({owner, spender});
    return it != allowances_.end() ? it->second : 0;
}

// =============================================================================
// MemoryNftCollection
// =============================================================================

MemoryNftCollection::MemoryNftCollection(const Address& address, bool enumerable,
                                         ReceiverRegistry* receivers)
    : address_(address)
    , enumerable_(enumerable)
    , receivers_(receivers) {}

std::optional<Address> MemoryNftCollection::owner_of(uint64_t id) const {
    std::shared_lock lock(mutex_);
    auto it = owners_.find(id);
    if (it == owners_.end()) return std::nullopt;
    return it->second;
}

std::vector<uint64_t> MemoryNftCollection::tokens_of_owner(const Address& owner) const {
    std::vector<uint64_t> ids;
    if (!enumerable_) return ids;

    std::shared_lock lock(mutex_);
    for (const auto& [id, holder] : owners_) {
        if (holder == owner) ids.push_back(id);
    }
    return ids;
}

int32_t MemoryNftCollection::move_token(const Address& operator_addr, const Address& from,
                                        const Address& to, uint64_t id) {
    if (addresses::is_zero(to)) {
        return errors::ZERO_ADDRESS;
    }

    std::unique_lock lock(mutex_);

    auto it = owners_.find(id);
    if (it == owners_.end()) {
        return errors::NONEXISTENT_TOKEN;
    }
    if (it->second != from) {
        return errors::NOT_TOKEN_OWNER;
    }
    if (operator_addr != from && operators_.count({from, operator_addr}) == 0) {
        return errors::NOT_APPROVED;
    }

    it->second = to;
    return errors::OK;
}

int32_t MemoryNftCollection::transfer_from(const Address& operator_addr, const Address& from,
                                           const Address& to, uint64_t id) {
    return move_token(operator_addr, from, to, id);
}

int32_t MemoryNftCollection::safe_transfer_from(const Address& operator_addr,
                                                const Address& from,
                                                const Address& to, uint64_t id) {
    int32_t status = move_token(operator_addr, from, to, id);
    if (status != errors::OK) {
        return status;
    }

    // Lock released: the receiver may query the collection
    INftReceiver* receiver = receivers_ ? receivers_->find(to) : nullptr;
    if (receiver && !receiver->on_nft_received(address_, operator_addr, from, id)) {
        std::unique_lock lock(mutex_);
        owners_[id] = from;
        return errors::RECEIVER_REJECTED;
    }
    return errors::OK;
}

int32_t MemoryNftCollection::mint(const Address& to, uint64_t id) {
    if (addresses::is_zero(to)) {
        return errors::ZERO_ADDRESS;
    }

    std::unique_lock lock(mutex_);
    if (!owners_.emplace(id, to).second) {
        return errors::NOT_TOKEN_OWNER;
    }
    return errors::OK;
}

void MemoryNftCollection::set_approval_for_all(const Address& owner,
                                               const Address& operator_addr,
                                               bool approved) {
    std::unique_lock lock(mutex_);
    if (approved) {
        operators_.insert({owner, operator_addr});
    } else {
        operators_.erase({owner, operator_addr});
    }
}

bool MemoryNftCollection::is_approved_for_all(const Address& owner,
                                              const Address& operator_addr) const {
    std::shared_lock lock(mutex_);
    return operators_.count({owner, operator_addr}) != 0;
}

} // namespace nftamm
