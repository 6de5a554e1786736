// =============================================================================
// clone_deployer.cpp - Deterministic pair clones
// =============================================================================

#include "nftamm/clone_deployer.hpp"

#include <mutex>
#include <stdexcept>
#include <string>

namespace nftamm {

namespace {

constexpr uint64_t FNV_OFFSET = 0xcbf29ce484222325ULL;
constexpr uint64_t FNV_PRIME = 0x100000001b3ULL;

// Prefix byte keeps clone derivations apart from other address schemes
constexpr uint8_t CLONE_DOMAIN = 0xff;

inline uint64_t splitmix64(uint64_t x) {
    x += 0x9e3779b97f4a7c15ULL;
    x = (x ^ (x >> 30)) * 0xbf58476d1ce4e5b9ULL;
    x = (x ^ (x >> 27)) * 0x94d049bb133111ebULL;
    return x ^ (x >> 31);
}

} // namespace

CloneDeployer::CloneDeployer(const Address& deployer, const TemplateSet& templates)
    : deployer_(deployer)
    , templates_(templates) {
    for (size_t i = 0; i < templates_.size(); ++i) {
        if (addresses::is_zero(templates_[i])) {
            throw std::invalid_argument(
                std::string("CloneDeployer: null template for ") +
                to_string(static_cast<PairVariant>(i)));
        }
        for (size_t j = 0; j < i; ++j) {
            if (templates_[j] == templates_[i]) {
                throw std::invalid_argument("CloneDeployer: template listed twice");
            }
        }
    }
}

const Address& CloneDeployer::template_for(PairVariant variant) const {
    if (!is_known_variant(variant)) {
        throw std::out_of_range("CloneDeployer: unknown pair variant");
    }
    return templates_[static_cast<size_t>(variant)];
}

Address CloneDeployer::derive_address(const Address& deployer, const Address& template_addr,
                                      uint64_t nonce) {
    uint64_t h = FNV_OFFSET;
    auto absorb = [&h](uint8_t b) {
        h ^= b;
        h *= FNV_PRIME;
    };

    absorb(CLONE_DOMAIN);
    for (uint8_t b : deployer) absorb(b);
    for (uint8_t b : template_addr) absorb(b);
    for (int i = 7; i >= 0; --i) absorb(static_cast<uint8_t>((nonce >> (8 * i)) & 0xFF));

    Address out{};
    for (size_t lane = 0; lane < 3; ++lane) {
        uint64_t word = splitmix64(h + lane);
        for (size_t i = 0; i < 8 && lane * 8 + i < out.size(); ++i) {
            out[lane * 8 + i] = static_cast<uint8_t>((word >> (56 - 8 * i)) & 0xFF);
        }
    }
    return out;
}

std::shared_ptr<Pair> CloneDeployer::instantiate(PairVariant variant, PairImmutables immutables,
                                                 const INativeLedger& native) {
    const Address& template_addr = template_for(variant);
    immutables.variant = variant;

    std::unique_lock lock(mutex_);

    uint64_t nonce = nonce_;
    Address addr = derive_address(deployer_, template_addr, nonce);
    if (instances_.count(addr) != 0) {
        throw std::runtime_error("CloneDeployer: derived address already in use");
    }

    auto pair = std::make_shared<Pair>(addr, immutables, native);
    instances_.emplace(addr, CloneRecord{variant, nonce, pair});
    ++nonce_;
    return pair;
}

void CloneDeployer::discard(const Address& instance) {
    std::unique_lock lock(mutex_);
    auto it = instances_.find(instance);
    if (it == instances_.end()) return;

    if (it->second.nonce + 1 == nonce_) {
        nonce_ = it->second.nonce;
    }
    instances_.erase(it);
}

bool CloneDeployer::is_instance_of(const Address& candidate, PairVariant variant) const noexcept {
    if (!is_known_variant(variant)) {
        return false;
    }

    std::shared_lock lock(mutex_);
    auto it = instances_.find(candidate);
    if (it == instances_.end() || it->second.variant != variant) {
        return false;
    }

    const Address& template_addr = templates_[static_cast<size_t>(variant)];
    return derive_address(deployer_, template_addr, it->second.nonce) == candidate;
}

std::shared_ptr<Pair> CloneDeployer::find(const Address& instance) const {
    std::shared_lock lock(mutex_);
    auto it = instances_.find(instance);
    return it != instances_.end() ? it->second.pair : nullptr;
}

std::vector<Address> CloneDeployer::instances() const {
    std::shared_lock lock(mutex_);
    std::vector<Address> out;
    out.reserve(instances_.size());
    for (const auto& [addr, record] : instances_) {
        out.push_back(addr);
    }
    return out;
}

size_t CloneDeployer::instance_count() const {
    std::shared_lock lock(mutex_);
    return instances_.size();
}

uint64_t CloneDeployer::nonce() const {
    std::shared_lock lock(mutex_);
    return nonce_;
}

} // namespace nftamm
