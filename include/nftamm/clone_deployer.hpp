#ifndef NFTAMM_CLONE_DEPLOYER_HPP
#define NFTAMM_CLONE_DEPLOYER_HPP

#include <array>
#include <memory>
#include <shared_mutex>
#include <unordered_map>
#include <vector>

#include "pair.hpp"

namespace nftamm {

using TemplateSet = std::array<Address, PAIR_VARIANT_COUNT>;  // indexed by PairVariant

// =============================================================================
// CloneDeployer - template-based pair instantiation and authenticity checks
//
// A clone's address is derived from (deployer, template, nonce). The instance
// table remembers which nonce and template produced each clone, so authenticity
// is proven by re-deriving the address rather than trusting the candidate.
// =============================================================================

class CloneDeployer {
public:
    // Throws std::invalid_argument if a template is null or listed twice
    CloneDeployer(const Address& deployer, const TemplateSet& templates);

    CloneDeployer(const CloneDeployer&) = delete;
    CloneDeployer& operator=(const CloneDeployer&) = delete;

    const Address& deployer() const { return deployer_; }
    const Address& template_for(PairVariant variant) const;

    // Creates a fresh pair from the variant's template; immutables.variant is
    // overwritten with `variant`
    std::shared_ptr<Pair> instantiate(PairVariant variant, PairImmutables immutables,
                                      const INativeLedger& native);

    // Forget a clone created within the current operation. Discarding the most
    // recent clone also releases its nonce.
    void discard(const Address& instance);

    // Never throws; unknown variants and unknown addresses yield false
    bool is_instance_of(const Address& candidate, PairVariant variant) const noexcept;

    std::shared_ptr<Pair> find(const Address& instance) const;
    std::vector<Address> instances() const;
    size_t instance_count() const;
    uint64_t nonce() const;

    static Address derive_address(const Address& deployer, const Address& template_addr,
                                  uint64_t nonce);

private:
    struct CloneRecord {
        PairVariant variant;
        uint64_t nonce;
        std::shared_ptr<Pair> pair;
    };

    Address deployer_;
    TemplateSet templates_;
    uint64_t nonce_{0};
    std::unordered_map<Address, CloneRecord, AddressHash> instances_;
    mutable std::shared_mutex mutex_;
};

} // namespace nftamm

#endif // NFTAMM_CLONE_DEPLOYER_HPP
