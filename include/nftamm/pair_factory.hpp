#ifndef NFTAMM_PAIR_FACTORY_HPP
#define NFTAMM_PAIR_FACTORY_HPP

#include <atomic>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "access_controller.hpp"
#include "assets.hpp"
#include "clone_deployer.hpp"
#include "config.hpp"
#include "curve_registry.hpp"
#include "events.hpp"
#include "fee_controller.hpp"
#include "journal.hpp"
#include "ownable.hpp"
#include "pair.hpp"

namespace nftamm {

// =============================================================================
// Pair Creation Parameters
// =============================================================================

struct CreatePairParams {
    AssetKind asset_kind;
    INftCollection* nft;
    const BondingCurve* curve;
    IToken* token;                 // required for TOKEN pairs, must be null for NATIVE
    Address asset_recipient;       // null = the pair itself
    PoolType pool_type;
    U128 delta;
    U128 fee;                      // X18, TRADE pools only
    U128 spot_price;
    std::vector<uint64_t> initial_nft_ids;
    U128 initial_amount;           // native value or token amount moved into the pair
};

struct CreatePairResult {
    int32_t status;
    Address pair;                  // zero unless status == errors::OK
};

// =============================================================================
// PairFactory - creates pairs, vouches for them, governs what they trust
//
// Mutating calls from different threads are serialized. A mutating call made
// from inside another on the same thread, such as from an NFT receiver
// callback, fails with REENTRANCY.
// =============================================================================

class PairFactory {
public:
    // Throws std::invalid_argument on a null factory address, owner, template or
    // fee recipient, or a fee multiplier above MAX_PROTOCOL_FEE
    PairFactory(const Address& factory_address, const Address& owner,
                const TemplateSet& templates, const Address& fee_recipient,
                U128 fee_multiplier, INativeLedger& native, ReceiverRegistry& receivers);

    PairFactory(const FactoryConfig& config, INativeLedger& native,
                ReceiverRegistry& receivers);

    // Unregisters the pairs from the receiver registry
    ~PairFactory();

    // Non-copyable
    PairFactory(const PairFactory&) = delete;
    PairFactory& operator=(const PairFactory&) = delete;

    // =========================================================================
    // Pair Creation & Verification
    // =========================================================================

    // Whitelist check, template selection by the collection's enumeration
    // capability, clone, initialize, then move the caller's initial assets in.
    // Any failure leaves no pair and no moved asset behind.
    CreatePairResult create_pair(const Address& caller, const CreatePairParams& params);

    // Never throws; unknown variants yield false
    bool is_pair(const Address& candidate, PairVariant variant) const noexcept;

    // Variant of a pair created by this factory
    std::optional<PairVariant> pair_variant(const Address& candidate) const;

    std::shared_ptr<Pair> pair(const Address& addr) const;
    size_t pair_count() const;

    // =========================================================================
    // Deposits
    // =========================================================================

    // Moves every id from caller to recipient, or none of them
    int32_t deposit_nfts(const Address& caller, INftCollection& nft,
                         const std::vector<uint64_t>& ids, const Address& recipient);

    int32_t deposit_tokens(const Address& caller, IToken& token, const Address& recipient,
                           U128 amount);

    // =========================================================================
    // Administration (owner-only)
    // =========================================================================

    int32_t transfer_ownership(const Address& caller, const Address& new_owner);

    int32_t change_protocol_fee_recipient(const Address& caller, const Address& recipient);
    int32_t change_protocol_fee_multiplier(const Address& caller, U128 multiplier);
    FeeWithdrawal withdraw_native_fees(const Address& caller);
    FeeWithdrawal withdraw_token_fees(const Address& caller, IToken& token);

    int32_t set_bonding_curve_allowed(const Address& caller, const BondingCurve& curve,
                                      bool allowed);
    int32_t set_call_allowed(const Address& caller, const Address& target, bool allowed);
    int32_t set_router_allowed(const Address& caller, const Address& router, bool allowed);

    // Enable the routers and call targets listed in a config. On the first
    // failure the entries enabled so far return to their prior status.
    int32_t apply_access_lists(const Address& caller, const FactoryConfig& config);

    // =========================================================================
    // Queries
    // =========================================================================

    const Address& address() const { return address_; }
    Address owner() const { return ownable_->owner(); }
    const Address& template_for(PairVariant variant) const;

    const CurveRegistry& curves() const { return *curves_; }
    const AccessController& access() const { return *access_; }
    const FeeController& fees() const { return *fees_; }
    const CloneDeployer& deployer() const { return *deployer_; }

    // Null restores the no-op listener; the listener must outlive the factory
    void set_listener(FactoryListener* listener);

    struct Stats {
        uint64_t pairs_created;
        uint64_t pairs_rejected;
        uint64_t nft_deposits;
        uint64_t token_deposits;
    };
    Stats get_stats() const;

private:
    Address address_;
    INativeLedger& native_;
    ReceiverRegistry& receivers_;

    std::unique_ptr<Ownable> ownable_;
    std::unique_ptr<CurveRegistry> curves_;
    std::unique_ptr<AccessController> access_;
    std::unique_ptr<FeeController> fees_;
    std::unique_ptr<CloneDeployer> deployer_;

    NullFactoryListener null_listener_;
    FactoryListener* listener_;

    // Mutating operations run one at a time; op_holder_ names the running thread
    std::mutex op_mutex_;
    std::atomic<std::thread::id> op_holder_{};

    std::atomic<uint64_t> pairs_created_{0};
    std::atomic<uint64_t> pairs_rejected_{0};
    std::atomic<uint64_t> nft_deposits_{0};
    std::atomic<uint64_t> token_deposits_{0};

    int32_t validate(const CreatePairParams& params) const;
    int32_t fund_pair(const Address& caller, const Pair& pair,
                      const CreatePairParams& params, TransferJournal& journal);
    CreatePairResult reject(int32_t status, const char* stage);
};

} // namespace nftamm

#endif // NFTAMM_PAIR_FACTORY_HPP
