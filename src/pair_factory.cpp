// =============================================================================
// pair_factory.cpp - Pair creation, deposits and governance
// =============================================================================

#include "nftamm/pair_factory.hpp"
#include "nftamm/logger.hpp"

#include <stdexcept>
#include <thread>

namespace nftamm {

namespace {

// Holds the factory for the lifetime of a mutating call. Calls from other
// threads wait; a nested call on the holding thread is refused.
class EntryGuard {
public:
    EntryGuard(std::mutex& mutex, std::atomic<std::thread::id>& holder)
        : holder_(holder) {
        if (holder.load(std::memory_order_acquire) == std::this_thread::get_id()) {
            return;
        }
        lock_ = std::unique_lock<std::mutex>(mutex);
        holder_.store(std::this_thread::get_id(), std::memory_order_release);
        acquired_ = true;
    }

    ~EntryGuard() {
        if (acquired_) {
            holder_.store(std::thread::id{}, std::memory_order_release);
        }
    }

    EntryGuard(const EntryGuard&) = delete;
    EntryGuard& operator=(const EntryGuard&) = delete;

    bool acquired() const { return acquired_; }

private:
    std::atomic<std::thread::id>& holder_;
    std::unique_lock<std::mutex> lock_;
    bool acquired_ = false;
};

bool is_known_pool_type(PoolType type) {
    switch (type) {
        case PoolType::TOKEN:
        case PoolType::NFT:
        case PoolType::TRADE:
            return true;
    }
    return false;
}

bool is_known_asset_kind(AssetKind kind) {
    return kind == AssetKind::NATIVE || kind == AssetKind::TOKEN;
}

} // namespace

// =============================================================================
// Construction
// =============================================================================

PairFactory::PairFactory(const Address& factory_address, const Address& owner,
                         const TemplateSet& templates, const Address& fee_recipient,
                         U128 fee_multiplier, INativeLedger& native,
                         ReceiverRegistry& receivers)
    : address_(factory_address)
    , native_(native)
    , receivers_(receivers)
    , ownable_(std::make_unique<Ownable>(owner))
    , curves_(std::make_unique<CurveRegistry>(*ownable_))
    , access_(std::make_unique<AccessController>(*ownable_))
    , fees_(std::make_unique<FeeController>(*ownable_, native, factory_address,
                                            fee_recipient, fee_multiplier))
    , deployer_(std::make_unique<CloneDeployer>(factory_address, templates))
    , listener_(&null_listener_) {
    if (addresses::is_zero(factory_address)) {
        throw std::invalid_argument("PairFactory: factory address must not be null");
    }
    NFTAMM_LOG_INFO() << "factory " << to_hex(address_) << " owned by " << to_hex(owner)
                      << ", protocol fee " << x18::to_string(fee_multiplier);
}

PairFactory::PairFactory(const FactoryConfig& config, INativeLedger& native,
                         ReceiverRegistry& receivers)
    : PairFactory(config.factory_address, config.owner, config.templates,
                  config.protocol_fee_recipient, config.protocol_fee_multiplier,
                  native, receivers) {}

PairFactory::~PairFactory() {
    for (const Address& addr : deployer_->instances()) {
        receivers_.unregister_receiver(addr);
    }
}

// =============================================================================
// Pair Creation
// =============================================================================

int32_t PairFactory::validate(const CreatePairParams& params) const {
    if (params.nft == nullptr || params.curve == nullptr) {
        return errors::ZERO_ADDRESS;
    }
    if (!is_known_asset_kind(params.asset_kind)) {
        return errors::INVALID_VARIANT;
    }
    if (!is_known_pool_type(params.pool_type)) {
        return errors::INVALID_CONFIG;
    }
    if (params.asset_kind == AssetKind::TOKEN && params.token == nullptr) {
        return errors::ZERO_ADDRESS;
    }
    if (params.asset_kind == AssetKind::NATIVE && params.token != nullptr) {
        return errors::INVALID_CONFIG;
    }
    return errors::OK;
}

CreatePairResult PairFactory::reject(int32_t status, const char* stage) {
    pairs_rejected_.fetch_add(1, std::memory_order_relaxed);
    NFTAMM_LOG_WARN() << "create_pair rejected at " << stage << ": " << error_name(status);
    return CreatePairResult{status, ZERO_ADDRESS};
}

CreatePairResult PairFactory::create_pair(const Address& caller,
                                          const CreatePairParams& params) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return reject(errors::REENTRANCY, "entry");
    }

    int32_t status = validate(params);
    if (status != errors::OK) {
        return reject(status, "validation");
    }

    if (!curves_->is_allowed(*params.curve)) {
        return reject(errors::CURVE_NOT_WHITELISTED, "curve whitelist");
    }

    // Ask the collection once; the answer picks the template
    const PairVariant variant =
        variant_of(params.asset_kind, params.nft->supports_enumeration());

    TransferJournal journal;

    PairImmutables immutables{address_, params.curve, params.nft,
                              params.pool_type, variant, params.token};
    std::shared_ptr<Pair> pair = deployer_->instantiate(variant, immutables, native_);
    const Address pair_addr = pair->address();
    journal.record("instantiate " + to_hex(pair_addr), [this, pair_addr] {
        deployer_->discard(pair_addr);
        return errors::OK;
    });

    receivers_.register_receiver(pair_addr, pair.get());
    journal.record("register receiver", [this, pair_addr] {
        receivers_.unregister_receiver(pair_addr);
        return errors::OK;
    });

    status = pair->initialize(caller, params.asset_recipient, params.delta, params.fee,
                              params.spot_price);
    if (status != errors::OK) {
        return reject(status, "initialize");
    }

    status = fund_pair(caller, *pair, params, journal);
    if (status != errors::OK) {
        return reject(status, "initial transfer");
    }

    journal.commit();
    pairs_created_.fetch_add(1, std::memory_order_relaxed);

    NFTAMM_LOG_INFO() << "new pair " << to_hex(pair_addr) << " (" << to_string(variant)
                      << ", " << to_string(params.pool_type) << ") for collection "
                      << to_hex(params.nft->address()) << " with "
                      << params.initial_nft_ids.size() << " NFTs";

    listener_->on_new_pair(NewPairEvent{pair_addr, params.nft->address(), variant});
    return CreatePairResult{errors::OK, pair_addr};
}

int32_t PairFactory::fund_pair(const Address& caller, const Pair& pair,
                               const CreatePairParams& params, TransferJournal& journal) {
    const Address pair_addr = pair.address();
    const U128 amount = params.initial_amount;

    if (amount > 0) {
        if (params.asset_kind == AssetKind::NATIVE) {
            int32_t status = native_.transfer(caller, pair_addr, amount);
            if (status != errors::OK) {
                return status;
            }
            journal.record("native deposit", [this, pair_addr, caller, amount] {
                return native_.transfer(pair_addr, caller, amount);
            });
        } else {
            IToken* token = params.token;
            int32_t status = token->transfer_from(address_, caller, pair_addr, amount);
            if (status != errors::OK) {
                return status;
            }
            journal.record("token deposit", [token, pair_addr, caller, amount] {
                return token->transfer_from(pair_addr, pair_addr, caller, amount);
            });
        }
    }

    INftCollection* nft = params.nft;
    for (uint64_t id : params.initial_nft_ids) {
        int32_t status = nft->safe_transfer_from(address_, caller, pair_addr, id);
        if (status != errors::OK) {
            NFTAMM_LOG_DEBUG() << "NFT " << id << " could not be moved into "
                               << to_hex(pair_addr) << ": " << error_name(status);
            return status;
        }
        journal.record("nft " + std::to_string(id), [nft, pair_addr, caller, id] {
            return nft->transfer_from(pair_addr, pair_addr, caller, id);
        });
    }
    return errors::OK;
}

// =============================================================================
// Pair Verification
// =============================================================================

bool PairFactory::is_pair(const Address& candidate, PairVariant variant) const noexcept {
    return deployer_->is_instance_of(candidate, variant);
}

std::optional<PairVariant> PairFactory::pair_variant(const Address& candidate) const {
    auto pair = deployer_->find(candidate);
    if (!pair || !deployer_->is_instance_of(candidate, pair->variant())) {
        return std::nullopt;
    }
    return pair->variant();
}

std::shared_ptr<Pair> PairFactory::pair(const Address& addr) const {
    return deployer_->find(addr);
}

size_t PairFactory::pair_count() const {
    return deployer_->instance_count();
}

// =============================================================================
// Deposits
// =============================================================================

int32_t PairFactory::deposit_nfts(const Address& caller, INftCollection& nft,
                                  const std::vector<uint64_t>& ids,
                                  const Address& recipient) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }
    if (addresses::is_zero(recipient)) {
        return errors::ZERO_ADDRESS;
    }

    TransferJournal journal;
    INftCollection* collection = &nft;
    for (uint64_t id : ids) {
        int32_t status = collection->safe_transfer_from(address_, caller, recipient, id);
        if (status != errors::OK) {
            NFTAMM_LOG_WARN() << "NFT deposit to " << to_hex(recipient) << " failed on id "
                              << id << ": " << error_name(status);
            return status;
        }
        journal.record("nft " + std::to_string(id), [collection, recipient, caller, id] {
            return collection->transfer_from(recipient, recipient, caller, id);
        });
    }
    journal.commit();

    if (pair_variant(recipient).has_value()) {
        nft_deposits_.fetch_add(1, std::memory_order_relaxed);
        listener_->on_nft_deposit(recipient);
    }
    return errors::OK;
}

int32_t PairFactory::deposit_tokens(const Address& caller, IToken& token,
                                    const Address& recipient, U128 amount) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }
    if (addresses::is_zero(recipient)) {
        return errors::ZERO_ADDRESS;
    }

    int32_t status = token.transfer_from(address_, caller, recipient, amount);
    if (status != errors::OK) {
        NFTAMM_LOG_WARN() << "token deposit to " << to_hex(recipient) << " failed: "
                          << error_name(status);
        return status;
    }

    auto variant = pair_variant(recipient);
    if (variant && asset_kind_of(*variant) == AssetKind::TOKEN) {
        token_deposits_.fetch_add(1, std::memory_order_relaxed);
        listener_->on_token_deposit(recipient);
    }
    return errors::OK;
}

// =============================================================================
// Administration
// =============================================================================

int32_t PairFactory::transfer_ownership(const Address& caller, const Address& new_owner) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }
    int32_t status = ownable_->transfer_ownership(caller, new_owner);
    if (status == errors::OK) {
        NFTAMM_LOG_INFO() << "ownership transferred to " << to_hex(new_owner);
    }
    return status;
}

int32_t PairFactory::change_protocol_fee_recipient(const Address& caller,
                                                   const Address& recipient) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }
    int32_t status = fees_->change_recipient(caller, recipient);
    if (status != errors::OK) {
        return status;
    }
    NFTAMM_LOG_INFO() << "protocol fee recipient set to " << to_hex(recipient);
    listener_->on_protocol_fee_recipient_update(recipient);
    return errors::OK;
}

int32_t PairFactory::change_protocol_fee_multiplier(const Address& caller, U128 multiplier) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }
    int32_t status = fees_->change_multiplier(caller, multiplier);
    if (status != errors::OK) {
        return status;
    }
    NFTAMM_LOG_INFO() << "protocol fee multiplier set to " << x18::to_string(multiplier);
    listener_->on_protocol_fee_multiplier_update(multiplier);
    return errors::OK;
}

FeeWithdrawal PairFactory::withdraw_native_fees(const Address& caller) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return FeeWithdrawal{errors::REENTRANCY, 0};
    }
    FeeWithdrawal result = fees_->withdraw_native_fees(caller);
    if (result.status == errors::OK) {
        NFTAMM_LOG_INFO() << "withdrew " << x18::to_string(result.amount) << " native fees";
    }
    return result;
}

FeeWithdrawal PairFactory::withdraw_token_fees(const Address& caller, IToken& token) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return FeeWithdrawal{errors::REENTRANCY, 0};
    }
    FeeWithdrawal result = fees_->withdraw_token_fees(caller, token);
    if (result.status == errors::OK) {
        NFTAMM_LOG_INFO() << "withdrew " << x18::to_string(result.amount) << " fees in token "
                          << to_hex(token.address());
    }
    return result;
}

int32_t PairFactory::set_bonding_curve_allowed(const Address& caller,
                                               const BondingCurve& curve, bool allowed) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }
    int32_t status = curves_->set_allowed(caller, curve, allowed);
    if (status != errors::OK) {
        return status;
    }
    NFTAMM_LOG_INFO() << curve.name() << " " << to_hex(curve.address())
                      << (allowed ? " whitelisted" : " removed from whitelist");
    listener_->on_bonding_curve_status_update(curve.address(), allowed);
    return errors::OK;
}

int32_t PairFactory::set_call_allowed(const Address& caller, const Address& target,
                                      bool allowed) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }
    int32_t status = access_->set_call_allowed(caller, target, allowed);
    if (status != errors::OK) {
        return status;
    }
    NFTAMM_LOG_INFO() << "call target " << to_hex(target)
                      << (allowed ? " allowed" : " disallowed");
    listener_->on_call_target_status_update(target, allowed);
    return errors::OK;
}

int32_t PairFactory::set_router_allowed(const Address& caller, const Address& router,
                                        bool allowed) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }
    int32_t status = access_->set_router_allowed(caller, router, allowed);
    if (status != errors::OK) {
        return status;
    }
    NFTAMM_LOG_INFO() << "router " << to_hex(router) << (allowed ? " allowed" : " disallowed");
    listener_->on_router_status_update(router, allowed);
    return errors::OK;
}

int32_t PairFactory::apply_access_lists(const Address& caller, const FactoryConfig& config) {
    EntryGuard guard(op_mutex_, op_holder_);
    if (!guard.acquired()) {
        return errors::REENTRANCY;
    }

    // Entries enabled by this call get their prior status back if a later one fails
    TransferJournal journal;
    std::vector<Address> routers_enabled;
    std::vector<Address> targets_enabled;

    for (const Address& router : config.routers) {
        const std::optional<RouterStatus> previous = access_->router_status(router);
        int32_t status = access_->set_router_allowed(caller, router, true);
        if (status != errors::OK) {
            NFTAMM_LOG_WARN() << "router " << to_hex(router) << " rejected: "
                              << error_name(status);
            return status;
        }
        if (!previous || !previous->allowed) {
            journal.record("router " + to_hex(router), [this, caller, router, previous] {
                return access_->restore_router(caller, router, previous);
            });
        }
        routers_enabled.push_back(router);
    }

    for (const Address& target : config.call_targets) {
        const bool was_allowed = access_->is_call_allowed(target);
        int32_t status = access_->set_call_allowed(caller, target, true);
        if (status != errors::OK) {
            NFTAMM_LOG_WARN() << "call target " << to_hex(target) << " rejected: "
                              << error_name(status);
            return status;
        }
        if (!was_allowed) {
            journal.record("call target " + to_hex(target), [this, caller, target] {
                return access_->set_call_allowed(caller, target, false);
            });
        }
        targets_enabled.push_back(target);
    }

    journal.commit();
    for (const Address& router : routers_enabled) {
        listener_->on_router_status_update(router, true);
    }
    for (const Address& target : targets_enabled) {
        listener_->on_call_target_status_update(target, true);
    }
    NFTAMM_LOG_INFO() << "applied " << routers_enabled.size() << " routers and "
                      << targets_enabled.size() << " call targets";
    return errors::OK;
}

// =============================================================================
// Queries
// =============================================================================

const Address& PairFactory::template_for(PairVariant variant) const {
    return deployer_->template_for(variant);
}

void PairFactory::set_listener(FactoryListener* listener) {
    listener_ = listener != nullptr ? listener : &null_listener_;
}

PairFactory::Stats PairFactory::get_stats() const {
    return Stats{
        pairs_created_.load(std::memory_order_relaxed),
        pairs_rejected_.load(std::memory_order_relaxed),
        nft_deposits_.load(std::memory_order_relaxed),
        token_deposits_.load(std::memory_order_relaxed)
    };
}

} // namespace nftamm
