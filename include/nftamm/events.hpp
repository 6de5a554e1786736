#ifndef NFTAMM_EVENTS_HPP
#define NFTAMM_EVENTS_HPP

#include "types.hpp"

namespace nftamm {

struct NewPairEvent {
    Address pair;
    Address nft;
    PairVariant variant;
};

// Callback interface for factory notifications. Events fire only after the
// operation has fully succeeded.
class FactoryListener {
public:
    virtual ~FactoryListener() = default;

    virtual void on_new_pair(const NewPairEvent& event) = 0;
    virtual void on_token_deposit(const Address& pair) = 0;
    virtual void on_nft_deposit(const Address& pair) = 0;

    virtual void on_protocol_fee_recipient_update(const Address& recipient) = 0;
    virtual void on_protocol_fee_multiplier_update(U128 multiplier) = 0;
    virtual void on_bonding_curve_status_update(const Address& curve, bool allowed) = 0;
    virtual void on_call_target_status_update(const Address& target, bool allowed) = 0;
    virtual void on_router_status_update(const Address& router, bool allowed) = 0;
};

// No-op listener for when notifications aren't needed
class NullFactoryListener : public FactoryListener {
public:
    void on_new_pair(const NewPairEvent&) override {}
    void on_token_deposit(const Address&) override {}
    void on_nft_deposit(const Address&) override {}
    void on_protocol_fee_recipient_update(const Address&) override {}
    void on_protocol_fee_multiplier_update(U128) override {}
    void on_bonding_curve_status_update(const Address&, bool) override {}
    void on_call_target_status_update(const Address&, bool) override {}
    void on_router_status_update(const Address&, bool) override {}
};

} // namespace nftamm

#endif // NFTAMM_EVENTS_HPP
