#ifndef NFTAMM_FEE_CONTROLLER_HPP
#define NFTAMM_FEE_CONTROLLER_HPP

#include <optional>
#include <shared_mutex>

#include "assets.hpp"
#include "ownable.hpp"

namespace nftamm {

struct FeeWithdrawal {
    int32_t status;
    U128 amount;
};

// =============================================================================
// FeeController - protocol fee recipient and multiplier
// =============================================================================

class FeeController {
public:
    // treasury is the account that accrues protocol fees (the factory itself).
    // Throws std::invalid_argument on a null recipient or a multiplier above
    // MAX_PROTOCOL_FEE.
    FeeController(const Ownable& ownable, INativeLedger& native, const Address& treasury,
                  const Address& recipient, U128 multiplier);

    FeeController(const FeeController&) = delete;
    FeeController& operator=(const FeeController&) = delete;

    int32_t change_recipient(const Address& caller, const Address& new_recipient);
    int32_t change_multiplier(const Address& caller, U128 new_multiplier);

    // Sweep the treasury's whole balance of the asset to the fee recipient
    FeeWithdrawal withdraw_native_fees(const Address& caller);
    FeeWithdrawal withdraw_token_fees(const Address& caller, IToken& token);

    Address recipient() const;
    U128 multiplier() const;

    // Protocol cut of a trade worth `amount`
    std::optional<U128> protocol_fee_for(U128 amount) const;

private:
    const Ownable& ownable_;
    INativeLedger& native_;
    Address treasury_;

    Address recipient_;
    U128 multiplier_;
    mutable std::shared_mutex mutex_;
};

} // namespace nftamm

#endif // NFTAMM_FEE_CONTROLLER_HPP
