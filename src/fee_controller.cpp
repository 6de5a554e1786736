// =============================================================================
// fee_controller.cpp - Protocol fee configuration and withdrawal
// =============================================================================

#include "nftamm/fee_controller.hpp"

#include <mutex>
#include <stdexcept>

namespace nftamm {

FeeController::FeeController(const Ownable& ownable, INativeLedger& native,
                             const Address& treasury, const Address& recipient,
                             U128 multiplier)
    : ownable_(ownable)
    , native_(native)
    , treasury_(treasury)
    , recipient_(recipient)
    , multiplier_(multiplier) {
    if (addresses::is_zero(recipient)) {
        throw std::invalid_argument("FeeController: fee recipient must not be the zero address");
    }
    if (multiplier > MAX_PROTOCOL_FEE) {
        throw std::invalid_argument("FeeController: fee multiplier above MAX_PROTOCOL_FEE");
    }
}

int32_t FeeController::change_recipient(const Address& caller, const Address& new_recipient) {
    if (!ownable_.is_owner(caller)) {
        return errors::UNAUTHORIZED;
    }
    if (addresses::is_zero(new_recipient)) {
        return errors::ZERO_ADDRESS;
    }

    std::unique_lock lock(mutex_);
    recipient_ = new_recipient;
    return errors::OK;
}

int32_t FeeController::change_multiplier(const Address& caller, U128 new_multiplier) {
    if (!ownable_.is_owner(caller)) {
        return errors::UNAUTHORIZED;
    }
    if (new_multiplier > MAX_PROTOCOL_FEE) {
        return errors::FEE_MULTIPLIER_TOO_LARGE;
    }

    std::unique_lock lock(mutex_);
    multiplier_ = new_multiplier;
    return errors::OK;
}

FeeWithdrawal FeeController::withdraw_native_fees(const Address& caller) {
    if (!ownable_.is_owner(caller)) {
        return {errors::UNAUTHORIZED, 0};
    }

    U128 amount = native_.balance_of(treasury_);
    int32_t status = native_.transfer(treasury_, recipient(), amount);
    return {status, status == errors::OK ? amount : 0};
}

FeeWithdrawal FeeController::withdraw_token_fees(const Address& caller, IToken& token) {
    if (!ownable_.is_owner(caller)) {
        return {errors::UNAUTHORIZED, 0};
    }

    U128 amount = token.balance_of(treasury_);
    int32_t status = token.transfer_from(treasury_, treasury_, recipient(), amount);
    return {status, status == errors::OK ? amount : 0};
}

Address FeeController::recipient() const {
    std::shared_lock lock(mutex_);
    return recipient_;
}

U128 FeeController::multiplier() const {
    std::shared_lock lock(mutex_);
    return multiplier_;
}

std::optional<U128> FeeController::protocol_fee_for(U128 amount) const {
    return x18::fmul(amount, multiplier());
}

} // namespace nftamm
