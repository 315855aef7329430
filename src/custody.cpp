// =============================================================================
// custody.cpp - In-memory token balances
// =============================================================================

#include "sslp/custody.hpp"
#include <mutex>

namespace sslp {

int32_t TokenLedger::mint(const Address& holder, const Currency& currency, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);
    balances_[{holder, currency}] += amount;
    return errors::OK;
}

int32_t TokenLedger::transfer(const Address& from, const Address& to,
                              const Currency& currency, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    std::unique_lock lock(mutex_);

    auto it = balances_.find({from, currency});
    if (it == balances_.end() || it->second < amount) {
        return errors::TRANSFER_FAILED;
    }

    it->second -= amount;
    balances_[{to, currency}] += amount;
    return errors::OK;
}

I128 TokenLedger::balance_of(const Address& holder, const Currency& currency) const {
    std::shared_lock lock(mutex_);
    auto it = balances_.find({holder, currency});
    return it != balances_.end() ? it->second : 0;
}

} // namespace sslp
