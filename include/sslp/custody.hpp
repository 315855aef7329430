#ifndef SSLP_CUSTODY_HPP
#define SSLP_CUSTODY_HPP

#include <map>
#include <shared_mutex>
#include <utility>

#include "types.hpp"

namespace sslp {

// =============================================================================
// Value Transfer Interface
// =============================================================================

// Moves asset units between an external account and the engine's custody.
// Both calls return errors::OK or a negative error code; on error nothing
// has moved.
class ITokenTransfer {
public:
    virtual ~ITokenTransfer() = default;

    virtual int32_t transfer_in(const Currency& currency, const Address& from, I128 amount) = 0;
    virtual int32_t transfer_out(const Currency& currency, const Address& to, I128 amount) = 0;
};

// =============================================================================
// TokenLedger - in-memory token balances
// =============================================================================

class TokenLedger {
public:
    TokenLedger() = default;

    // Non-copyable
    TokenLedger(const TokenLedger&) = delete;
    TokenLedger& operator=(const TokenLedger&) = delete;

    // Create `amount` new units for `holder`
    int32_t mint(const Address& holder, const Currency& currency, I128 amount);

    int32_t transfer(const Address& from, const Address& to,
                     const Currency& currency, I128 amount);

    I128 balance_of(const Address& holder, const Currency& currency) const;

private:
    using Key = std::pair<Address, Currency>;

    std::map<Key, I128> balances_;
    mutable std::shared_mutex mutex_;
};

// =============================================================================
// Custody - ITokenTransfer over a TokenLedger, holding funds at one address
// =============================================================================

class Custody : public ITokenTransfer {
public:
    Custody(TokenLedger& tokens, const Address& holder)
        : tokens_(tokens), holder_(holder) {}

    int32_t transfer_in(const Currency& currency, const Address& from, I128 amount) override {
        return tokens_.transfer(from, holder_, currency, amount);
    }

    int32_t transfer_out(const Currency& currency, const Address& to, I128 amount) override {
        return tokens_.transfer(holder_, to, currency, amount);
    }

    const Address& holder() const { return holder_; }

private:
    TokenLedger& tokens_;
    Address holder_;
};

} // namespace sslp

#endif // SSLP_CUSTODY_HPP
