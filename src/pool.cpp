// =============================================================================
// pool.cpp - PoolManager: hook dispatch and flash accounting
// =============================================================================

#include "sslp/pool.hpp"
#include <mutex>
#include <stdexcept>

namespace sslp {

namespace {

// Marks the hook currently being dispatched; cleared on every exit path
class ActiveHookGuard {
public:
    ActiveHookGuard(std::optional<Address>& slot, const Address& hook) : slot_(slot) {
        slot_ = hook;
    }
    ~ActiveHookGuard() { slot_.reset(); }

    ActiveHookGuard(const ActiveHookGuard&) = delete;
    ActiveHookGuard& operator=(const ActiveHookGuard&) = delete;

private:
    std::optional<Address>& slot_;
};

} // anonymous namespace

// =============================================================================
// Constructor
// =============================================================================

PoolManager::PoolManager(TokenLedger& tokens, const Address& self)
    : tokens_(tokens), self_(self) {}

// =============================================================================
// Internal Helpers
// =============================================================================

IHooks* PoolManager::get_hooks(const PoolKey& key) const {
    if (is_zero_address(key.hooks)) return nullptr;
    std::shared_lock lock(hooks_mutex_);
    auto it = hooks_.find(key.hooks);
    return it != hooks_.end() ? it->second : nullptr;
}

void PoolManager::account_delta(const Address& account, const Currency& currency, I128 delta) {
    if (delta == 0) return;
    currency_deltas_[{account, currency}] += delta;
}

void PoolManager::account_delta(const Address& account, const PoolKey& key,
                                const BalanceDelta& delta) {
    account_delta(account, key.currency0, delta.amount0);
    account_delta(account, key.currency1, delta.amount1);
}

// =============================================================================
// Initialize Pool
// =============================================================================

int32_t PoolManager::initialize(const PoolKey& key) {
    if (key.currency0 == key.currency1) {
        return errors::INVALID_CURRENCY;
    }
    if (!(key.currency0 < key.currency1)) {
        return errors::CURRENCIES_NOT_SORTED;
    }

    {
        std::unique_lock lock(pools_mutex_);
        if (!pools_.insert(key).second) {
            return errors::POOL_ALREADY_INITIALIZED;
        }
    }

    IHooks* hooks = get_hooks(key);
    if (hooks) {
        int32_t rc = hooks->after_initialize(self_, key);
        if (rc != errors::OK) {
            std::unique_lock lock(pools_mutex_);
            pools_.erase(key);
            return rc;
        }
    }

    return errors::OK;
}

// =============================================================================
// Modify Liquidity
// =============================================================================

PoolManager::ModifyResult PoolManager::modify_liquidity(const PoolKey& key,
                                                        const ModifyLiquidityParams& params,
                                                        const BalanceDelta& reported,
                                                        const std::vector<uint8_t>& hook_data) {
    if (!locked_) {
        throw std::runtime_error("PoolManager: not locked");
    }
    if (!pool_exists(key)) {
        return {errors::POOL_NOT_INITIALIZED, {0, 0}, {0, 0}};
    }

    BalanceDelta hook_delta{0, 0};
    IHooks* hooks = get_hooks(key);
    if (hooks) {
        ActiveHookGuard guard(active_hook_, key.hooks);
        HookResult hr = params.increase
            ? hooks->after_add_liquidity(self_, key, params, reported, hook_data)
            : hooks->after_remove_liquidity(self_, key, params, reported, hook_data);
        if (hr.code != errors::OK) {
            return {hr.code, {0, 0}, {0, 0}};
        }
        hook_delta = hr.delta;
    }

    BalanceDelta caller_delta = reported - hook_delta;
    account_delta(params.controller, key, caller_delta);
    if (hooks) {
        account_delta(key.hooks, key, hook_delta);
    }

    total_liquidity_ops_.fetch_add(1, std::memory_order_relaxed);
    return {errors::OK, caller_delta, hook_delta};
}

// =============================================================================
// Flash Accounting
// =============================================================================

void PoolManager::lock(LockCallback callback) {
    if (locked_) {
        throw std::runtime_error("PoolManager: already locked (reentrancy)");
    }

    locked_ = true;
    currency_deltas_.clear();

    try {
        callback();
    } catch (...) {
        locked_ = false;
        currency_deltas_.clear();
        throw;
    }

    // Verify all deltas settled to zero
    for (const auto& [account, delta] : currency_deltas_) {
        if (delta != 0) {
            locked_ = false;
            currency_deltas_.clear();
            throw std::runtime_error("PoolManager: unsettled currency delta");
        }
    }

    locked_ = false;
    currency_deltas_.clear();
}

int32_t PoolManager::settle_for(const Address& payer, const Currency& currency, I128 amount) {
    if (!locked_) {
        throw std::runtime_error("PoolManager: not locked");
    }
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    int32_t rc = tokens_.transfer(payer, self_, currency, amount);
    if (rc != errors::OK) {
        return errors::SETTLEMENT_FAILED;
    }
    // Paying in credits the payer
    account_delta(payer, currency, amount);
    return errors::OK;
}

int32_t PoolManager::take_to(const Address& recipient, const Currency& currency, I128 amount) {
    if (!locked_) {
        throw std::runtime_error("PoolManager: not locked");
    }
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    int32_t rc = tokens_.transfer(self_, recipient, currency, amount);
    if (rc != errors::OK) {
        return errors::SETTLEMENT_FAILED;
    }
    // Taking out creates debt for the recipient
    account_delta(recipient, currency, -amount);
    return errors::OK;
}

int32_t PoolManager::settle(const Currency& currency, I128 amount) {
    if (!active_hook_) {
        return errors::UNAUTHORIZED;
    }
    return settle_for(*active_hook_, currency, amount);
}

int32_t PoolManager::take(const Currency& currency, I128 amount) {
    if (!active_hook_) {
        return errors::UNAUTHORIZED;
    }
    return take_to(*active_hook_, currency, amount);
}

I128 PoolManager::currency_delta(const Address& account, const Currency& currency) const {
    auto it = currency_deltas_.find({account, currency});
    return it != currency_deltas_.end() ? it->second : 0;
}

// =============================================================================
// Query Operations
// =============================================================================

bool PoolManager::pool_exists(const PoolKey& key) const {
    std::shared_lock lock(pools_mutex_);
    return pools_.count(key) != 0;
}

// =============================================================================
// Hook Registration
// =============================================================================

void PoolManager::register_hooks(const Address& hook_addr, IHooks* hooks) {
    if (!hooks || is_zero_address(hook_addr)) return;
    std::unique_lock lock(hooks_mutex_);
    hooks_[hook_addr] = hooks;
}

// =============================================================================
// Statistics
// =============================================================================

PoolManager::Stats PoolManager::get_stats() const {
    std::shared_lock lock(pools_mutex_);
    return Stats{
        static_cast<uint64_t>(pools_.size()),
        total_liquidity_ops_.load()
    };
}

} // namespace sslp
