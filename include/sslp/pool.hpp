#ifndef SSLP_POOL_HPP
#define SSLP_POOL_HPP

#include <map>
#include <set>
#include <unordered_map>
#include <shared_mutex>
#include <optional>
#include <vector>
#include <atomic>
#include <functional>
#include <utility>

#include "types.hpp"
#include "custody.hpp"

namespace sslp {

namespace addresses {
constexpr Address POOL_MANAGER = make_address(0x9010);
}

// =============================================================================
// Hook Interface
// =============================================================================

struct HookResult {
    int32_t code;          // errors::OK or a negative error code
    BalanceDelta delta;    // Hook's correction to the reported delta
};

// Position-change notifications. `sender` is the pool manager dispatching
// the call; `delta` is the AMM engine's reported delta for the caller.
class IHooks {
public:
    virtual ~IHooks() = default;

    virtual int32_t after_initialize(const Address& sender, const PoolKey& key) {
        (void)sender; (void)key;
        return errors::OK;
    }

    virtual HookResult after_add_liquidity(const Address& sender, const PoolKey& key,
                                           const ModifyLiquidityParams& params,
                                           const BalanceDelta& delta,
                                           const std::vector<uint8_t>& hook_data) {
        (void)sender; (void)key; (void)params; (void)delta; (void)hook_data;
        return {errors::OK, {0, 0}};
    }

    virtual HookResult after_remove_liquidity(const Address& sender, const PoolKey& key,
                                              const ModifyLiquidityParams& params,
                                              const BalanceDelta& delta,
                                              const std::vector<uint8_t>& hook_data) {
        (void)sender; (void)key; (void)params; (void)delta; (void)hook_data;
        return {errors::OK, {0, 0}};
    }
};

// =============================================================================
// Settlement Authority Interface
// =============================================================================

// Balance accounting surface of the pool manager, used by the hook that is
// currently being dispatched.
class ISettlement {
public:
    virtual ~ISettlement() = default;

    // Pay `amount` of `currency` into the manager
    virtual int32_t settle(const Currency& currency, I128 amount) = 0;

    // Withdraw `amount` of `currency` from the manager
    virtual int32_t take(const Currency& currency, I128 amount) = 0;
};

// =============================================================================
// PoolManager - AMM host: pool registry, hook dispatch, flash accounting
//
// Liquidity deltas are supplied by the caller of modify_liquidity (they are
// the AMM engine's opaque output); the manager only routes them.
// =============================================================================

class PoolManager : public ISettlement {
public:
    explicit PoolManager(TokenLedger& tokens, const Address& self = addresses::POOL_MANAGER);
    ~PoolManager() override = default;

    // Non-copyable
    PoolManager(const PoolManager&) = delete;
    PoolManager& operator=(const PoolManager&) = delete;

    const Address& address() const { return self_; }

    // =========================================================================
    // Core Operations
    // =========================================================================

    int32_t initialize(const PoolKey& key);

    struct ModifyResult {
        int32_t code;
        BalanceDelta caller_delta;   // reported - hook_delta
        BalanceDelta hook_delta;
    };

    // Must be called within lock()
    ModifyResult modify_liquidity(const PoolKey& key, const ModifyLiquidityParams& params,
                                  const BalanceDelta& reported,
                                  const std::vector<uint8_t>& hook_data = {});

    // =========================================================================
    // Flash Accounting
    // =========================================================================

    // Run `callback` with the manager unlocked for modify/settle/take.
    // Throws if re-entered or if any account delta is non-zero afterwards.
    using LockCallback = std::function<void()>;
    void lock(LockCallback callback);

    // Caller-side settlement - must be called within lock()
    int32_t settle_for(const Address& payer, const Currency& currency, I128 amount);
    int32_t take_to(const Address& recipient, const Currency& currency, I128 amount);

    // ISettlement: attributed to the hook being dispatched
    int32_t settle(const Currency& currency, I128 amount) override;
    int32_t take(const Currency& currency, I128 amount) override;

    I128 currency_delta(const Address& account, const Currency& currency) const;
    bool is_locked() const { return locked_; }

    // =========================================================================
    // Queries
    // =========================================================================

    bool pool_exists(const PoolKey& key) const;

    // =========================================================================
    // Hook Registration
    // =========================================================================

    void register_hooks(const Address& hook_addr, IHooks* hooks);

    // =========================================================================
    // Statistics
    // =========================================================================

    struct Stats {
        uint64_t total_pools;
        uint64_t total_liquidity_ops;
    };
    Stats get_stats() const;

private:
    TokenLedger& tokens_;
    Address self_;

    // Initialized pools
    std::set<PoolKey> pools_;
    mutable std::shared_mutex pools_mutex_;

    // Hook registry
    std::unordered_map<Address, IHooks*, AddressHash> hooks_;
    mutable std::shared_mutex hooks_mutex_;

    // Flash accounting state
    bool locked_{false};
    std::map<std::pair<Address, Currency>, I128> currency_deltas_;
    std::optional<Address> active_hook_;

    std::atomic<uint64_t> total_liquidity_ops_{0};

    IHooks* get_hooks(const PoolKey& key) const;
    void account_delta(const Address& account, const Currency& currency, I128 delta);
    void account_delta(const Address& account, const PoolKey& key, const BalanceDelta& delta);
};

} // namespace sslp

#endif // SSLP_POOL_HPP
