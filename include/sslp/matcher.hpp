#ifndef SSLP_MATCHER_HPP
#define SSLP_MATCHER_HPP

#include <map>
#include <shared_mutex>
#include <optional>
#include <vector>
#include <atomic>

#include "types.hpp"
#include "ledger.hpp"
#include "instruction.hpp"
#include "custody.hpp"
#include "pool.hpp"
#include "listener.hpp"
#include "config.hpp"

namespace sslp {

// =============================================================================
// SingleSidedMatcher - single-sided liquidity hook
//
// Depositors fund a per-pool reservoir of either asset. A contribution that
// supplies one asset has the other asset fronted from the reservoir and the
// fronted amount recorded as debt of that position; reducing the position
// repays the debt into the reservoir first.
//
// Every operation is serialized per matcher and is all-or-nothing: ledgers
// are restored when the transfer or settlement call fails.
// =============================================================================

class SingleSidedMatcher : public IHooks {
public:
    // `self` is the hook address pools must carry in PoolKey::hooks;
    // `manager` is the only sender accepted for hook callbacks.
    SingleSidedMatcher(ISettlement& settlement, ITokenTransfer& custody,
                       const Address& self, const Address& manager,
                       MatcherConfig config = {});
    ~SingleSidedMatcher() override = default;

    // Non-copyable
    SingleSidedMatcher(const SingleSidedMatcher&) = delete;
    SingleSidedMatcher& operator=(const SingleSidedMatcher&) = delete;

    const Address& address() const { return self_; }
    const MatcherConfig& config() const { return config_; }

    // =========================================================================
    // Depositor Operations
    // =========================================================================

    // Pull `amount` from the depositor into custody and add it to the reservoir
    int32_t fund(const PoolKey& key, const Address& depositor, Asset asset, I128 amount);

    // Return `amount` from the unmatched reservoir to the depositor
    int32_t defund(const PoolKey& key, const Address& depositor, Asset asset, I128 amount);

    // =========================================================================
    // Hook Callbacks (IHooks)
    // =========================================================================

    // Binds a fresh, zeroed ledger to the pool
    int32_t after_initialize(const Address& sender, const PoolKey& key) override;

    // Matching: fronts the instructed asset from the reservoir
    HookResult after_add_liquidity(const Address& sender, const PoolKey& key,
                                   const ModifyLiquidityParams& params,
                                   const BalanceDelta& delta,
                                   const std::vector<uint8_t>& hook_data) override;

    // Unwind: reclaims outstanding debt from each positive asset delta
    HookResult after_remove_liquidity(const Address& sender, const PoolKey& key,
                                      const ModifyLiquidityParams& params,
                                      const BalanceDelta& delta,
                                      const std::vector<uint8_t>& hook_data) override;

    // =========================================================================
    // Queries
    // =========================================================================

    bool pool_bound(const PoolKey& key) const;
    I128 reservoir(const PoolKey& key, Asset asset) const;
    I128 balance(const PoolKey& key, const Address& depositor, Asset asset) const;
    I128 position_debt(const PoolKey& key, const PositionId& position, Asset asset) const;
    I128 outstanding_debt(const PoolKey& key, Asset asset) const;
    std::optional<LedgerSnapshot> snapshot(const PoolKey& key) const;

    // False for unbound pools
    bool check_invariants(const PoolKey& key) const;

    // =========================================================================
    // Listener / Statistics
    // =========================================================================

    void set_listener(LedgerListener* listener);

    struct Stats {
        uint64_t pools_bound;
        uint64_t total_funds;
        uint64_t total_defunds;
        uint64_t full_matches;
        uint64_t partial_matches;
        uint64_t unwinds;
        uint64_t rejections;
        AssetPair total_fronted;     // Magnitudes, per asset
        AssetPair total_reclaimed;
    };
    Stats get_stats() const;

private:
    ISettlement& settlement_;
    ITokenTransfer& custody_;
    Address self_;
    Address manager_;
    MatcherConfig config_;

    // Ledgers by full pool key
    std::map<PoolKey, PoolLedger> ledgers_;
    mutable std::shared_mutex ledgers_mutex_;

    NullLedgerListener null_listener_;
    std::atomic<LedgerListener*> listener_;

    // Statistics
    std::atomic<uint64_t> total_funds_{0};
    std::atomic<uint64_t> total_defunds_{0};
    std::atomic<uint64_t> full_matches_{0};
    std::atomic<uint64_t> partial_matches_{0};
    std::atomic<uint64_t> unwinds_{0};
    std::atomic<uint64_t> rejections_{0};
    AssetPair total_fronted_{0, 0};      // Guarded by ledgers_mutex_
    AssetPair total_reclaimed_{0, 0};

    PoolLedger* get_ledger(const PoolKey& key);
    const PoolLedger* get_ledger(const PoolKey& key) const;

    bool authorized(const Address& sender, const PoolKey& key) const;
    int32_t reject(const PoolKey& key, const char* operation, int32_t code);
};

} // namespace sslp

#endif // SSLP_MATCHER_HPP
