#ifndef SSLP_LEDGER_HPP
#define SSLP_LEDGER_HPP

#include <array>
#include <unordered_map>
#include <optional>
#include <vector>

#include "types.hpp"

namespace sslp {

// Per-asset signed pair, indexed by index_of(Asset)
using AssetPair = std::array<I128, 2>;

// =============================================================================
// Operation Results
// =============================================================================

struct MatchResult {
    Asset asset;          // Matched asset
    I128 need;            // Delta the notification reported for the asset
    I128 fronted;         // Amount covered from the reservoir (<= 0)
    I128 shortfall;       // need - fronted, left to ordinary settlement
    bool partial;         // Reservoir could not cover all of `need`
};

struct UnwindResult {
    Asset asset;
    I128 amount;          // Positive delta returned to the caller
    I128 reclaimed;       // Debt repaid to the reservoir (>= 0, <= amount)
    I128 remaining_debt;  // Position debt after the unwind (<= 0)
};

// =============================================================================
// Ledger Snapshot (read-only export)
// =============================================================================

struct LedgerSnapshot {
    struct Balance {
        Address depositor;
        AssetPair amounts;
    };
    struct Debt {
        PositionId position;
        AssetPair amounts;
    };

    AssetPair reservoir;
    std::vector<Balance> balances;   // Sorted by depositor
    std::vector<Debt> debts;         // Sorted by position, zero entries included
};

// =============================================================================
// PoolLedger - reservoir, depositor balances and position debt of one pool
//
// Not thread-safe; the owner serializes access. Planning functions are const
// so callers can validate before anything is mutated.
// =============================================================================

class PoolLedger {
public:
    PoolLedger() = default;

    // =========================================================================
    // Queries
    // =========================================================================

    I128 reservoir(Asset asset) const { return reservoir_[index_of(asset)]; }
    I128 balance(const Address& depositor, Asset asset) const;
    I128 debt(const PositionId& position, Asset asset) const;

    // Sum of all position debts for an asset (<= 0)
    I128 outstanding_debt(Asset asset) const;

    // Sum of all depositor balances for an asset (>= 0)
    I128 total_balances(Asset asset) const;

    size_t depositor_count() const { return balances_.size(); }
    size_t position_count() const { return debts_.size(); }

    // =========================================================================
    // Depositor Ledger
    // =========================================================================

    // Record a fund: balance += amount, reservoir -= amount.
    // AMOUNT_OVERFLOW if the asset's total funded would exceed I128_MAX.
    int32_t credit(const Address& depositor, Asset asset, I128 amount);

    // Validate a defund without mutating anything
    int32_t check_debit(const Address& depositor, Asset asset, I128 amount) const;

    // Record a defund: balance -= amount, reservoir += amount
    int32_t debit(const Address& depositor, Asset asset, I128 amount);

    // =========================================================================
    // Matching / Unwind
    // =========================================================================

    MatchResult plan_match(Asset asset, I128 need) const;
    void apply_match(const PositionId& position, const MatchResult& result);
    MatchResult match(const PositionId& position, Asset asset, I128 need);

    UnwindResult plan_unwind(const PositionId& position, Asset asset, I128 amount) const;
    void apply_unwind(const PositionId& position, const UnwindResult& result);
    UnwindResult unwind(const PositionId& position, Asset asset, I128 amount);

    // =========================================================================
    // Invariants
    // =========================================================================

    // True iff, for both assets: reservoir <= 0, every debt <= 0, every
    // balance >= 0 and reservoir + sum(debt) == -sum(balance)
    bool check_invariants() const;

    // =========================================================================
    // Rollback
    // =========================================================================

    // Prior state of the entries an operation may touch
    struct Checkpoint {
        AssetPair reservoir;
        std::optional<Address> depositor;
        std::optional<AssetPair> balance;     // nullopt: entry did not exist
        std::optional<PositionId> position;
        std::optional<AssetPair> debt;
    };

    Checkpoint checkpoint() const;
    Checkpoint checkpoint(const Address& depositor) const;
    Checkpoint checkpoint(const PositionId& position) const;
    void restore(const Checkpoint& cp);

    LedgerSnapshot snapshot() const;

private:
    AssetPair reservoir_{0, 0};
    std::unordered_map<Address, AssetPair, AddressHash> balances_;
    std::unordered_map<PositionId, AssetPair, PositionIdHash> debts_;
};

} // namespace sslp

#endif // SSLP_LEDGER_HPP
