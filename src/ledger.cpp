// =============================================================================
// ledger.cpp - Reservoir, depositor ledger and position debt ledger
// =============================================================================

#include "sslp/ledger.hpp"
#include <algorithm>

namespace sslp {

// =============================================================================
// Queries
// =============================================================================

I128 PoolLedger::balance(const Address& depositor, Asset asset) const {
    auto it = balances_.find(depositor);
    return it != balances_.end() ? it->second[index_of(asset)] : 0;
}

I128 PoolLedger::debt(const PositionId& position, Asset asset) const {
    auto it = debts_.find(position);
    return it != debts_.end() ? it->second[index_of(asset)] : 0;
}

I128 PoolLedger::outstanding_debt(Asset asset) const {
    I128 total = 0;
    for (const auto& [position, amounts] : debts_) {
        total += amounts[index_of(asset)];
    }
    return total;
}

I128 PoolLedger::total_balances(Asset asset) const {
    I128 total = 0;
    for (const auto& [depositor, amounts] : balances_) {
        total += amounts[index_of(asset)];
    }
    return total;
}

// =============================================================================
// Depositor Ledger
// =============================================================================

int32_t PoolLedger::credit(const Address& depositor, Asset asset, I128 amount) {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }

    // Every balance, debt and the reservoir are bounded by the total funded
    if (total_balances(asset) > I128_MAX - amount) {
        return errors::AMOUNT_OVERFLOW;
    }

    const size_t i = index_of(asset);
    auto& entry = balances_[depositor];  // Created on first fund
    entry[i] += amount;
    reservoir_[i] -= amount;
    return errors::OK;
}

int32_t PoolLedger::check_debit(const Address& depositor, Asset asset, I128 amount) const {
    if (amount <= 0) {
        return errors::INVALID_AMOUNT;
    }
    if (balance(depositor, asset) < amount) {
        return errors::INSUFFICIENT_BALANCE;
    }
    // The surplus must cover the withdrawal; fronted debt is never recalled
    if (amount + reservoir_[index_of(asset)] > 0) {
        return errors::INSUFFICIENT_UNMATCHED_LIQUIDITY;
    }
    return errors::OK;
}

int32_t PoolLedger::debit(const Address& depositor, Asset asset, I128 amount) {
    int32_t rc = check_debit(depositor, asset, amount);
    if (rc != errors::OK) {
        return rc;
    }

    const size_t i = index_of(asset);
    balances_[depositor][i] -= amount;
    reservoir_[i] += amount;
    return errors::OK;
}

// =============================================================================
// Matching
// =============================================================================

MatchResult PoolLedger::plan_match(Asset asset, I128 need) const {
    MatchResult r{};
    r.asset = asset;
    r.need = need;

    if (need >= 0) {
        // The contribution requires none of this asset
        r.fronted = 0;
        r.shortfall = 0;
        r.partial = false;
        return r;
    }

    I128 res = reservoir_[index_of(asset)];
    if (res <= need) {
        r.fronted = need;
        r.partial = false;
    } else {
        // Drain whatever surplus is left; a non-negative reservoir fronts nothing
        r.fronted = res < 0 ? res : 0;
        r.partial = true;
    }
    r.shortfall = need - r.fronted;
    return r;
}

void PoolLedger::apply_match(const PositionId& position, const MatchResult& result) {
    if (result.fronted == 0) return;

    const size_t i = index_of(result.asset);
    reservoir_[i] -= result.fronted;
    debts_[position][i] += result.fronted;
}

MatchResult PoolLedger::match(const PositionId& position, Asset asset, I128 need) {
    MatchResult r = plan_match(asset, need);
    apply_match(position, r);
    return r;
}

// =============================================================================
// Unwind
// =============================================================================

UnwindResult PoolLedger::plan_unwind(const PositionId& position, Asset asset, I128 amount) const {
    UnwindResult r{};
    r.asset = asset;
    r.amount = amount;

    I128 current = debt(position, asset);
    if (amount <= 0 || current >= 0) {
        r.reclaimed = 0;
        r.remaining_debt = current < 0 ? current : 0;
        return r;
    }

    I128 residual = amount + current;
    if (residual >= 0) {
        r.reclaimed = -current;
        r.remaining_debt = 0;
    } else {
        r.reclaimed = amount;
        r.remaining_debt = residual;
    }
    return r;
}

void PoolLedger::apply_unwind(const PositionId& position, const UnwindResult& result) {
    if (result.reclaimed == 0) return;

    const size_t i = index_of(result.asset);
    debts_[position][i] = result.remaining_debt;
    reservoir_[i] -= result.reclaimed;
}

UnwindResult PoolLedger::unwind(const PositionId& position, Asset asset, I128 amount) {
    UnwindResult r = plan_unwind(position, asset, amount);
    apply_unwind(position, r);
    return r;
}

// =============================================================================
// Invariants
// =============================================================================

bool PoolLedger::check_invariants() const {
    for (Asset asset : {Asset::A, Asset::B}) {
        const size_t i = index_of(asset);
        if (reservoir_[i] > 0) return false;

        I128 debt_sum = 0;
        for (const auto& [position, amounts] : debts_) {
            if (amounts[i] > 0) return false;
            debt_sum += amounts[i];
        }

        I128 balance_sum = 0;
        for (const auto& [depositor, amounts] : balances_) {
            if (amounts[i] < 0) return false;
            balance_sum += amounts[i];
        }

        if (reservoir_[i] + debt_sum != -balance_sum) return false;
    }
    return true;
}

// =============================================================================
// Rollback
// =============================================================================

PoolLedger::Checkpoint PoolLedger::checkpoint() const {
    Checkpoint cp{};
    cp.reservoir = reservoir_;
    return cp;
}

PoolLedger::Checkpoint PoolLedger::checkpoint(const Address& depositor) const {
    Checkpoint cp = checkpoint();
    cp.depositor = depositor;
    auto it = balances_.find(depositor);
    if (it != balances_.end()) cp.balance = it->second;
    return cp;
}

PoolLedger::Checkpoint PoolLedger::checkpoint(const PositionId& position) const {
    Checkpoint cp = checkpoint();
    cp.position = position;
    auto it = debts_.find(position);
    if (it != debts_.end()) cp.debt = it->second;
    return cp;
}

void PoolLedger::restore(const Checkpoint& cp) {
    reservoir_ = cp.reservoir;

    if (cp.depositor) {
        if (cp.balance) {
            balances_[*cp.depositor] = *cp.balance;
        } else {
            balances_.erase(*cp.depositor);
        }
    }

    if (cp.position) {
        if (cp.debt) {
            debts_[*cp.position] = *cp.debt;
        } else {
            debts_.erase(*cp.position);
        }
    }
}

LedgerSnapshot PoolLedger::snapshot() const {
    LedgerSnapshot snap;
    snap.reservoir = reservoir_;

    snap.balances.reserve(balances_.size());
    for (const auto& [depositor, amounts] : balances_) {
        snap.balances.push_back({depositor, amounts});
    }
    std::sort(snap.balances.begin(), snap.balances.end(),
              [](const auto& a, const auto& b) { return a.depositor < b.depositor; });

    snap.debts.reserve(debts_.size());
    for (const auto& [position, amounts] : debts_) {
        snap.debts.push_back({position, amounts});
    }
    std::sort(snap.debts.begin(), snap.debts.end(),
              [](const auto& a, const auto& b) { return a.position < b.position; });

    return snap;
}

} // namespace sslp
