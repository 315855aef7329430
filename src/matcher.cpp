// =============================================================================
// matcher.cpp - Single-sided liquidity matching hook
// =============================================================================

#include "sslp/matcher.hpp"
#include <mutex>
#include <stdexcept>
#include <utility>

namespace sslp {

// =============================================================================
// Constructor
// =============================================================================

SingleSidedMatcher::SingleSidedMatcher(ISettlement& settlement, ITokenTransfer& custody,
                                       const Address& self, const Address& manager,
                                       MatcherConfig config)
    : settlement_(settlement),
      custody_(custody),
      self_(self),
      manager_(manager),
      config_(std::move(config)),
      listener_(&null_listener_) {}

// =============================================================================
// Internal Helpers
// =============================================================================

PoolLedger* SingleSidedMatcher::get_ledger(const PoolKey& key) {
    auto it = ledgers_.find(key);
    return it != ledgers_.end() ? &it->second : nullptr;
}

const PoolLedger* SingleSidedMatcher::get_ledger(const PoolKey& key) const {
    auto it = ledgers_.find(key);
    return it != ledgers_.end() ? &it->second : nullptr;
}

bool SingleSidedMatcher::authorized(const Address& sender, const PoolKey& key) const {
    return sender == manager_ && key.hooks == self_;
}

int32_t SingleSidedMatcher::reject(const PoolKey& key, const char* operation, int32_t code) {
    rejections_.fetch_add(1, std::memory_order_relaxed);
    listener_.load(std::memory_order_acquire)->on_rejected(key, operation, code);
    return code;
}

void SingleSidedMatcher::set_listener(LedgerListener* listener) {
    listener_.store(listener ? listener : &null_listener_, std::memory_order_release);
}

// =============================================================================
// Depositor Operations
// =============================================================================

int32_t SingleSidedMatcher::fund(const PoolKey& key, const Address& depositor,
                                 Asset asset, I128 amount) {
    if (amount <= 0 || amount < config_.min_fund_amount) {
        return reject(key, "fund", errors::INVALID_AMOUNT);
    }

    int32_t rc = errors::OK;
    {
        std::unique_lock lock(ledgers_mutex_);

        PoolLedger* ledger = get_ledger(key);
        if (!ledger) {
            rc = errors::POOL_NOT_INITIALIZED;
        } else {
            PoolLedger::Checkpoint cp = ledger->checkpoint(depositor);
            rc = ledger->credit(depositor, asset, amount);

            if (rc == errors::OK) {
                int32_t transfer_rc = errors::OK;
                try {
                    transfer_rc = custody_.transfer_in(key.currency(asset), depositor, amount);
                } catch (...) {
                    ledger->restore(cp);
                    throw;
                }
                if (transfer_rc != errors::OK) {
                    ledger->restore(cp);
                    rc = errors::TRANSFER_FAILED;
                }
            }
        }
    }

    if (rc != errors::OK) {
        return reject(key, "fund", rc);
    }

    total_funds_.fetch_add(1, std::memory_order_relaxed);
    listener_.load(std::memory_order_acquire)->on_fund(key, depositor, asset, amount);
    return errors::OK;
}

int32_t SingleSidedMatcher::defund(const PoolKey& key, const Address& depositor,
                                   Asset asset, I128 amount) {
    int32_t rc = errors::OK;
    {
        std::unique_lock lock(ledgers_mutex_);

        PoolLedger* ledger = get_ledger(key);
        if (!ledger) {
            rc = errors::POOL_NOT_INITIALIZED;
        } else {
            PoolLedger::Checkpoint cp = ledger->checkpoint(depositor);
            rc = ledger->debit(depositor, asset, amount);

            if (rc == errors::OK) {
                int32_t transfer_rc = errors::OK;
                try {
                    transfer_rc = custody_.transfer_out(key.currency(asset), depositor, amount);
                } catch (...) {
                    ledger->restore(cp);
                    throw;
                }
                if (transfer_rc != errors::OK) {
                    ledger->restore(cp);
                    rc = errors::TRANSFER_FAILED;
                }
            }
        }
    }

    if (rc != errors::OK) {
        return reject(key, "defund", rc);
    }

    total_defunds_.fetch_add(1, std::memory_order_relaxed);
    listener_.load(std::memory_order_acquire)->on_defund(key, depositor, asset, amount);
    return errors::OK;
}

// =============================================================================
// Hook Callbacks
// =============================================================================

int32_t SingleSidedMatcher::after_initialize(const Address& sender, const PoolKey& key) {
    if (!authorized(sender, key)) {
        return reject(key, "bind", errors::UNAUTHORIZED);
    }

    std::unique_lock lock(ledgers_mutex_);
    bool inserted = ledgers_.try_emplace(key).second;
    if (!inserted) {
        lock.unlock();
        return reject(key, "bind", errors::POOL_ALREADY_INITIALIZED);
    }
    return errors::OK;
}

HookResult SingleSidedMatcher::after_add_liquidity(const Address& sender, const PoolKey& key,
                                                   const ModifyLiquidityParams& params,
                                                   const BalanceDelta& delta,
                                                   const std::vector<uint8_t>& hook_data) {
    if (!authorized(sender, key)) {
        return {reject(key, "match", errors::UNAUTHORIZED), {0, 0}};
    }

    MatchInstruction instr = MatchInstruction::None;
    int32_t rc = instruction::decode(hook_data, instr);
    if (rc != errors::OK) {
        return {reject(key, "match", rc), {0, 0}};
    }
    if (instr == MatchInstruction::None) {
        return {errors::OK, {0, 0}};
    }

    const Asset asset = instruction::matched_asset(instr);
    const PositionId position{params.controller, params.salt};
    MatchResult result{};

    {
        std::unique_lock lock(ledgers_mutex_);

        PoolLedger* ledger = get_ledger(key);
        if (!ledger) {
            rc = errors::POOL_NOT_INITIALIZED;
        } else {
            result = ledger->plan_match(asset, delta.get(asset));

            if (result.partial && !config_.allow_partial_match) {
                rc = errors::PARTIAL_MATCH_REJECTED;
            } else {
                PoolLedger::Checkpoint cp = ledger->checkpoint(position);
                ledger->apply_match(position, result);

                if (result.fronted < 0) {
                    int32_t settle_rc = errors::OK;
                    try {
                        settle_rc = settlement_.settle(key.currency(asset), -result.fronted);
                    } catch (...) {
                        ledger->restore(cp);
                        throw;
                    }
                    if (settle_rc != errors::OK) {
                        ledger->restore(cp);
                        rc = errors::SETTLEMENT_FAILED;
                    }
                }

                if (rc == errors::OK) {
                    total_fronted_[index_of(asset)] -= result.fronted;
                }
            }
        }
    }

    if (rc != errors::OK) {
        return {reject(key, "match", rc), {0, 0}};
    }

    if (result.partial) {
        partial_matches_.fetch_add(1, std::memory_order_relaxed);
    } else {
        full_matches_.fetch_add(1, std::memory_order_relaxed);
    }
    listener_.load(std::memory_order_acquire)->on_match(key, position, result);

    return {errors::OK, BalanceDelta::of(asset, result.fronted)};
}

HookResult SingleSidedMatcher::after_remove_liquidity(const Address& sender, const PoolKey& key,
                                                      const ModifyLiquidityParams& params,
                                                      const BalanceDelta& delta,
                                                      const std::vector<uint8_t>& hook_data) {
    if (!authorized(sender, key)) {
        return {reject(key, "unwind", errors::UNAUTHORIZED), {0, 0}};
    }

    // Unwind does not depend on the instruction, but a malformed one is still rejected
    MatchInstruction instr = MatchInstruction::None;
    int32_t rc = instruction::decode(hook_data, instr);
    if (rc != errors::OK) {
        return {reject(key, "unwind", rc), {0, 0}};
    }

    const PositionId position{params.controller, params.salt};
    std::vector<UnwindResult> results;
    BalanceDelta hook_delta{0, 0};

    {
        std::unique_lock lock(ledgers_mutex_);

        PoolLedger* ledger = get_ledger(key);
        if (!ledger) {
            rc = errors::POOL_NOT_INITIALIZED;
        } else {
            for (Asset asset : {Asset::A, Asset::B}) {
                UnwindResult r = ledger->plan_unwind(position, asset, delta.get(asset));
                if (r.reclaimed > 0) results.push_back(r);
            }

            PoolLedger::Checkpoint cp = ledger->checkpoint(position);
            for (const auto& r : results) {
                ledger->apply_unwind(position, r);
            }

            // Take each reclaimed amount; on failure hand back what was taken
            std::vector<const UnwindResult*> taken;
            try {
                for (const auto& r : results) {
                    if (settlement_.take(key.currency(r.asset), r.reclaimed) != errors::OK) {
                        rc = errors::SETTLEMENT_FAILED;
                        break;
                    }
                    taken.push_back(&r);
                }
            } catch (...) {
                ledger->restore(cp);
                throw;
            }

            if (rc != errors::OK) {
                ledger->restore(cp);
                for (const UnwindResult* r : taken) {
                    if (settlement_.settle(key.currency(r->asset), r->reclaimed) != errors::OK) {
                        throw std::runtime_error("SingleSidedMatcher: cannot return taken amount");
                    }
                }
            } else {
                for (const auto& r : results) {
                    hook_delta = hook_delta + BalanceDelta::of(r.asset, r.reclaimed);
                    total_reclaimed_[index_of(r.asset)] += r.reclaimed;
                }
            }
        }
    }

    if (rc != errors::OK) {
        return {reject(key, "unwind", rc), {0, 0}};
    }

    for (const auto& r : results) {
        unwinds_.fetch_add(1, std::memory_order_relaxed);
        listener_.load(std::memory_order_acquire)->on_unwind(key, position, r);
    }

    return {errors::OK, hook_delta};
}

// =============================================================================
// Queries
// =============================================================================

bool SingleSidedMatcher::pool_bound(const PoolKey& key) const {
    std::shared_lock lock(ledgers_mutex_);
    return get_ledger(key) != nullptr;
}

I128 SingleSidedMatcher::reservoir(const PoolKey& key, Asset asset) const {
    std::shared_lock lock(ledgers_mutex_);
    const PoolLedger* ledger = get_ledger(key);
    return ledger ? ledger->reservoir(asset) : 0;
}

I128 SingleSidedMatcher::balance(const PoolKey& key, const Address& depositor, Asset asset) const {
    std::shared_lock lock(ledgers_mutex_);
    const PoolLedger* ledger = get_ledger(key);
    return ledger ? ledger->balance(depositor, asset) : 0;
}

I128 SingleSidedMatcher::position_debt(const PoolKey& key, const PositionId& position,
                                       Asset asset) const {
    std::shared_lock lock(ledgers_mutex_);
    const PoolLedger* ledger = get_ledger(key);
    return ledger ? ledger->debt(position, asset) : 0;
}

I128 SingleSidedMatcher::outstanding_debt(const PoolKey& key, Asset asset) const {
    std::shared_lock lock(ledgers_mutex_);
    const PoolLedger* ledger = get_ledger(key);
    return ledger ? ledger->outstanding_debt(asset) : 0;
}

std::optional<LedgerSnapshot> SingleSidedMatcher::snapshot(const PoolKey& key) const {
    std::shared_lock lock(ledgers_mutex_);
    const PoolLedger* ledger = get_ledger(key);
    return ledger ? std::optional{ledger->snapshot()} : std::nullopt;
}

bool SingleSidedMatcher::check_invariants(const PoolKey& key) const {
    std::shared_lock lock(ledgers_mutex_);
    const PoolLedger* ledger = get_ledger(key);
    return ledger && ledger->check_invariants();
}

// =============================================================================
// Statistics
// =============================================================================

SingleSidedMatcher::Stats SingleSidedMatcher::get_stats() const {
    std::shared_lock lock(ledgers_mutex_);
    return Stats{
        static_cast<uint64_t>(ledgers_.size()),
        total_funds_.load(),
        total_defunds_.load(),
        full_matches_.load(),
        partial_matches_.load(),
        unwinds_.load(),
        rejections_.load(),
        total_fronted_,
        total_reclaimed_
    };
}

} // namespace sslp
