#ifndef SSLP_SSLP_HPP
#define SSLP_SSLP_HPP

// =============================================================================
// sslp - Single-Sided Liquidity Matching
//
//   PoolManager        AMM host: hook dispatch, flash accounting
//   SingleSidedMatcher Hook: reservoir, depositor ledger, position debt
//   PoolLedger         Per-pool matching / unwind bookkeeping
//   TokenLedger        In-memory custody
//
// =============================================================================

#include "types.hpp"
#include "instruction.hpp"
#include "ledger.hpp"
#include "custody.hpp"
#include "pool.hpp"
#include "listener.hpp"
#include "config.hpp"
#include "matcher.hpp"
#include "snapshot.hpp"

#endif // SSLP_SSLP_HPP
