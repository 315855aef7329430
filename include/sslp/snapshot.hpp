#ifndef SSLP_SNAPSHOT_HPP
#define SSLP_SNAPSHOT_HPP

#include "ledger.hpp"
#include <nlohmann/json_fwd.hpp>

namespace sslp {

// Amounts are encoded as decimal strings (they do not fit a JSON number),
// addresses and salts as 0x-prefixed hex.
//
// {
//   "reservoir": {"A": "-600", "B": "0"},
//   "balances":  [{"depositor": "0x..", "A": "1000", "B": "0"}],
//   "debts":     [{"controller": "0x..", "salt": "0x..", "A": "0", "B": "-400"}]
// }
nlohmann::json to_json(const LedgerSnapshot& snapshot);

} // namespace sslp

#endif // SSLP_SNAPSHOT_HPP
