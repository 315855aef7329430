// Ledger snapshot JSON export

#include "sslp/snapshot.hpp"
#include <nlohmann/json.hpp>

namespace sslp {

using json = nlohmann::json;

namespace {

json pair_json(const AssetPair& amounts) {
    return json{
        {"A", to_string(amounts[index_of(Asset::A)])},
        {"B", to_string(amounts[index_of(Asset::B)])}
    };
}

}  // namespace

json to_json(const LedgerSnapshot& snapshot) {
    json out;
    out["reservoir"] = pair_json(snapshot.reservoir);

    json balances = json::array();
    for (const auto& b : snapshot.balances) {
        json entry = pair_json(b.amounts);
        entry["depositor"] = to_hex(b.depositor);
        balances.push_back(std::move(entry));
    }
    out["balances"] = std::move(balances);

    json debts = json::array();
    for (const auto& d : snapshot.debts) {
        json entry = pair_json(d.amounts);
        entry["controller"] = to_hex(d.position.controller);
        entry["salt"] = to_hex(d.position.salt);
        debts.push_back(std::move(entry));
    }
    out["debts"] = std::move(debts);

    return out;
}

}  // namespace sslp
