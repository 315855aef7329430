// Single-sided liquidity - walkthrough
// A depositor funds asset B, two LPs add liquidity supplying only asset A,
// then the first LP withdraws in two steps.
//
// Usage: single_sided [config.toml]

#include <sslp/sslp.hpp>
#include <nlohmann/json.hpp>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace sslp;

namespace {

constexpr Address HOOK = make_address(0x9013);
constexpr Address DEPOSITOR = make_address(0x0D01);
constexpr Address LP1 = make_address(0x0101);
constexpr Address LP2 = make_address(0x0102);

void check(int32_t rc, const char* what) {
    if (rc != errors::OK) {
        throw std::runtime_error(std::string(what) + ": " + errors::message(rc));
    }
}

// Caller side of a modify: pay what is owed, take what is due
void settle_caller(PoolManager& manager, const PoolKey& key, const Address& caller,
                   const BalanceDelta& delta) {
    for (Asset asset : {Asset::A, Asset::B}) {
        I128 amount = delta.get(asset);
        if (amount < 0) {
            check(manager.settle_for(caller, key.currency(asset), -amount), "settle");
        } else if (amount > 0) {
            check(manager.take_to(caller, key.currency(asset), amount), "take");
        }
    }
}

void modify(PoolManager& manager, const PoolKey& key, const Address& controller, uint64_t salt,
            bool increase, const BalanceDelta& reported, const std::vector<uint8_t>& payload) {
    manager.lock([&] {
        ModifyLiquidityParams params{controller, make_salt(salt), increase};
        auto result = manager.modify_liquidity(key, params, reported, payload);
        check(result.code, increase ? "add liquidity" : "remove liquidity");

        std::cout << (increase ? "add   " : "remove") << " " << to_hex(controller)
                  << " reported=(" << to_string(reported.amount0) << ", " << to_string(reported.amount1) << ")"
                  << " hook=(" << to_string(result.hook_delta.amount0) << ", " << to_string(result.hook_delta.amount1) << ")"
                  << " caller=(" << to_string(result.caller_delta.amount0) << ", " << to_string(result.caller_delta.amount1) << ")\n";

        settle_caller(manager, key, controller, result.caller_delta);
    });
}

}  // namespace

int main(int argc, char** argv) {
    try {
        MatcherConfig config = argc > 1 ? MatcherConfig::from_file(argv[1]) : MatcherConfig{};

        TokenLedger tokens;
        PoolManager manager(tokens);
        Custody custody(tokens, HOOK);
        SingleSidedMatcher matcher(manager, custody, HOOK, manager.address(), config);

        StreamLedgerListener listener(std::cerr, config.log_level);
        matcher.set_listener(&listener);
        manager.register_hooks(HOOK, &matcher);

        PoolKey key{
            Currency{make_address(0xA000)},
            Currency{make_address(0xB000)},
            3000,
            60,
            HOOK
        };
        check(manager.initialize(key), "initialize");

        check(tokens.mint(DEPOSITOR, key.currency1, 1000), "mint");
        check(tokens.mint(LP1, key.currency0, 10000), "mint");
        check(tokens.mint(LP2, key.currency0, 10000), "mint");
        check(tokens.mint(LP2, key.currency1, 10000), "mint");

        check(matcher.fund(key, DEPOSITOR, Asset::B, 1000), "fund");
        std::cout << "reservoir B after fund: " << to_string(matcher.reservoir(key, Asset::B)) << "\n";

        // LP1 supplies A only; B is fronted in full
        modify(manager, key, LP1, 1, true, {-500, -400}, instruction::use(Asset::B));

        // LP2 needs more B than is left; the shortfall is paid by LP2 directly
        modify(manager, key, LP2, 1, true, {-1100, -900}, instruction::use(Asset::B));

        // LP1 withdraws in two steps; debt is repaid first
        modify(manager, key, LP1, 1, false, {200, 250}, {});
        modify(manager, key, LP1, 1, false, {300, 300}, {});

        PositionId pos1{LP1, make_salt(1)};
        PositionId pos2{LP2, make_salt(1)};
        std::cout << "debt LP1 B: " << to_string(matcher.position_debt(key, pos1, Asset::B)) << "\n";
        std::cout << "debt LP2 B: " << to_string(matcher.position_debt(key, pos2, Asset::B)) << "\n";
        std::cout << "invariants: " << (matcher.check_invariants(key) ? "ok" : "BROKEN") << "\n";

        if (auto snap = matcher.snapshot(key)) {
            std::cout << to_json(*snap).dump(2) << "\n";
        }

        auto stats = matcher.get_stats();
        std::cout << "funds=" << stats.total_funds
                  << " full_matches=" << stats.full_matches
                  << " partial_matches=" << stats.partial_matches
                  << " unwinds=" << stats.unwinds << "\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }

    return 0;
}
