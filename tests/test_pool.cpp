// PoolManager tests - flash accounting and end-to-end hook dispatch

#include <catch2/catch.hpp>
#include <stdexcept>
#include "test_support.hpp"

using namespace sslp;
using namespace sslp::test;

TEST_CASE("Pool initialization", "[pool]") {
    TokenLedger tokens;
    PoolManager manager(tokens);

    PoolKey key = pool_key(0xA000, Address{});
    REQUIRE(manager.initialize(key) == errors::OK);
    REQUIRE(manager.pool_exists(key));
    REQUIRE(manager.initialize(key) == errors::POOL_ALREADY_INITIALIZED);

    PoolKey same = key;
    same.currency1 = same.currency0;
    REQUIRE(manager.initialize(same) == errors::INVALID_CURRENCY);

    PoolKey unsorted = key;
    std::swap(unsorted.currency0, unsorted.currency1);
    REQUIRE(manager.initialize(unsorted) == errors::CURRENCIES_NOT_SORTED);

    REQUIRE(manager.get_stats().total_pools == 1);
}

TEST_CASE("Pools are identified by their full key", "[pool][isolation]") {
    TokenLedger tokens;
    PoolManager manager(tokens);
    Custody custody(tokens, HOOK);
    SingleSidedMatcher matcher(manager, custody, HOOK, manager.address());
    manager.register_hooks(HOOK, &matcher);

    PoolKey key = pool_key();
    PoolKey twin = key;
    twin.currency1 = Currency{make_address(0xAF1F)};
    REQUIRE(twin.id() == key.id());

    REQUIRE(manager.initialize(key) == errors::OK);
    REQUIRE_FALSE(manager.pool_exists(twin));
    REQUIRE(manager.initialize(twin) == errors::OK);
    REQUIRE(manager.get_stats().total_pools == 2);
    REQUIRE(matcher.pool_bound(twin));

    // Depositing the twin's token does not give a claim on the other pool
    REQUIRE(tokens.mint(ALICE, key.currency1, 1000) == errors::OK);
    REQUIRE(tokens.mint(BOB, twin.currency1, 1000) == errors::OK);
    REQUIRE(matcher.fund(key, ALICE, Asset::B, 1000) == errors::OK);
    REQUIRE(matcher.fund(twin, BOB, Asset::B, 1000) == errors::OK);

    REQUIRE(matcher.defund(key, BOB, Asset::B, 1000) == errors::INSUFFICIENT_BALANCE);
    REQUIRE(tokens.balance_of(BOB, key.currency1) == 0);
    REQUIRE(matcher.defund(key, ALICE, Asset::B, 1000) == errors::OK);
    REQUIRE(tokens.balance_of(ALICE, key.currency1) == 1000);
}

TEST_CASE("Hook rejecting initialization removes the pool", "[pool]") {
    TokenLedger tokens;
    PoolManager manager(tokens);
    Custody custody(tokens, HOOK);
    // Expects a different manager, so every callback is unauthorized
    SingleSidedMatcher matcher(manager, custody, HOOK, make_address(0x1234));
    manager.register_hooks(HOOK, &matcher);

    PoolKey key = pool_key();
    REQUIRE(manager.initialize(key) == errors::UNAUTHORIZED);
    REQUIRE_FALSE(manager.pool_exists(key));
    REQUIRE_FALSE(matcher.pool_bound(key));
}

TEST_CASE("Lock semantics", "[pool][lock]") {
    TokenLedger tokens;
    PoolManager manager(tokens);
    PoolKey key = pool_key(0xA000, Address{});
    REQUIRE(manager.initialize(key) == errors::OK);
    REQUIRE(tokens.mint(LP1, key.currency0, 100) == errors::OK);

    SECTION("Modify outside lock throws") {
        REQUIRE_THROWS_AS(manager.modify_liquidity(key, add_params(LP1, 1), {-10, 0}),
                          std::runtime_error);
        REQUIRE_THROWS_AS(manager.settle_for(LP1, key.currency0, 10), std::runtime_error);
    }

    SECTION("Reentrant lock throws") {
        REQUIRE_THROWS_AS(manager.lock([&] { manager.lock([] {}); }), std::runtime_error);
        REQUIRE_FALSE(manager.is_locked());
    }

    SECTION("Unsettled delta throws") {
        REQUIRE_THROWS_AS(manager.lock([&] {
            manager.modify_liquidity(key, add_params(LP1, 1), {-10, 0});
        }), std::runtime_error);
        REQUIRE_FALSE(manager.is_locked());
    }

    SECTION("Settled delta unlocks cleanly") {
        manager.lock([&] {
            auto r = manager.modify_liquidity(key, add_params(LP1, 1), {-10, 0});
            REQUIRE(r.code == errors::OK);
            REQUIRE(manager.currency_delta(LP1, key.currency0) == -10);
            REQUIRE(manager.settle_for(LP1, key.currency0, 10) == errors::OK);
            REQUIRE(manager.currency_delta(LP1, key.currency0) == 0);
        });
        REQUIRE(tokens.balance_of(manager.address(), key.currency0) == 10);
        REQUIRE(manager.get_stats().total_liquidity_ops == 1);
    }

    SECTION("Settle and take outside a hook dispatch are unauthorized") {
        manager.lock([&] {
            REQUIRE(manager.settle(key.currency0, 1) == errors::UNAUTHORIZED);
            REQUIRE(manager.take(key.currency0, 1) == errors::UNAUTHORIZED);
            REQUIRE(manager.settle_for(LP1, key.currency0, 0) == errors::INVALID_AMOUNT);
        });
    }

    SECTION("Unknown pool") {
        manager.lock([&] {
            auto r = manager.modify_liquidity(pool_key(0xC000, Address{}), add_params(LP1, 1),
                                              {-10, 0});
            REQUIRE(r.code == errors::POOL_NOT_INITIALIZED);
        });
    }
}

namespace {

// Real manager, token ledger and matcher wired together
struct Deployment {
    TokenLedger tokens;
    PoolManager manager{tokens};
    Custody custody{tokens, HOOK};
    SingleSidedMatcher matcher{manager, custody, HOOK, manager.address()};
    PoolKey key = pool_key();

    Deployment() {
        manager.register_hooks(HOOK, &matcher);
        REQUIRE(manager.initialize(key) == errors::OK);
    }

    // Modify a position and settle the caller's side of the delta
    PoolManager::ModifyResult modify(const Address& lp, bool increase, BalanceDelta reported,
                                     std::vector<uint8_t> hook_data = {}) {
        PoolManager::ModifyResult result{};
        manager.lock([&] {
            ModifyLiquidityParams params{lp, make_salt(1), increase};
            result = manager.modify_liquidity(key, params, reported, hook_data);
            if (result.code != errors::OK) return;
            for (Asset asset : {Asset::A, Asset::B}) {
                I128 amount = result.caller_delta.get(asset);
                if (amount < 0) {
                    REQUIRE(manager.settle_for(lp, key.currency(asset), -amount) == errors::OK);
                } else if (amount > 0) {
                    REQUIRE(manager.take_to(lp, key.currency(asset), amount) == errors::OK);
                }
            }
        });
        return result;
    }
};

}  // namespace

TEST_CASE("End to end matching and unwind", "[pool][e2e]") {
    Deployment d;
    const Currency& a = d.key.currency0;
    const Currency& b = d.key.currency1;

    REQUIRE(d.matcher.pool_bound(d.key));
    REQUIRE(d.tokens.mint(ALICE, b, 1000) == errors::OK);
    REQUIRE(d.tokens.mint(LP1, a, 10000) == errors::OK);
    REQUIRE(d.tokens.mint(LP2, a, 10000) == errors::OK);
    REQUIRE(d.tokens.mint(LP2, b, 300) == errors::OK);

    REQUIRE(d.matcher.fund(d.key, ALICE, Asset::B, 1000) == errors::OK);
    REQUIRE(d.tokens.balance_of(HOOK, b) == 1000);

    // LP1 supplies only A; B is fronted entirely
    auto r1 = d.modify(LP1, true, {-500, -400}, instruction::use(Asset::B));
    REQUIRE(r1.code == errors::OK);
    REQUIRE(r1.hook_delta == BalanceDelta{0, -400});
    REQUIRE(r1.caller_delta == BalanceDelta{-500, 0});
    REQUIRE(d.tokens.balance_of(HOOK, b) == 600);

    // LP2 drains the rest and pays the shortfall
    auto r2 = d.modify(LP2, true, {-1100, -900}, instruction::use(Asset::B));
    REQUIRE(r2.code == errors::OK);
    REQUIRE(r2.caller_delta == BalanceDelta{-1100, -300});
    REQUIRE(d.matcher.reservoir(d.key, Asset::B) == 0);
    REQUIRE(d.tokens.balance_of(LP2, b) == 0);

    // LP1 withdraws in two steps; debt is repaid before the caller gets B
    auto r3 = d.modify(LP1, false, {200, 250});
    REQUIRE(r3.code == errors::OK);
    REQUIRE(r3.caller_delta == BalanceDelta{200, 0});

    auto r4 = d.modify(LP1, false, {300, 300});
    REQUIRE(r4.code == errors::OK);
    REQUIRE(r4.caller_delta == BalanceDelta{300, 150});
    REQUIRE(d.tokens.balance_of(LP1, b) == 150);
    REQUIRE(d.tokens.balance_of(LP1, a) == 10000);

    REQUIRE(d.matcher.reservoir(d.key, Asset::B) == -400);
    REQUIRE(d.matcher.position_debt(d.key, PositionId{LP1, make_salt(1)}, Asset::B) == 0);
    REQUIRE(d.matcher.position_debt(d.key, PositionId{LP2, make_salt(1)}, Asset::B) == -600);
    REQUIRE(d.tokens.balance_of(HOOK, b) == 400);
    REQUIRE(d.matcher.check_invariants(d.key));

    // Only the unmatched part can leave
    REQUIRE(d.matcher.defund(d.key, ALICE, Asset::B, 401) ==
            errors::INSUFFICIENT_UNMATCHED_LIQUIDITY);
    REQUIRE(d.matcher.defund(d.key, ALICE, Asset::B, 400) == errors::OK);
    REQUIRE(d.tokens.balance_of(ALICE, b) == 400);
    REQUIRE(d.tokens.balance_of(HOOK, b) == 0);
}

TEST_CASE("Hook rejection leaves the caller uncharged", "[pool][e2e]") {
    Deployment d;
    REQUIRE(d.tokens.mint(LP1, d.key.currency0, 500) == errors::OK);

    auto r = d.modify(LP1, true, {-500, -400}, {0x09});
    REQUIRE(r.code == errors::INVALID_ASSET_SELECTION);
    REQUIRE(d.tokens.balance_of(LP1, d.key.currency0) == 500);
    REQUIRE(d.manager.get_stats().total_liquidity_ops == 0);
}
