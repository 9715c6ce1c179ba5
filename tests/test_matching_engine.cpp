// Hyperdrive - Matching Engine Tests

#include <catch2/catch_test_macros.hpp>
#include <hyper/crypto.hpp>
#include <hyper/matching_engine.hpp>

#include <limits>

#include "mocks.hpp"

using namespace hyper;
using namespace hyper::testing;

namespace {

const Address ENGINE_ADDRESS = make_address(200);
const Address RELAYER = make_address(201);

struct Trader {
    Hash secret;
    Address address;
};

Trader make_trader(uint8_t fill) {
    Hash secret;
    secret.fill(fill);
    return Trader{secret, crypto::address_from_secret(secret)};
}

EngineDomain engine_domain(uint64_t chain_id = 1) {
    EngineDomain domain;
    domain.chain_id = chain_id;
    domain.verifying_contract = ENGINE_ADDRESS;
    return domain;
}

struct EngineFixture {
    PoolFixture f;
    MatchingEngine engine{engine_domain(), f.time.clock()};
    Trader alice = make_trader(0x11);
    Trader bob = make_trader(0x22);
    Trader carol = make_trader(0x33);
    uint8_t next_salt = 1;

    EngineFixture() {
        f.initialize(units(1000));
        engine.register_pool(f.pool, f.base, f.shares);
    }

    void fund(const Trader& trader, const U256& amount) {
        f.base.mint(trader.address, amount);
        f.base.approve(trader.address, ENGINE_ADDRESS, U256_MAX);
    }

    OrderIntent order(const Trader& trader, OrderType type, const U256& bonds, const U256& funds) {
        OrderIntent intent;
        intent.trader = trader.address;
        intent.hyperdrive = POOL_ADDRESS;
        intent.fund_amount = funds;
        intent.bond_amount = bonds;
        intent.options = Options{trader.address, true};
        intent.order_type = type;
        intent.min_maturity_time = 0;
        intent.max_maturity_time = std::numeric_limits<uint64_t>::max();
        intent.expiry = START_TIME + DAY;
        intent.salt[31] = next_salt++;
        sign(intent, trader);
        return intent;
    }

    OrderIntent close_order(const Trader& trader, OrderType type, uint64_t maturity,
                            const U256& bonds, const U256& funds) {
        OrderIntent intent = order(trader, type, bonds, funds);
        intent.min_maturity_time = maturity;
        intent.max_maturity_time = maturity;
        sign(intent, trader);
        return intent;
    }

    void sign(OrderIntent& intent, const Trader& signer) {
        intent.signature = crypto::sign(engine.hash_order(intent), signer.secret);
    }

    // Alice holds `bonds` longs and Bob the matching shorts
    uint64_t mint_pair(const U256& bonds) {
        fund(alice, bonds);
        fund(bob, bonds);
        OrderIntent long_order = order(alice, OrderType::OpenLong, bonds, bonds);
        OrderIntent short_order = order(bob, OrderType::OpenShort, bonds, bonds);
        return engine.match_orders(long_order, short_order, RELAYER).maturity_time;
    }
};

U256 decimal(uint64_t whole_units, uint64_t hundredths) {
    return units(whole_units) + U256(hundredths) * U256(10000000000000000ULL);
}

}  // namespace

TEST_CASE("Order hashing", "[matching]") {
    EngineFixture e;
    OrderIntent intent = e.order(e.alice, OrderType::OpenLong, units(10), units(10));

    REQUIRE(e.engine.hash_order(intent) == e.engine.hash_order(intent));

    OrderIntent resalted = intent;
    resalted.salt[0] = 0xFF;
    REQUIRE(e.engine.hash_order(resalted) != e.engine.hash_order(intent));

    OrderIntent redirected = intent;
    redirected.options.as_base = false;
    REQUIRE(e.engine.hash_order(redirected) != e.engine.hash_order(intent));

    // The signature is not part of the digest
    OrderIntent unsigned_copy = intent;
    unsigned_copy.signature.clear();
    REQUIRE(e.engine.hash_order(unsigned_copy) == e.engine.hash_order(intent));

    MatchingEngine other_chain(engine_domain(5), e.f.time.clock());
    REQUIRE(other_chain.domain_separator() != e.engine.domain_separator());
    REQUIRE(other_chain.hash_order(intent) != e.engine.hash_order(intent));
}

TEST_CASE("Matching opens mints a pair", "[matching]") {
    EngineFixture e;
    e.fund(e.alice, units(10));
    e.fund(e.bob, units(10));

    OrderIntent long_order = e.order(e.alice, OrderType::OpenLong, units(10), decimal(9, 70));
    OrderIntent short_order = e.order(e.bob, OrderType::OpenShort, units(10), units(1));

    MatchResult result = e.engine.match_orders(long_order, short_order, RELAYER);
    const uint64_t maturity = START_TIME + e.f.pool.config().position_duration;

    REQUIRE(result.settlement == Settlement::Mint);
    REQUIRE(result.maturity_time == maturity);
    REQUIRE(result.bond_amount == units(10));
    REQUIRE(result.fund_amount1 == decimal(9, 70));
    REQUIRE(result.fund_amount2 == units(1));
    REQUIRE(result.surplus == decimal(0, 70));

    // Funds are conserved: the pool took the mint cost, the relayer the rest
    REQUIRE(e.f.base.balance_of(e.alice.address) == decimal(0, 30));
    REQUIRE(e.f.base.balance_of(e.bob.address) == units(9));
    REQUIRE(e.f.base.balance_of(RELAYER) == decimal(0, 70));
    REQUIRE(e.f.base.balance_of(ENGINE_ADDRESS) == 0);

    REQUIRE(e.f.ledger.balance_of(asset_id::encode(AssetKind::LONG, maturity), e.alice.address) ==
            units(10));
    REQUIRE(e.f.ledger.balance_of(asset_id::encode(AssetKind::SHORT, maturity), e.bob.address) ==
            units(10));

    OrderAmounts used = e.engine.order_amounts_used(e.engine.hash_order(long_order));
    REQUIRE(used.bond_amount == units(10));
    REQUIRE(used.fund_amount == decimal(9, 70));
}

TEST_CASE("Partial fills accumulate until the order is exhausted", "[matching]") {
    EngineFixture e;
    e.fund(e.alice, units(10));
    e.fund(e.bob, units(20));
    e.fund(e.carol, units(60));

    OrderIntent maker = e.order(e.alice, OrderType::OpenLong, units(50), units(10));
    const Hash maker_hash = e.engine.hash_order(maker);

    MatchResult first = e.engine.match_orders(
        maker, e.order(e.bob, OrderType::OpenShort, units(20), units(20)), RELAYER);
    REQUIRE(first.bond_amount == units(20));
    REQUIRE(first.fund_amount1 == units(4));
    REQUIRE(e.engine.order_amounts_used(maker_hash).bond_amount == units(20));

    MatchResult second = e.engine.match_orders(
        maker, e.order(e.carol, OrderType::OpenShort, units(30), units(30)), RELAYER);
    REQUIRE(second.bond_amount == units(30));
    REQUIRE(second.fund_amount1 == units(6));

    OrderAmounts used = e.engine.order_amounts_used(maker_hash);
    REQUIRE(used.bond_amount == units(50));
    REQUIRE(used.fund_amount == units(10));
    REQUIRE(e.f.base.balance_of(e.alice.address) == 0);

    OrderIntent another = e.order(e.carol, OrderType::OpenShort, units(10), units(10));
    REQUIRE(error_code_of([&] { e.engine.match_orders(maker, another, RELAYER); }) ==
            errors::ORDER_FULLY_EXECUTED);
}

TEST_CASE("Order validation", "[matching]") {
    EngineFixture e;
    e.fund(e.alice, units(10));
    e.fund(e.bob, units(10));

    OrderIntent long_order = e.order(e.alice, OrderType::OpenLong, units(10), units(9));
    OrderIntent short_order = e.order(e.bob, OrderType::OpenShort, units(10), units(1));

    auto match_code = [&](const OrderIntent& a, const OrderIntent& b) {
        return error_code_of([&] { e.engine.match_orders(a, b, RELAYER); });
    };

    SECTION("Counterparty restriction") {
        long_order.counterparty = e.carol.address;
        e.sign(long_order, e.alice);
        REQUIRE(match_code(long_order, short_order) == errors::INVALID_COUNTERPARTY);

        long_order.counterparty = e.bob.address;
        e.sign(long_order, e.alice);
        REQUIRE(match_code(long_order, short_order) == errors::OK);
    }

    SECTION("Expiry") {
        e.f.time.now = long_order.expiry + 1;
        REQUIRE(match_code(long_order, short_order) == errors::ORDER_EXPIRED);
    }

    SECTION("Signatures") {
        OrderIntent tampered = long_order;
        tampered.fund_amount = units(1);
        REQUIRE(match_code(tampered, short_order) == errors::INVALID_SIGNATURE);

        OrderIntent forged = long_order;
        e.sign(forged, e.carol);
        REQUIRE(match_code(forged, short_order) == errors::INVALID_SIGNATURE);
    }

    SECTION("Settlement asset and pool must agree") {
        OrderIntent in_shares = short_order;
        in_shares.options.as_base = false;
        e.sign(in_shares, e.bob);
        REQUIRE(match_code(long_order, in_shares) == errors::INVALID_SETTLEMENT_ASSET);

        OrderIntent elsewhere = short_order;
        elsewhere.hyperdrive = make_address(999);
        e.sign(elsewhere, e.bob);
        REQUIRE(match_code(long_order, elsewhere) == errors::MISMATCHED_POOL);
    }

    SECTION("Unknown pool") {
        OrderIntent a = long_order;
        OrderIntent b = short_order;
        a.hyperdrive = make_address(999);
        b.hyperdrive = make_address(999);
        e.sign(a, e.alice);
        e.sign(b, e.bob);
        REQUIRE(match_code(a, b) == errors::UNKNOWN_POOL);
    }

    SECTION("Maturity bounds") {
        OrderIntent narrow = long_order;
        narrow.max_maturity_time = START_TIME;
        e.sign(narrow, e.alice);
        REQUIRE(match_code(narrow, short_order) == errors::INVALID_MATURITY_TIME);

        OrderIntent empty = long_order;
        empty.min_maturity_time = START_TIME + 2 * DAY;
        empty.max_maturity_time = START_TIME + DAY;
        e.sign(empty, e.alice);
        REQUIRE(match_code(empty, short_order) == errors::INVALID_MATURITY_TIME);
    }

    SECTION("Unsupported pairings") {
        OrderIntent other_long = e.order(e.bob, OrderType::OpenLong, units(10), units(10));
        REQUIRE(match_code(long_order, other_long) == errors::INVALID_ORDER_COMBINATION);
        REQUIRE(match_code(short_order, long_order) == errors::INVALID_ORDER_COMBINATION);
        REQUIRE(match_code(long_order, long_order) == errors::INVALID_ORDER_COMBINATION);
    }

    SECTION("Funds must cover the mint cost") {
        OrderIntent stingy = e.order(e.alice, OrderType::OpenLong, units(10), units(5));
        REQUIRE(match_code(stingy, short_order) == errors::INSUFFICIENT_FUNDING);
        REQUIRE(e.f.base.balance_of(e.alice.address) == units(10));
        REQUIRE(e.f.base.balance_of(e.bob.address) == units(10));
    }

    SECTION("A failed pull refunds the other trader") {
        OrderIntent unfunded = e.order(e.carol, OrderType::OpenShort, units(10), units(1));
        REQUIRE(match_code(long_order, unfunded) != errors::OK);
        REQUIRE(e.f.base.balance_of(e.alice.address) == units(10));
        REQUIRE(e.f.base.balance_of(ENGINE_ADDRESS) == 0);
        REQUIRE(e.engine.order_amounts_used(e.engine.hash_order(long_order)).bond_amount == 0);
    }

    SECTION("Zero surplus recipient") {
        REQUIRE(error_code_of([&] { e.engine.match_orders(long_order, short_order, ZERO_ADDRESS); }) ==
                errors::INVALID_DESTINATION);
    }
}

TEST_CASE("Cancellation", "[matching]") {
    EngineFixture e;
    e.fund(e.alice, units(10));
    e.fund(e.bob, units(10));

    OrderIntent long_order = e.order(e.alice, OrderType::OpenLong, units(10), units(9));
    OrderIntent short_order = e.order(e.bob, OrderType::OpenShort, units(10), units(1));
    const Hash long_hash = e.engine.hash_order(long_order);

    REQUIRE(error_code_of([&] { e.engine.cancel_orders(e.bob.address, {long_order}); }) ==
            errors::UNAUTHORIZED);
    REQUIRE_FALSE(e.engine.is_cancelled(long_hash));

    e.engine.cancel_orders(e.alice.address, {long_order});
    REQUIRE(e.engine.is_cancelled(long_hash));
    REQUIRE(error_code_of([&] { e.engine.match_orders(long_order, short_order, RELAYER); }) ==
            errors::ORDER_CANCELLED);
    REQUIRE(e.f.base.balance_of(e.alice.address) == units(10));

    // Cancellation is permanent and idempotent
    REQUIRE_NOTHROW(e.engine.cancel_orders(e.alice.address, {long_order}));
    REQUIRE(e.engine.is_cancelled(long_hash));
}

TEST_CASE("Matching closes burns the pair", "[matching]") {
    EngineFixture e;
    const uint64_t maturity = e.mint_pair(units(10));
    e.f.pool.set_approval_for_all(e.alice.address, ENGINE_ADDRESS, true);
    e.f.pool.set_approval_for_all(e.bob.address, ENGINE_ADDRESS, true);

    const U256 alice_before = e.f.base.balance_of(e.alice.address);
    const U256 bob_before = e.f.base.balance_of(e.bob.address);
    const U256 relayer_before = e.f.base.balance_of(RELAYER);

    OrderIntent close_long = e.close_order(e.alice, OrderType::CloseLong, maturity, units(10), units(9));
    OrderIntent close_short =
        e.close_order(e.bob, OrderType::CloseShort, maturity, units(10), decimal(0, 40));

    SECTION("Proceeds split with the surplus to the relayer") {
        MatchResult result = e.engine.match_orders(close_long, close_short, RELAYER);
        REQUIRE(result.settlement == Settlement::Burn);
        REQUIRE(result.bond_amount == units(10));

        REQUIRE(e.f.base.balance_of(e.alice.address) == alice_before + units(9));
        REQUIRE(e.f.base.balance_of(e.bob.address) == bob_before + decimal(0, 40));
        REQUIRE(e.f.base.balance_of(RELAYER) == relayer_before + decimal(0, 60));
        REQUIRE(e.f.ledger.balance_of(asset_id::encode(AssetKind::LONG, maturity), e.alice.address) == 0);
        REQUIRE(e.f.ledger.balance_of(asset_id::encode(AssetKind::SHORT, maturity), e.bob.address) == 0);
    }

    SECTION("Close orders need a single maturity") {
        close_long.max_maturity_time = maturity + DAY;
        e.sign(close_long, e.alice);
        REQUIRE(error_code_of([&] { e.engine.match_orders(close_long, close_short, RELAYER); }) ==
                errors::INVALID_MATURITY_TIME);
    }

    SECTION("Positions return when the burn fails") {
        OrderIntent greedy = e.close_order(e.bob, OrderType::CloseShort, maturity, units(10), units(2));
        REQUIRE(error_code_of([&] { e.engine.match_orders(close_long, greedy, RELAYER); }) ==
                errors::OUTPUT_LIMIT);
        REQUIRE(e.f.ledger.balance_of(asset_id::encode(AssetKind::LONG, maturity), e.alice.address) ==
                units(10));
        REQUIRE(e.f.ledger.balance_of(asset_id::encode(AssetKind::SHORT, maturity), e.bob.address) ==
                units(10));
    }
}

TEST_CASE("Matching an open against a close transfers the position", "[matching]") {
    EngineFixture e;
    const uint64_t maturity = e.mint_pair(units(10));
    const U256 id = asset_id::encode(AssetKind::LONG, maturity);
    e.fund(e.carol, units(10));

    OrderIntent buy = e.order(e.carol, OrderType::OpenLong, units(10), decimal(9, 60));
    OrderIntent sell = e.close_order(e.alice, OrderType::CloseLong, maturity, units(10), decimal(9, 50));
    const U256 alice_before = e.f.base.balance_of(e.alice.address);

    SECTION("Seller must approve the engine") {
        REQUIRE(error_code_of([&] { e.engine.match_orders(buy, sell, RELAYER); }) ==
                errors::UNAUTHORIZED);
        REQUIRE(e.f.base.balance_of(e.carol.address) == units(10));
    }

    SECTION("Settles at the buyer's price") {
        e.f.pool.set_approval_for_all(e.alice.address, ENGINE_ADDRESS, true);
        MatchResult result = e.engine.match_orders(buy, sell, RELAYER);

        REQUIRE(result.settlement == Settlement::Transfer);
        REQUIRE(e.f.ledger.balance_of(id, e.carol.address) == units(10));
        REQUIRE(e.f.ledger.balance_of(id, e.alice.address) == 0);
        REQUIRE(e.f.base.balance_of(e.carol.address) == decimal(0, 40));
        REQUIRE(e.f.base.balance_of(e.alice.address) == alice_before + decimal(9, 50));
        REQUIRE(result.surplus == decimal(0, 10));
    }

    SECTION("Buyer below the seller's floor") {
        e.f.pool.set_approval_for_all(e.alice.address, ENGINE_ADDRESS, true);
        OrderIntent lowball = e.order(e.carol, OrderType::OpenLong, units(10), units(9));
        REQUIRE(error_code_of([&] { e.engine.match_orders(lowball, sell, RELAYER); }) ==
                errors::INSUFFICIENT_FUNDING);
    }
}

TEST_CASE("Direct fills", "[matching]") {
    EngineFixture e;
    e.fund(e.alice, units(10));
    e.fund(e.bob, units(10));

    OrderIntent maker = e.order(e.alice, OrderType::OpenLong, units(10), units(9));
    OrderIntent taker = e.order(e.bob, OrderType::OpenShort, units(4), units(1));
    taker.signature.clear();

    SECTION("Taker must be the caller") {
        REQUIRE(error_code_of([&] { e.engine.fill_order(e.carol.address, maker, taker); }) ==
                errors::UNAUTHORIZED);
    }

    SECTION("Unsigned taker fills part of a signed maker") {
        MatchResult result = e.engine.fill_order(e.bob.address, maker, taker);
        REQUIRE(result.bond_amount == units(4));
        REQUIRE(result.fund_amount1 == decimal(3, 60));
        REQUIRE(result.surplus == decimal(0, 60));
        REQUIRE(e.f.base.balance_of(e.bob.address) == units(9) + decimal(0, 60));

        REQUIRE(e.engine.order_amounts_used(e.engine.hash_order(maker)).bond_amount == units(4));
        REQUIRE(e.engine.order_amounts_used(e.engine.hash_order(taker)).bond_amount == 0);
    }

    SECTION("Either side may be listed first") {
        OrderIntent short_maker = e.order(e.bob, OrderType::OpenShort, units(4), units(1));
        OrderIntent long_taker = e.order(e.alice, OrderType::OpenLong, units(4), units(4));
        MatchResult result = e.engine.fill_order(e.alice.address, short_maker, long_taker);
        REQUIRE(result.settlement == Settlement::Mint);
        REQUIRE(result.fund_amount1 == units(4));
        REQUIRE(result.fund_amount2 == units(1));
    }
}

TEST_CASE("Default order intents", "[matching]") {
    OrderIntent intent;
    REQUIRE(is_zero(intent.trader));
    REQUIRE(is_zero(intent.counterparty));
    REQUIRE(is_zero(intent.hyperdrive));
    REQUIRE(is_zero(intent.options.destination));

    MatchResult result;
    REQUIRE(result.maturity_time == 0);
    REQUIRE(result.bond_amount == 0);
}

TEST_CASE("Matched mints settle in vault shares", "[matching]") {
    EngineFixture e;
    const U256 price = U256(1050000000000000000ULL);
    e.f.vault.set_share_price(price);

    auto fund_shares = [&](const Trader& trader, const U256& amount) {
        e.f.shares.mint(trader.address, amount);
        e.f.shares.approve(trader.address, ENGINE_ADDRESS, U256_MAX);
    };
    auto in_shares = [&](const Trader& trader, OrderType type, const U256& bonds, const U256& funds) {
        OrderIntent intent = e.order(trader, type, bonds, funds);
        intent.options.as_base = false;
        e.sign(intent, trader);
        return intent;
    };

    const uint64_t maturity = START_TIME + e.f.pool.config().position_duration;
    U256 minted = 0;
    for (uint64_t i = 0; i < 8; ++i) {
        const U256 bonds = units(1) + U256(i * 7919);
        fund_shares(e.alice, bonds);
        fund_shares(e.bob, bonds / 10);

        OrderIntent long_order = in_shares(e.alice, OrderType::OpenLong, bonds, bonds);
        OrderIntent short_order = in_shares(e.bob, OrderType::OpenShort, bonds, bonds / 10);
        MatchResult result = e.engine.match_orders(long_order, short_order, RELAYER);

        REQUIRE(result.settlement == Settlement::Mint);
        REQUIRE(result.maturity_time == maturity);
        REQUIRE(result.bond_amount == bonds);
        minted += bonds;
        REQUIRE(e.f.ledger.balance_of(asset_id::encode(AssetKind::LONG, maturity), e.alice.address) ==
                minted);
        REQUIRE(e.f.ledger.balance_of(asset_id::encode(AssetKind::SHORT, maturity), e.bob.address) ==
                minted);
    }
    REQUIRE(e.f.shares.balance_of(ENGINE_ADDRESS) == 0);
    REQUIRE(e.f.base.balance_of(ENGINE_ADDRESS) == 0);
}
