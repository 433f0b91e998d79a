// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <test_helpers.hpp>

#include <cstdint>
#include <random>
#include <tuple>
#include <vector>

using namespace ledgersim;
using namespace ledgersim::chain;
using namespace ledgersim::test;

// Start Test Suite: validate transaction tests

static
data_chunk const alice = address(0xa1);

static
data_chunk const bob = address(0xb0);

static
amount_t const ada = 1000000;

// 100 ADA at point(1).
static
memory_utxos funded(value const& x = value(100 * ada)) {
    memory_utxos utxos;
    utxos.add(point(1), output{alice, x});
    return utxos;
}

static
validation_result check(transaction const& tx, utxo_view const& utxos, settings const& params = settings{}) {
    cbor_serializer const serializer;
    return validate_transaction(params, serializer).validate(tx, utxos);
}

template <typename Rule>
static
validation_result check_rule(transaction const& tx, utxo_view const& utxos) {
    settings const params;
    cbor_serializer const serializer;
    rules::context const ctx {utxos, params, serializer};
    return Rule{}(tx, ctx);
}

// Worked scenarios.
//-----------------------------------------------------------------------------

TEST_CASE("validate transaction  validate  exact balance  valid", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const result = check(pay({point(1)}, bob, value(99000000), 1000000), utxos);
    REQUIRE(result.is_valid());
    REQUIRE(result.error_code() == error::success);
    REQUIRE(result.message().empty());
}

TEST_CASE("validate transaction  validate  one extra unit  creating 1 from nothing", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const result = check(pay({point(1)}, bob, value(99000001), 1000000), utxos);
    REQUIRE(result.error_code() == error::value_preservation_violation);

    auto const* detail = result.get_if<value_preservation_violation>();
    REQUIRE(detail != nullptr);
    REQUIRE(detail->imbalances.size() == 1u);

    auto const& imbalance = detail->imbalances.front();
    REQUIRE(imbalance.asset.is_base_currency());
    REQUIRE(imbalance.input == 100000000);
    REQUIRE(imbalance.output == 99000001);
    REQUIRE(imbalance.minted == 0);
    REQUIRE(imbalance.fee == 1000000);
    REQUIRE(imbalance.expected == 100000000);
    REQUIRE(imbalance.actual == 100000001);
    REQUIRE(imbalance.difference == 1);
    REQUIRE(imbalance.kind == imbalance_kind::created_from_nothing);
    REQUIRE(result.message() == "value not preserved: creating 1 lovelace from nothing");
}

TEST_CASE("validate transaction  validate  two extra units  creating 2 from nothing", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const result = check(pay({point(1)}, bob, value(99000002), 1000000), utxos);
    auto const* detail = result.get_if<value_preservation_violation>();
    REQUIRE(detail != nullptr);
    REQUIRE(detail->imbalances.front().difference == 2);
    REQUIRE(detail->imbalances.front().kind == imbalance_kind::created_from_nothing);
}

TEST_CASE("validate transaction  validate  one missing unit  destroying 1", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const result = check(pay({point(1)}, bob, value(98999999), 1000000), utxos);
    auto const* detail = result.get_if<value_preservation_violation>();
    REQUIRE(detail != nullptr);
    REQUIRE(detail->imbalances.front().difference == 1);
    REQUIRE(detail->imbalances.front().kind == imbalance_kind::destroyed);
    REQUIRE(result.message() == "value not preserved: destroying 1 lovelace");
}

TEST_CASE("validate transaction  validate  declared mint  valid", "[validate transaction tests]") {
    auto const utxos = funded();
    value mint;
    mint.add(token("tok"), 1000);
    auto const tx = pay({point(1)}, bob, with_asset(99000000, token("tok"), 1000), 1000000, mint);
    REQUIRE(check(tx, utxos).is_valid());
}

TEST_CASE("validate transaction  validate  undeclared mint  value preservation violation", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const tx = pay({point(1)}, bob, with_asset(99000000, token("tok"), 1000), 1000000);
    auto const result = check(tx, utxos);
    REQUIRE(result.error_code() == error::value_preservation_violation);

    auto const* detail = result.get_if<value_preservation_violation>();
    REQUIRE(detail != nullptr);
    REQUIRE(detail->imbalances.size() == 1u);
    REQUIRE(detail->imbalances.front().asset == token("tok"));
    REQUIRE(detail->imbalances.front().input == 0);
    REQUIRE(detail->imbalances.front().output == 1000);
    REQUIRE(detail->imbalances.front().difference == 1000);
    REQUIRE(detail->imbalances.front().kind == imbalance_kind::created_from_nothing);
}

TEST_CASE("validate transaction  validate  declared burn  valid", "[validate transaction tests]") {
    auto const utxos = funded(with_asset(100 * ada, token("tok"), 500));
    value mint;
    mint.add(token("tok"), -200);
    auto const tx = pay({point(1)}, bob, with_asset(99000000, token("tok"), 300), 1000000, mint);
    REQUIRE(check(tx, utxos).is_valid());
}

TEST_CASE("validate transaction  validate  several unbalanced assets  all reported in order", "[validate transaction tests]") {
    value held(100 * ada);
    held.add(token("x", 0x02), 10);
    held.add(token("a", 0x01), 5);
    auto const utxos = funded(held);

    value sent(99000002);
    sent.add(token("x", 0x02), 12);
    sent.add(token("a", 0x01), 4);
    auto const result = check(pay({point(1)}, bob, sent, 1000000), utxos);

    auto const* detail = result.get_if<value_preservation_violation>();
    REQUIRE(detail != nullptr);
    REQUIRE(detail->imbalances.size() == 3u);
    REQUIRE(detail->imbalances[0].asset.is_base_currency());
    REQUIRE(detail->imbalances[1].asset == token("a", 0x01));
    REQUIRE(detail->imbalances[1].kind == imbalance_kind::destroyed);
    REQUIRE(detail->imbalances[2].asset == token("x", 0x02));
    REQUIRE(detail->imbalances[2].kind == imbalance_kind::created_from_nothing);
}

// Base currency cannot be minted.
//-----------------------------------------------------------------------------

TEST_CASE("validate transaction  validate  base currency mint  illegal mint", "[validate transaction tests]") {
    auto const utxos = funded();
    // Balanced once the mint is counted, rejected anyway.
    auto const tx = pay({point(1)}, bob, value(100000000), 1000000, value(1000000));
    auto const result = check(tx, utxos);
    REQUIRE(result.error_code() == error::illegal_base_currency_mint);

    auto const* detail = result.get_if<illegal_base_currency_mint>();
    REQUIRE(detail != nullptr);
    REQUIRE(detail->attempted_mint == 1000000);
    REQUIRE(detail->attempted_burn == 0);
}

TEST_CASE("validate transaction  validate  base currency burn  illegal mint", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const tx = pay({point(1)}, bob, value(98000000), 1000000, value(-1000000));
    auto const* detail = check(tx, utxos).get_if<illegal_base_currency_mint>();
    REQUIRE(detail != nullptr);
    REQUIRE(detail->attempted_mint == 0);
    REQUIRE(detail->attempted_burn == 1000000);
}

// structural_rule
//-----------------------------------------------------------------------------

TEST_CASE("validate transaction  validate  unknown input  missing input", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const result = check(pay({point(1), point(9, 3)}, bob, value(99000000), 1000000), utxos);
    REQUIRE(result.error_code() == error::missing_input);

    auto const* detail = result.get_if<missing_input>();
    REQUIRE(detail != nullptr);
    REQUIRE(detail->unresolved == output_point::list{point(9, 3)});
}

TEST_CASE("validate transaction  validate  unknown input and unbalanced  missing input first", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const result = check(pay({point(7)}, bob, value(500 * ada), 1000000), utxos);
    REQUIRE(result.error_code() == error::missing_input);
}

TEST_CASE("validate transaction  validate  no inputs  malformed", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const result = check(pay({}, bob, value(99000000), 1000000), utxos);
    REQUIRE(result.error_code() == error::empty_inputs);
    REQUIRE(result.get_if<malformed_transaction>() != nullptr);
}

TEST_CASE("validate transaction  validate  no outputs  malformed", "[validate transaction tests]") {
    auto const utxos = funded();
    transaction const tx{{point(1)}, {}, 100 * 1000000};
    REQUIRE(check(tx, utxos).error_code() == error::empty_outputs);
}

TEST_CASE("validate transaction  validate  negative output asset  negative output value", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const tx = pay({point(1)}, bob, with_asset(99000000, token("tok"), -5), 1000000);
    auto const result = check(tx, utxos);
    REQUIRE(result.error_code() == error::negative_output_value);

    auto const* detail = result.get_if<negative_output_value>();
    REQUIRE(detail != nullptr);
    REQUIRE(detail->output_index == 0u);
    REQUIRE(detail->asset == token("tok"));
    REQUIRE(detail->quantity == -5);
}

// size_rule
//-----------------------------------------------------------------------------

TEST_CASE("validate transaction  validate  above max size  oversized", "[validate transaction tests]") {
    auto const utxos = funded();
    settings params;
    params.max_transaction_size = 50;
    auto const tx = pay({point(1)}, bob, value(99000000), 1000000);
    auto const result = check(tx, utxos, params);
    REQUIRE(result.error_code() == error::oversized_transaction);

    auto const* detail = result.get_if<oversized_transaction>();
    REQUIRE(detail != nullptr);
    REQUIRE(detail->actual == cbor_serializer{}.serialized_size(tx));
    REQUIRE(detail->limit == 50u);
}

TEST_CASE("validate transaction  validate  large datum  oversized", "[validate transaction tests]") {
    auto const utxos = funded();
    output::list outputs {output{bob, value(99000000), data_chunk(20000, 0x00)}};
    transaction const tx{{point(1)}, outputs, 1000000};
    REQUIRE(check(tx, utxos).error_code() == error::oversized_transaction);
}

// fee_rule
//-----------------------------------------------------------------------------

TEST_CASE("validate transaction  validate  low fee  insufficient fee", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const tx = pay({point(1)}, bob, value(99999000), 1000);
    auto const result = check(tx, utxos);
    REQUIRE(result.error_code() == error::insufficient_fee);

    // 88 bytes: 44 * 88 + 155381
    auto const* detail = result.get_if<insufficient_fee>();
    REQUIRE(detail != nullptr);
    REQUIRE(cbor_serializer{}.serialized_size(tx) == 88u);
    REQUIRE(detail->required == 159253u);
    REQUIRE(detail->actual == 1000u);
}

TEST_CASE("validate transaction  validate  fee equal to minimum  valid", "[validate transaction tests]") {
    auto const utxos = funded();
    // 159253 encodes in 5 bytes, same size as the 1 ADA fee case.
    auto const tx = pay({point(1)}, bob, value(100 * ada - 159253), 159253);
    REQUIRE(cbor_serializer{}.serialized_size(tx) == 90u);

    settings const params;
    cbor_serializer const serializer;
    validate_transaction const validator(params, serializer);
    auto const required = validator.minimum_fee(tx);
    REQUIRE(required == 44u * 90u + 155381u);

    auto const exact = pay({point(1)}, bob, value(100 * ada - amount_t(required)), required);
    REQUIRE(validator.validate(exact, utxos).is_valid());
}

// deposit_rule
//-----------------------------------------------------------------------------

TEST_CASE("validate transaction  validate  small output  insufficient deposit", "[validate transaction tests]") {
    auto const utxos = funded();
    output::list outputs {output{bob, value(500000)}, output{alice, value(98500000)}};
    transaction const tx{{point(1)}, outputs, 1000000};
    auto const result = check(tx, utxos);
    REQUIRE(result.error_code() == error::insufficient_deposit);

    // (160 + 39) * 4310
    auto const* detail = result.get_if<insufficient_deposit>();
    REQUIRE(detail != nullptr);
    REQUIRE(detail->output_index == 0u);
    REQUIRE(detail->required == 857690);
    REQUIRE(detail->actual == 500000);
}

TEST_CASE("validate transaction  minimum output deposit  added content  monotonic", "[validate transaction tests]") {
    settings const params;
    cbor_serializer const serializer;
    validate_transaction const validator(params, serializer);

    output const plain(bob, value(2 * ada));
    output const with_datum(bob, value(2 * ada), data_chunk(32, 0x00));
    output const with_token(bob, with_asset(2 * ada, token("tok"), 1));
    output const with_two_tokens(bob, with_asset(2 * ada, token("tok"), 1) + with_asset(0, token("other"), 1));
    output const with_script(bob, value(2 * ada), data_chunk(32, 0x00), data_chunk(64, 0x00));

    auto const base = validator.minimum_output_deposit(plain);
    REQUIRE(base == (160 + 39) * 4310);
    REQUIRE(validator.minimum_output_deposit(with_datum) > base);
    REQUIRE(validator.minimum_output_deposit(with_token) > base);
    REQUIRE(validator.minimum_output_deposit(with_two_tokens) > validator.minimum_output_deposit(with_token));
    REQUIRE(validator.minimum_output_deposit(with_script) > validator.minimum_output_deposit(with_datum));
}

TEST_CASE("validate transaction  minimum fee  extra output  increases", "[validate transaction tests]") {
    settings const params;
    cbor_serializer const serializer;
    validate_transaction const validator(params, serializer);

    output::list one {output{bob, value(2 * ada)}};
    output::list two {output{bob, value(2 * ada)}, output{alice, value(2 * ada)}};
    REQUIRE(validator.minimum_fee(transaction{{point(1)}, two, 0}) > validator.minimum_fee(transaction{{point(1)}, one, 0}));
}

// Rules run alone.
//-----------------------------------------------------------------------------

TEST_CASE("validate transaction  value preservation rule  low fee only  valid", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const tx = pay({point(1)}, bob, value(99999000), 1000);
    REQUIRE(check_rule<rules::value_preservation_rule>(tx, utxos).is_valid());
    REQUIRE(check_rule<rules::fee_rule>(tx, utxos).error_code() == error::insufficient_fee);
    REQUIRE(check_rule<rules::structural_rule>(tx, utxos).is_valid());
    REQUIRE(check_rule<rules::size_rule>(tx, utxos).is_valid());
    REQUIRE(check_rule<rules::deposit_rule>(tx, utxos).is_valid());
}

TEST_CASE("validate transaction  value preservation rule  unknown input  missing input", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const tx = pay({point(4)}, bob, value(99000000), 1000000);
    REQUIRE(check_rule<rules::value_preservation_rule>(tx, utxos).error_code() == error::missing_input);
}

TEST_CASE("validate transaction  dispatcher  failing rules  first in order reported", "[validate transaction tests]") {
    auto const utxos = funded();
    // Fails the fee, the deposit and the value preservation rules.
    auto const tx = pay({point(1)}, bob, value(10), 1000);
    settings const params;
    cbor_serializer const serializer;
    rules::context const ctx {utxos, params, serializer};

    REQUIRE(rules::dispatcher<rules::phase_one>{}(tx, ctx).error_code() == error::insufficient_fee);

    using deposit_first = std::tuple<rules::deposit_rule, rules::fee_rule>;
    REQUIRE(rules::dispatcher<deposit_first>{}(tx, ctx).error_code() == error::insufficient_deposit);
}

TEST_CASE("validate transaction  dispatcher  phase one  distinct rule codes", "[validate transaction tests]") {
    REQUIRE(rules::dispatcher<rules::phase_one>::distinct_rule_codes());
    REQUIRE(rules::dispatcher<std::tuple<rules::fee_rule>>::distinct_rule_codes());
}

TEST_CASE("validate transaction  dispatcher  rule listed twice  codes not distinct", "[validate transaction tests]") {
    using repeated = std::tuple<rules::fee_rule, rules::size_rule, rules::fee_rule>;
    REQUIRE_FALSE(rules::dispatcher<repeated>::distinct_rule_codes());
}

TEST_CASE("validate transaction  dispatcher  valid transaction  every rule passes", "[validate transaction tests]") {
    auto const utxos = funded();
    auto const tx = pay({point(1)}, bob, value(99000000), 1000000);
    settings const params;
    cbor_serializer const serializer;
    rules::context const ctx {utxos, params, serializer};

    REQUIRE(rules::dispatcher<rules::phase_one>{}(tx, ctx).is_valid());
}

// Conservation property.
//-----------------------------------------------------------------------------

TEST_CASE("validate transaction  validate  random bundles  accepted iff balanced", "[validate transaction tests]") {
    std::mt19937_64 rng(20240601);
    std::uniform_int_distribution<int> small(0, 100);
    std::uniform_int_distribution<int> delta(-2, 2);

    std::vector<asset_id> const tokens {token("a"), token("b"), token("c", 0x02)};
    std::vector<asset_id> const ids {asset_id::base_currency(), token("a"), token("b"), token("c", 0x02)};
    std::uniform_int_distribution<size_t> pick(0, ids.size() - 1);

    settings const params;
    cbor_serializer const serializer;
    validate_transaction const validator(params, serializer);
    uint64_t const fee = 2000000;

    for (int round = 0; round < 200; ++round) {
        memory_utxos utxos;
        output_point::list inputs;
        value total_in;
        for (uint8_t i = 1; i <= 3; ++i) {
            value held(50 * ada + small(rng));
            for (auto const& id : tokens) {
                held.add(id, 10 + small(rng));
            }
            utxos.add(point(i), output{alice, held});
            inputs.push_back(point(i));
            total_in += held;
        }

        // Burns up to half of token a, mints some of token c.
        value mint;
        mint.add(tokens[0], amount_t(small(rng)) - total_in.quantity(tokens[0]) / 2);
        mint.add(tokens[2], small(rng));

        auto const available = total_in + mint - value(fee);
        value first(available.base_currency_quantity() / 2);
        for (auto const& id : tokens) {
            first.add(id, available.quantity(id) / 2);
        }
        auto second = available - first;

        auto const& target = ids[pick(rng)];
        auto const d = delta(rng);
        second.add(target, d);

        transaction const tx{inputs, {output{bob, first}, output{alice, second}}, fee, mint};
        auto const result = validator.validate(tx, utxos);

        if (d == 0) {
            REQUIRE(result.is_valid());
            continue;
        }

        REQUIRE(result.error_code() == error::value_preservation_violation);
        auto const* detail = result.get_if<value_preservation_violation>();
        REQUIRE(detail != nullptr);
        REQUIRE(detail->imbalances.size() == 1u);
        REQUIRE(detail->imbalances.front().asset == target);
        REQUIRE(detail->imbalances.front().difference == (d > 0 ? d : -d));
        REQUIRE(detail->imbalances.front().kind == (d > 0 ? imbalance_kind::created_from_nothing : imbalance_kind::destroyed));
    }
}
