// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/validate/rules.hpp>

#include <algorithm>
#include <set>
#include <utility>

namespace ledgersim::rules {

using chain::asset_id;
using chain::output;
using chain::transaction;
using chain::value;

uint64_t minimum_fee(size_t transaction_size, settings const& params) {
    return params.fee_per_byte * transaction_size + params.fixed_fee;
}

amount_t minimum_deposit(size_t output_size, settings const& params) {
    return amount_t(params.utxo_entry_overhead + output_size) * amount_t(params.min_deposit_coefficient);
}

// structural_rule
//-----------------------------------------------------------------------------

validation_result structural_rule::operator()(transaction const& tx, context const& ctx) const {
    if (tx.inputs().empty()) {
        return validation_result{malformed_transaction{error::empty_inputs}};
    }

    if (tx.outputs().empty()) {
        return validation_result{malformed_transaction{error::empty_outputs}};
    }

    missing_input missing;
    output resolved;
    for (auto const& point : tx.inputs()) {
        if ( ! ctx.utxos.get_utxo(resolved, point)) {
            missing.unresolved.push_back(point);
        }
    }

    if ( ! missing.unresolved.empty()) {
        return validation_result{std::move(missing)};
    }

    for (size_t index = 0; index < tx.outputs().size(); ++index) {
        auto const& x = tx.outputs()[index].value();
        for (auto const& id : x.asset_ids()) {
            auto const quantity = x.quantity(id);
            if (quantity < 0) {
                return validation_result{negative_output_value{index, id, quantity}};
            }
        }
    }

    return {};
}

// size_rule
//-----------------------------------------------------------------------------

validation_result size_rule::operator()(transaction const& tx, context const& ctx) const {
    auto const actual = ctx.serializer.serialized_size(tx);
    auto const limit = std::min(ctx.params.max_transaction_size, ctx.params.max_block_size);
    if (actual > limit) {
        return validation_result{oversized_transaction{actual, limit}};
    }
    return {};
}

// fee_rule
//-----------------------------------------------------------------------------

validation_result fee_rule::operator()(transaction const& tx, context const& ctx) const {
    auto const required = minimum_fee(ctx.serializer.serialized_size(tx), ctx.params);
    if (tx.fee() < required) {
        return validation_result{insufficient_fee{required, tx.fee()}};
    }
    return {};
}

// deposit_rule
//-----------------------------------------------------------------------------

validation_result deposit_rule::operator()(transaction const& tx, context const& ctx) const {
    for (size_t index = 0; index < tx.outputs().size(); ++index) {
        auto const& out = tx.outputs()[index];
        auto const required = minimum_deposit(ctx.serializer.serialized_size(out), ctx.params);
        auto const& actual = out.value().base_currency_quantity();
        if (actual < required) {
            return validation_result{insufficient_deposit{index, required, actual}};
        }
    }
    return {};
}

// value_preservation_rule
//-----------------------------------------------------------------------------

validation_result value_preservation_rule::operator()(transaction const& tx, context const& ctx) const {
    auto const& mint = tx.mint();
    auto const& base_mint = mint.base_currency_quantity();
    if (base_mint != 0) {
        auto const minted = mint.positive_part().base_currency_quantity();
        auto const burned = mint.negative_part().base_currency_quantity();
        return validation_result{illegal_base_currency_mint{minted, burned}};
    }

    value inputs;
    missing_input missing;
    output resolved;
    for (auto const& point : tx.inputs()) {
        if (ctx.utxos.get_utxo(resolved, point)) {
            inputs += resolved.value();
        } else {
            missing.unresolved.push_back(point);
        }
    }

    if ( ! missing.unresolved.empty()) {
        return validation_result{std::move(missing)};
    }

    auto const outputs = tx.outputs_value();
    amount_t const fee_paid = tx.fee();

    // Base currency first, then ascending asset id.
    std::set<asset_id> ids;
    auto const collect = [&ids](value const& x) {
        auto const xs = x.asset_ids();
        ids.insert(xs.begin(), xs.end());
    };
    collect(inputs);
    collect(outputs);
    collect(mint);

    value_preservation_violation violation;
    for (auto const& id : ids) {
        auto const in = inputs.quantity(id);
        auto const out = outputs.quantity(id);
        auto const minted = mint.quantity(id);
        amount_t const paid = id.is_base_currency() ? fee_paid : amount_t(0);

        auto const expected = in + minted;
        auto const actual = out + paid;
        if (expected == actual) {
            continue;
        }

        auto const kind = actual > expected ? imbalance_kind::created_from_nothing : imbalance_kind::destroyed;
        auto const difference = actual > expected ? actual - expected : expected - actual;
        violation.imbalances.push_back({id, in, out, minted, paid, expected, actual, difference, kind});
    }

    if ( ! violation.imbalances.empty()) {
        return validation_result{std::move(violation)};
    }
    return {};
}

} // namespace ledgersim::rules
