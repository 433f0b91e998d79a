// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_VALIDATE_RULES_HPP
#define LEDGERSIM_VALIDATE_RULES_HPP

#include <cstddef>
#include <cstdint>
#include <tuple>

#include <ledgersim/chain/serializer.hpp>
#include <ledgersim/chain/transaction.hpp>
#include <ledgersim/define.hpp>
#include <ledgersim/error.hpp>
#include <ledgersim/interface/utxo_view.hpp>
#include <ledgersim/settings.hpp>
#include <ledgersim/validate/validation_result.hpp>

namespace ledgersim::rules {

/// Everything a phase-1 rule may read. Rules never mutate it.
struct context {
    utxo_view const& utxos;
    settings const& params;
    chain::serializer const& serializer;
};

/// fee_per_byte * size + fixed_fee.
LEDGERSIM_API uint64_t minimum_fee(size_t transaction_size, settings const& params);

/// (utxo_entry_overhead + output_size) * min_deposit_coefficient.
LEDGERSIM_API amount_t minimum_deposit(size_t output_size, settings const& params);

// Each rule is usable on its own, it does not assume earlier rules passed.
//-----------------------------------------------------------------------------

/// At least one input and one output, every input resolves, no negative
/// quantity in an output.
struct LEDGERSIM_API structural_rule {
    static constexpr error::error_code_t rule_code = error::missing_input;
    validation_result operator()(chain::transaction const& tx, context const& ctx) const;
};

struct LEDGERSIM_API size_rule {
    static constexpr error::error_code_t rule_code = error::oversized_transaction;
    validation_result operator()(chain::transaction const& tx, context const& ctx) const;
};

struct LEDGERSIM_API fee_rule {
    static constexpr error::error_code_t rule_code = error::insufficient_fee;
    validation_result operator()(chain::transaction const& tx, context const& ctx) const;
};

/// Reports the first output (by index) below its minimum deposit.
struct LEDGERSIM_API deposit_rule {
    static constexpr error::error_code_t rule_code = error::insufficient_deposit;
    validation_result operator()(chain::transaction const& tx, context const& ctx) const;
};

/// inputs + mint == outputs + fee (fee on the base currency only), for
/// every asset. Base currency can be neither minted nor burned.
struct LEDGERSIM_API value_preservation_rule {
    static constexpr error::error_code_t rule_code = error::value_preservation_violation;
    validation_result operator()(chain::transaction const& tx, context const& ctx) const;
};

/// Cheapest and most common failures first.
using phase_one = std::tuple<structural_rule, size_rule, fee_rule, deposit_rule, value_preservation_rule>;

} // namespace ledgersim::rules

#endif
