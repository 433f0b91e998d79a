// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/validate/validate_transaction.hpp>

#include <ledgersim/validate/dispatcher.hpp>
#include <ledgersim/validate/rules.hpp>

namespace ledgersim {

using chain::output;
using chain::transaction;

validate_transaction::validate_transaction(settings const& params, chain::serializer const& serializer)
    : settings_(params)
    , serializer_(serializer)
{}

validation_result validate_transaction::validate(transaction const& tx, utxo_view const& utxos) const {
    rules::context const ctx {utxos, settings_, serializer_};
    return rules::dispatcher<rules::phase_one>{}(tx, ctx);
}

uint64_t validate_transaction::minimum_fee(transaction const& tx) const {
    return rules::minimum_fee(serializer_.serialized_size(tx), settings_);
}

amount_t validate_transaction::minimum_output_deposit(output const& out) const {
    return rules::minimum_deposit(serializer_.serialized_size(out), settings_);
}

} // namespace ledgersim
