// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_VALIDATE_VALIDATE_TRANSACTION_HPP
#define LEDGERSIM_VALIDATE_VALIDATE_TRANSACTION_HPP

#include <cstddef>
#include <cstdint>

#include <ledgersim/chain/output.hpp>
#include <ledgersim/chain/serializer.hpp>
#include <ledgersim/chain/transaction.hpp>
#include <ledgersim/define.hpp>
#include <ledgersim/interface/utxo_view.hpp>
#include <ledgersim/settings.hpp>
#include <ledgersim/validate/validation_result.hpp>

namespace ledgersim {

/// Phase-1 validation of a transaction against a UTXO view.
/// Holds references only, settings and serializer must outlive it.
/// This class is thread safe.
class LEDGERSIM_API validate_transaction {
public:
    validate_transaction(settings const& params, chain::serializer const& serializer);

    /// Structural, size, fee, minimum deposit and value preservation rules,
    /// in this order, stopping at the first failure.
    validation_result validate(chain::transaction const& tx, utxo_view const& utxos) const;

    uint64_t minimum_fee(chain::transaction const& tx) const;
    amount_t minimum_output_deposit(chain::output const& out) const;

private:
    settings const& settings_;
    chain::serializer const& serializer_;
};

} // namespace ledgersim

#endif
