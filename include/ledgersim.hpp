// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_HPP
#define LEDGERSIM_HPP

/**
 * API Users: Include only this header. Direct use of other headers is fragile
 * and unsupported as header organization is subject to change.
 *
 * Maintainers: Do not include this header internal to this library.
 */

#include <ledgersim/define.hpp>
#include <ledgersim/error.hpp>
#include <ledgersim/settings.hpp>
#include <ledgersim/version.hpp>
#include <ledgersim/chain/asset_id.hpp>
#include <ledgersim/chain/cbor_serializer.hpp>
#include <ledgersim/chain/cbor_writer.hpp>
#include <ledgersim/chain/output.hpp>
#include <ledgersim/chain/output_point.hpp>
#include <ledgersim/chain/serializer.hpp>
#include <ledgersim/chain/transaction.hpp>
#include <ledgersim/chain/utxo.hpp>
#include <ledgersim/chain/value.hpp>
#include <ledgersim/clock/slot_clock.hpp>
#include <ledgersim/interface/emulator.hpp>
#include <ledgersim/interface/utxo_view.hpp>
#include <ledgersim/mining/mempool.hpp>
#include <ledgersim/mining/prioritizer.hpp>
#include <ledgersim/pools/block_entry.hpp>
#include <ledgersim/state/ledger.hpp>
#include <ledgersim/validate/dispatcher.hpp>
#include <ledgersim/validate/rules.hpp>
#include <ledgersim/validate/validate_transaction.hpp>
#include <ledgersim/validate/validation_result.hpp>

#endif
