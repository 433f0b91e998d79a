// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_INTERFACE_EMULATOR_HPP
#define LEDGERSIM_INTERFACE_EMULATOR_HPP

#include <cstddef>
#include <cstdint>
#include <optional>

#include <ledgersim/chain/output.hpp>
#include <ledgersim/chain/output_point.hpp>
#include <ledgersim/chain/serializer.hpp>
#include <ledgersim/chain/transaction.hpp>
#include <ledgersim/chain/utxo.hpp>
#include <ledgersim/clock/slot_clock.hpp>
#include <ledgersim/define.hpp>
#include <ledgersim/error.hpp>
#include <ledgersim/mining/mempool.hpp>
#include <ledgersim/mining/prioritizer.hpp>
#include <ledgersim/pools/block_entry.hpp>
#include <ledgersim/settings.hpp>
#include <ledgersim/state/ledger.hpp>
#include <ledgersim/validate/validate_transaction.hpp>
#include <ledgersim/validate/validation_result.hpp>

namespace ledgersim {

/// Single-node chain: owns the clock, the ledger and the mempool, and is the
/// only writer of the ledger and the clock. Submissions and block production
/// are serialized, a pending block production goes first.
/// This class is thread safe.
class LEDGERSIM_API emulator {
public:
    /// Throws std::invalid_argument on invalid genesis parameters or on
    /// duplicated initial utxos. A null serializer selects cbor_serializer.
    emulator(chain::utxo::list const& initial_utxos, settings const& params = settings{}, chain::serializer::const_ptr serializer = nullptr);

    // non-copyable and non-movable class
    emulator(emulator const&) = delete;
    emulator& operator=(emulator const&) = delete;

    // Ledger queries.
    //-------------------------------------------------------------------------

    std::optional<chain::utxo> get_utxo(chain::output_point const& point) const;
    chain::utxo::list get_utxos() const;
    chain::utxo::list get_utxos_at(data_chunk const& address) const;
    ledger::snapshot_view snapshot() const;

    // Clock queries.
    //-------------------------------------------------------------------------

    slot_t get_current_slot() const;
    epoch_t get_current_epoch() const;
    uint64_t get_current_block_height() const;
    posix_time_t get_current_time() const;
    posix_time_t slot_to_time(slot_t slot) const;
    code time_to_slot(slot_t& out_slot, posix_time_t time) const;

    // Mempool queries.
    //-------------------------------------------------------------------------

    /// Queued entries, oldest first.
    mining::mempool::entry_list get_mempool_snapshot() const;
    size_t mempool_size() const;

    // Builder support.
    //-------------------------------------------------------------------------

    amount_t get_minimum_output_deposit(chain::output const& out) const;
    uint64_t minimum_fee(chain::transaction const& tx) const;
    hash_digest transaction_id(chain::transaction const& tx) const;

    /// Dry run against the confirmed ledger, nothing is queued.
    validation_result validate(chain::transaction const& tx) const;

    settings const& params() const;

    /// Every block that applied or dropped a transaction, oldest first.
    /// Boundaries crossed with an empty mempool are not recorded.
    block_entry::list get_blocks() const;

    // Commands.
    //-------------------------------------------------------------------------

    /// Validates against the confirmed ledger and queues on success, setting
    /// out_id. On failure nothing is queued and the detail is returned.
    validation_result submit(hash_digest& out_id, chain::transaction const& tx);

    /// Produces n blocks, each one drains the mempool then moves the clock to
    /// the next block boundary. Once the mempool is empty the clock jumps over
    /// the remaining boundaries. Returns the non-empty blocks.
    block_entry::list advance_blocks(size_t n);

    /// Moves the clock by n slots (n > 0, std::invalid_argument otherwise),
    /// producing a block at every boundary crossed while the mempool holds
    /// transactions. Returns the non-empty blocks.
    block_entry::list advance_slots(slot_t n);

private:
    // Callers must hold the prioritizer.
    void skip_blocks(uint64_t n);
    block_entry produce_block();

    settings const settings_;
    chain::serializer::const_ptr serializer_;
    validate_transaction validator_;
    slot_clock clock_;
    ledger ledger_;
    mining::mempool mempool_;
    block_entry::list blocks_;

    mining::prioritizer prioritizer_;
};

} // namespace ledgersim

#endif
