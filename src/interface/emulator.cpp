// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/interface/emulator.hpp>

#include <limits>
#include <memory>
#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

#include <ledgersim/chain/cbor_serializer.hpp>

namespace ledgersim {

using chain::output;
using chain::output_point;
using chain::transaction;
using chain::utxo;

namespace {

chain::serializer::const_ptr or_default(chain::serializer::const_ptr serializer) {
    if (serializer) {
        return serializer;
    }
    return std::make_shared<chain::cbor_serializer const>();
}

} // namespace

emulator::emulator(utxo::list const& initial_utxos, settings const& params, chain::serializer::const_ptr serializer)
    : settings_(params)
    , serializer_(or_default(std::move(serializer)))
    , validator_(settings_, *serializer_)
    , clock_(settings_.genesis, settings_.active_slot_coefficient)
    , ledger_(initial_utxos)
    , mempool_(settings_.max_block_size, settings_.mempool_size_multiplier)
{
    spdlog::debug("[{}] Emulator started with {} utxos at slot {}.", LOG_LEDGERSIM, initial_utxos.size(), clock_.current_slot());
}

// Ledger queries.
//-----------------------------------------------------------------------------

std::optional<utxo> emulator::get_utxo(output_point const& point) const {
    return prioritizer_.low_job([&]{
        return ledger_.resolve(point);
    });
}

utxo::list emulator::get_utxos() const {
    return prioritizer_.low_job([this]{
        return ledger_.get_utxos();
    });
}

utxo::list emulator::get_utxos_at(data_chunk const& address) const {
    return prioritizer_.low_job([&]{
        return ledger_.get_utxos_at(address);
    });
}

ledger::snapshot_view emulator::snapshot() const {
    return prioritizer_.low_job([this]{
        return ledger_.snapshot();
    });
}

// Clock queries.
//-----------------------------------------------------------------------------

slot_t emulator::get_current_slot() const {
    return prioritizer_.low_job([this]{
        return clock_.current_slot();
    });
}

epoch_t emulator::get_current_epoch() const {
    return prioritizer_.low_job([this]{
        return clock_.current_epoch();
    });
}

uint64_t emulator::get_current_block_height() const {
    return prioritizer_.low_job([this]{
        return clock_.current_block_height();
    });
}

posix_time_t emulator::get_current_time() const {
    return prioritizer_.low_job([this]{
        return clock_.current_time();
    });
}

// Pure functions of the genesis parameters, no lock needed.
posix_time_t emulator::slot_to_time(slot_t slot) const {
    return clock_.slot_to_time(slot);
}

code emulator::time_to_slot(slot_t& out_slot, posix_time_t time) const {
    return clock_.time_to_slot(out_slot, time);
}

// Mempool queries.
//-----------------------------------------------------------------------------

mining::mempool::entry_list emulator::get_mempool_snapshot() const {
    return prioritizer_.low_job([this]{
        return mempool_.snapshot();
    });
}

size_t emulator::mempool_size() const {
    return prioritizer_.low_job([this]{
        return mempool_.size();
    });
}

// Builder support.
//-----------------------------------------------------------------------------

amount_t emulator::get_minimum_output_deposit(output const& out) const {
    return validator_.minimum_output_deposit(out);
}

uint64_t emulator::minimum_fee(transaction const& tx) const {
    return validator_.minimum_fee(tx);
}

hash_digest emulator::transaction_id(transaction const& tx) const {
    return serializer_->hash(tx);
}

validation_result emulator::validate(transaction const& tx) const {
    return prioritizer_.low_job([&]{
        return validator_.validate(tx, ledger_);
    });
}

settings const& emulator::params() const {
    return settings_;
}

block_entry::list emulator::get_blocks() const {
    return prioritizer_.low_job([this]{
        return blocks_;
    });
}

// Commands.
//-----------------------------------------------------------------------------

validation_result emulator::submit(hash_digest& out_id, transaction const& tx) {
    auto const id = serializer_->hash(tx);
    auto const size = serializer_->serialized_size(tx);

    return prioritizer_.low_job([&]{
        auto res = validator_.validate(tx, ledger_);
        if ( ! res.is_valid()) {
            spdlog::debug("[{}] Transaction {} rejected: {}", LOG_LEDGERSIM, encode_hash(id), res.message());
            return res;
        }

        res = mempool_.add(std::make_shared<transaction const>(tx), id, size);
        if ( ! res.is_valid()) {
            return res;
        }

        out_id = id;
        spdlog::debug("[{}] Transaction {} added to mempool ({} queued).", LOG_LEDGERSIM, encode_hash(id), mempool_.size());
        return res;
    });
}

block_entry::list emulator::advance_blocks(size_t n) {
    return prioritizer_.high_job([&]{
        block_entry::list produced;
        size_t done = 0;
        for (; done < n && ! mempool_.is_empty(); ++done) {
            produced.push_back(produce_block());
        }

        // Nothing left to drain, the remaining boundaries produce empty blocks.
        if (done < n) {
            skip_blocks(n - done);
        }
        return produced;
    });
}

block_entry::list emulator::advance_slots(slot_t n) {
    if (n == 0) {
        spdlog::error("[{}] advance_slots called with zero slots.", LOG_LEDGERSIM);
        throw std::invalid_argument("advance_slots requires a positive slot count");
    }

    return prioritizer_.high_job([&]{
        auto const current = clock_.current_slot();
        if (n > std::numeric_limits<slot_t>::max() - current) {
            throw std::overflow_error("slot counter exhausted");
        }

        auto const target = current + n;
        block_entry::list produced;
        while ( ! mempool_.is_empty() && clock_.next_block_boundary(clock_.current_slot()) <= target) {
            produced.push_back(produce_block());
        }

        if (clock_.current_slot() < target) {
            clock_.advance_slots(target - clock_.current_slot());
        }
        return produced;
    });
}

// private
void emulator::skip_blocks(uint64_t n) {
    auto const height = clock_.current_block_height();
    if (n > std::numeric_limits<uint64_t>::max() - height) {
        throw std::overflow_error("block height exhausted");
    }

    auto const boundary = clock_.block_boundary(height + n);
    clock_.advance_slots(boundary - clock_.current_slot());
    spdlog::debug("[{}] Skipped {} empty blocks, now at height {} slot {}.", LOG_LEDGERSIM,
        n, clock_.current_block_height(), clock_.current_slot());
}

// private
block_entry emulator::produce_block() {
    auto const boundary = clock_.next_block_boundary(clock_.current_slot());
    block_entry block(clock_.slot_to_block_height(boundary), boundary);

    while ( ! mempool_.is_empty()) {
        // Copy, pop() invalidates the front reference.
        auto const next = mempool_.front();

        // Stays queued for a later block. Admission bounds every entry by the
        // block size, so an empty block always takes the front entry.
        if (block.size() + next.size > settings_.max_block_size) {
            break;
        }

        // Against the current state, earlier transactions of this block may
        // have consumed the same inputs.
        auto reason = validator_.validate(*next.tx, ledger_);
        if ( ! reason.is_valid()) {
            spdlog::warn("[{}] Transaction {} dropped from block {}: {}", LOG_LEDGERSIM, encode_hash(next.id), block.height(), reason.message());
            block.add_dropped(next.id, std::move(reason));
            mempool_.pop();
            continue;
        }

        ledger_.apply(*next.tx, next.id);
        block.add_applied(next.id, next.size);
        mempool_.pop();
    }

    clock_.advance_to_next_block();
    spdlog::debug("[{}] Block {} produced at slot {} with {} transactions ({} bytes), {} dropped.", LOG_LEDGERSIM,
        block.height(), block.slot(), block.applied().size(), block.size(), block.dropped().size());

    blocks_.push_back(block);
    return block;
}

} // namespace ledgersim
