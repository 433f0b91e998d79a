// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_CLOCK_SLOT_CLOCK_HPP
#define LEDGERSIM_CLOCK_SLOT_CLOCK_HPP

#include <cstdint>

#include <boost/rational.hpp>

#include <ledgersim/define.hpp>
#include <ledgersim/error.hpp>
#include <ledgersim/settings.hpp>

namespace ledgersim {

/// Simulated time. The only state is the current slot; epoch, block height
/// and POSIX time are pure functions of it and the genesis parameters.
/// Block production is deterministic at the configured density: the block
/// height of slot s is floor(s * active_slot_coefficient).
/// This class is not thread safe.
class LEDGERSIM_API slot_clock {
public:
    using ratio_t = settings::ratio_t;

    /// Throws std::invalid_argument on a zero slot length, a zero epoch
    /// length or an active slot coefficient outside (0, 1].
    slot_clock(genesis_info const& genesis, ratio_t active_slot_coefficient, slot_t initial_slot = 0);

    // Conversions.
    //-------------------------------------------------------------------------

    /// std::overflow_error when the time does not fit in posix_time_t.
    posix_time_t slot_to_time(slot_t slot) const;

    /// Floor division, error::invalid_time when time precedes the start.
    code time_to_slot(slot_t& out_slot, posix_time_t time) const;

    epoch_t slot_to_epoch(slot_t slot) const;
    uint64_t slot_to_block_height(slot_t slot) const;

    /// First slot at which the block height reaches `height`.
    slot_t block_boundary(uint64_t height) const;

    /// First slot strictly after `slot` at which the block height grows.
    slot_t next_block_boundary(slot_t slot) const;

    // Current state.
    //-------------------------------------------------------------------------

    slot_t current_slot() const;
    epoch_t current_epoch() const;
    uint64_t current_block_height() const;
    posix_time_t current_time() const;

    genesis_info const& genesis() const;
    ratio_t const& active_slot_coefficient() const;

    /// Slots between two aligned block boundaries, ceil(1 / f).
    slot_t slots_per_block() const;

    // Commands.
    //-------------------------------------------------------------------------

    /// Requires n > 0 (std::invalid_argument otherwise), returns the new slot.
    slot_t advance_slots(slot_t n);

    /// Moves to the next block boundary, returns the new slot.
    slot_t advance_to_next_block();

private:
    genesis_info const genesis_;
    ratio_t const active_slot_coefficient_;
    slot_t current_slot_;
};

} // namespace ledgersim

#endif
