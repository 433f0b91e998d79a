// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/clock/slot_clock.hpp>

#include <limits>
#include <stdexcept>

#include <boost/multiprecision/cpp_int.hpp>

namespace ledgersim {

namespace {

using wide_t = boost::multiprecision::uint128_t;

genesis_info const& checked(genesis_info const& genesis) {
    if (genesis.slot_length == 0) {
        throw std::invalid_argument("slot length must be positive");
    }

    if (genesis.epoch_length == 0) {
        throw std::invalid_argument("epoch length must be positive");
    }
    return genesis;
}

slot_clock::ratio_t const& checked(slot_clock::ratio_t const& f) {
    if (f.numerator() == 0 || f > slot_clock::ratio_t(1)) {
        throw std::invalid_argument("active slot coefficient must be in (0, 1]");
    }
    return f;
}

} // namespace

slot_clock::slot_clock(genesis_info const& genesis, ratio_t active_slot_coefficient, slot_t initial_slot)
    : genesis_(checked(genesis))
    , active_slot_coefficient_(checked(active_slot_coefficient))
    , current_slot_(initial_slot)
{}

// Conversions.
//-----------------------------------------------------------------------------

posix_time_t slot_clock::slot_to_time(slot_t slot) const {
    wide_t const time = wide_t(genesis_.start_time) + wide_t(slot) * genesis_.slot_length;
    if (time > std::numeric_limits<posix_time_t>::max()) {
        throw std::overflow_error("slot time exceeds the posix time range");
    }
    return static_cast<posix_time_t>(time);
}

code slot_clock::time_to_slot(slot_t& out_slot, posix_time_t time) const {
    if (time < genesis_.start_time) {
        return error::invalid_time;
    }

    out_slot = (time - genesis_.start_time) / genesis_.slot_length;
    return error::success;
}

epoch_t slot_clock::slot_to_epoch(slot_t slot) const {
    return slot / genesis_.epoch_length;
}

uint64_t slot_clock::slot_to_block_height(slot_t slot) const {
    // 128-bit intermediate, slot * numerator may not fit in 64 bits.
    wide_t const num = active_slot_coefficient_.numerator();
    wide_t const den = active_slot_coefficient_.denominator();
    return static_cast<uint64_t>(wide_t(slot) * num / den);
}

slot_t slot_clock::block_boundary(uint64_t height) const {
    // Smallest s with floor(s * n / d) == height, that is ceil(height * d / n).
    wide_t const num = active_slot_coefficient_.numerator();
    wide_t const den = active_slot_coefficient_.denominator();
    wide_t const boundary = (wide_t(height) * den + num - 1) / num;
    if (boundary > std::numeric_limits<slot_t>::max()) {
        throw std::overflow_error("slot counter exhausted");
    }
    return static_cast<slot_t>(boundary);
}

slot_t slot_clock::next_block_boundary(slot_t slot) const {
    auto const height = slot_to_block_height(slot);
    if (height == std::numeric_limits<uint64_t>::max()) {
        throw std::overflow_error("slot counter exhausted");
    }
    return block_boundary(height + 1);
}

// Current state.
//-----------------------------------------------------------------------------

slot_t slot_clock::current_slot() const {
    return current_slot_;
}

epoch_t slot_clock::current_epoch() const {
    return slot_to_epoch(current_slot_);
}

uint64_t slot_clock::current_block_height() const {
    return slot_to_block_height(current_slot_);
}

posix_time_t slot_clock::current_time() const {
    return slot_to_time(current_slot_);
}

genesis_info const& slot_clock::genesis() const {
    return genesis_;
}

slot_clock::ratio_t const& slot_clock::active_slot_coefficient() const {
    return active_slot_coefficient_;
}

slot_t slot_clock::slots_per_block() const {
    auto const num = active_slot_coefficient_.numerator();
    auto const den = active_slot_coefficient_.denominator();
    return (den + num - 1) / num;
}

// Commands.
//-----------------------------------------------------------------------------

slot_t slot_clock::advance_slots(slot_t n) {
    if (n == 0) {
        throw std::invalid_argument("advance_slots requires a positive slot count");
    }

    if (n > std::numeric_limits<slot_t>::max() - current_slot_) {
        throw std::overflow_error("slot counter exhausted");
    }

    current_slot_ += n;
    return current_slot_;
}

slot_t slot_clock::advance_to_next_block() {
    return advance_slots(next_block_boundary(current_slot_) - current_slot_);
}

} // namespace ledgersim
