// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_SETTINGS_HPP
#define LEDGERSIM_SETTINGS_HPP

#include <cstddef>
#include <cstdint>

#include <boost/rational.hpp>

#include <ledgersim/define.hpp>

namespace ledgersim {

enum class network {
    mainnet,
    preprod,
    preview
};

/// Fixed parameters of the simulated chain start.
struct genesis_info {
    posix_time_t start_time = 1506203091000;    // ms
    posix_time_t slot_length = 1000;            // ms
    slot_t epoch_length = 432000;               // slots
};

/// Protocol parameters, properties not thread safe.
/// Supplied once at emulator construction and never mutated by the core.
class LEDGERSIM_API settings {
public:
    using ratio_t = boost::rational<uint64_t>;

    settings() = default;
    settings(network net);

    /// Number of slots in one block when the coefficient divides evenly.
    slot_t slots_per_block() const;

    /// Aggregate mempool capacity in bytes.
    size_t mempool_capacity() const;

    /// Properties.
    uint64_t fee_per_byte = 44;
    uint64_t fixed_fee = 155381;
    size_t max_transaction_size = 16384;
    size_t max_block_size = 90112;
    uint64_t min_deposit_coefficient = 4310;    // per serialized byte
    size_t utxo_entry_overhead = 160;           // bytes charged on top of the output
    ratio_t active_slot_coefficient {1, 20};
    genesis_info genesis {};
    size_t mempool_size_multiplier = 10;
};

} // namespace ledgersim

#endif
