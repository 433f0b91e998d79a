// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_POOLS_BLOCK_ENTRY_HPP
#define LEDGERSIM_POOLS_BLOCK_ENTRY_HPP

#include <cstddef>
#include <cstdint>
#include <iostream>
#include <vector>

#include <ledgersim/define.hpp>
#include <ledgersim/validate/validation_result.hpp>

namespace ledgersim {

/// A transaction excluded from a block, with the rule that rejected it.
struct dropped_transaction {
    hash_digest id;
    validation_result reason;
};

/// Record of one produced block.
/// This class is not thread safe.
class LEDGERSIM_API block_entry {
public:
    using list = std::vector<block_entry>;
    using hash_list = std::vector<hash_digest>;
    using dropped_list = std::vector<dropped_transaction>;

    block_entry(uint64_t height, slot_t slot);

    /// Block height reached once this block is produced.
    uint64_t height() const;

    /// Slot at which the block was produced.
    slot_t slot() const;

    /// Ids of the applied transactions, in application order.
    hash_list const& applied() const;

    dropped_list const& dropped() const;

    /// Sum of the serialized sizes of the applied transactions.
    size_t size() const;

    bool is_empty() const;

    void add_applied(hash_digest const& id, size_t size);
    void add_dropped(hash_digest const& id, validation_result reason);

    /// Serializer for debugging.
    friend
    std::ostream& operator<<(std::ostream& out, block_entry const& of);

private:
    uint64_t height_;
    slot_t slot_;
    size_t size_ = 0;
    hash_list applied_;
    dropped_list dropped_;
};

} // namespace ledgersim

#endif
