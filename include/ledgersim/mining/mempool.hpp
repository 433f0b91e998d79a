// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_MINING_MEMPOOL_HPP
#define LEDGERSIM_MINING_MEMPOOL_HPP

#include <cstddef>
#include <cstdint>
#include <deque>
#include <unordered_set>
#include <vector>

#include <boost/functional/hash.hpp>

#include <ledgersim/chain/transaction.hpp>
#include <ledgersim/define.hpp>
#include <ledgersim/validate/validation_result.hpp>

namespace ledgersim::mining {

/// Strict FIFO admission queue of validated, unconfirmed transactions,
/// bounded by the aggregate serialized size.
/// This class is not thread safe.
class LEDGERSIM_API mempool {
public:
    static constexpr size_t mempool_size_multiplier_default = 10;

    struct entry {
        chain::transaction::const_ptr tx;
        hash_digest id;
        size_t size;
        uint64_t admission_order;
    };

    using entry_list = std::vector<entry>;

    explicit
    mempool(size_t max_block_size, size_t mempool_size_multiplier = mempool_size_multiplier_default);

    /// Appends at the back. Rejects with duplicate_transaction when the id is
    /// already queued and with queue_full when the aggregate size would
    /// exceed the capacity. Nothing is enqueued on rejection.
    validation_result add(chain::transaction::const_ptr tx, hash_digest const& id, size_t size);

    /// Precondition: ! is_empty().
    entry const& front() const;

    /// Removes the oldest entry, no-op when empty.
    void pop();

    bool contains(hash_digest const& id) const;

    /// Number of queued transactions.
    size_t size() const;
    bool is_empty() const;

    /// Aggregate serialized size of the queued transactions.
    size_t total_size() const;
    size_t capacity() const;

    /// Queued entries, oldest first.
    entry_list snapshot() const;

private:
    size_t const capacity_;
    size_t total_size_ = 0;
    uint64_t next_order_ = 0;
    std::deque<entry> queue_;
    std::unordered_set<hash_digest, boost::hash<hash_digest>> index_;
};

} // namespace ledgersim::mining

#endif
