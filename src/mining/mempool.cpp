// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/mining/mempool.hpp>

#include <stdexcept>
#include <utility>

#include <spdlog/spdlog.h>

namespace ledgersim::mining {

mempool::mempool(size_t max_block_size, size_t mempool_size_multiplier)
    : capacity_(max_block_size * mempool_size_multiplier)
{}

validation_result mempool::add(chain::transaction::const_ptr tx, hash_digest const& id, size_t size) {
    if (contains(id)) {
        spdlog::debug("[{}] Transaction {} already in the mempool.", LOG_LEDGERSIM, encode_hash(id));
        return validation_result{duplicate_transaction{id}};
    }

    auto const available = capacity_ - total_size_;
    if (size > available) {
        spdlog::debug("[{}] Mempool full, transaction {} needs {} bytes, {} available.", LOG_LEDGERSIM, encode_hash(id), size, available);
        return validation_result{queue_full{size, available}};
    }

    queue_.push_back(entry{std::move(tx), id, size, next_order_});
    index_.insert(id);
    total_size_ += size;
    ++next_order_;
    return {};
}

mempool::entry const& mempool::front() const {
    if (queue_.empty()) {
        throw std::logic_error("front of an empty mempool");
    }
    return queue_.front();
}

void mempool::pop() {
    if (queue_.empty()) {
        return;
    }

    auto const& oldest = queue_.front();
    index_.erase(oldest.id);
    total_size_ -= oldest.size;
    queue_.pop_front();
}

bool mempool::contains(hash_digest const& id) const {
    return index_.find(id) != index_.end();
}

size_t mempool::size() const {
    return queue_.size();
}

bool mempool::is_empty() const {
    return queue_.empty();
}

size_t mempool::total_size() const {
    return total_size_;
}

size_t mempool::capacity() const {
    return capacity_;
}

mempool::entry_list mempool::snapshot() const {
    return entry_list(queue_.begin(), queue_.end());
}

} // namespace ledgersim::mining
