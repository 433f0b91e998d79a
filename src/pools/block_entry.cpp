// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/pools/block_entry.hpp>

#include <utility>

namespace ledgersim {

block_entry::block_entry(uint64_t height, slot_t slot)
    : height_(height)
    , slot_(slot)
{}

uint64_t block_entry::height() const {
    return height_;
}

slot_t block_entry::slot() const {
    return slot_;
}

block_entry::hash_list const& block_entry::applied() const {
    return applied_;
}

block_entry::dropped_list const& block_entry::dropped() const {
    return dropped_;
}

size_t block_entry::size() const {
    return size_;
}

bool block_entry::is_empty() const {
    return applied_.empty();
}

void block_entry::add_applied(hash_digest const& id, size_t size) {
    applied_.push_back(id);
    size_ += size;
}

void block_entry::add_dropped(hash_digest const& id, validation_result reason) {
    dropped_.push_back({id, std::move(reason)});
}

std::ostream& operator<<(std::ostream& out, block_entry const& of) {
    out << "block " << of.height_
        << " slot " << of.slot_
        << " size " << of.size_
        << " applied " << of.applied_.size()
        << " dropped " << of.dropped_.size();

    for (auto const& id : of.applied_) {
        out << std::endl << "  + " << encode_hash(id);
    }

    for (auto const& x : of.dropped_) {
        out << std::endl << "  - " << encode_hash(x.id) << " " << x.reason.message();
    }

    return out;
}

} // namespace ledgersim
