// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/chain/output_point.hpp>

namespace ledgersim::chain {

output_point::output_point(hash_digest const& hash, uint32_t index)
    : hash_(hash)
    , index_(index)
{}

hash_digest const& output_point::hash() const {
    return hash_;
}

uint32_t output_point::index() const {
    return index_;
}

std::string output_point::to_string() const {
    return encode_hash(hash_) + "#" + std::to_string(index_);
}

} // namespace ledgersim::chain
