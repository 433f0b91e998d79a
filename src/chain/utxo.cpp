// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/chain/utxo.hpp>

#include <utility>

namespace ledgersim::chain {

utxo::utxo(output_point const& point, chain::output output)
    : point_(point)
    , output_(std::move(output))
{}

output_point const& utxo::point() const {
    return point_;
}

chain::output const& utxo::output() const {
    return output_;
}

utxo::list make_genesis_utxos(size_t count, data_chunk const& address, amount_t const& quantity) {
    utxo::list res;
    res.reserve(count);

    for (size_t i = 0; i < count; ++i) {
        // Genesis references: 0xff marker followed by the big endian ordinal.
        hash_digest hash {};
        hash[0] = 0xff;
        for (size_t byte = 0; byte < sizeof(uint64_t); ++byte) {
            hash[hash_size - 1 - byte] = static_cast<uint8_t>((uint64_t(i) >> (8 * byte)) & 0xffu);
        }
        res.emplace_back(output_point{hash, 0}, chain::output{address, value::lovelaces(quantity)});
    }
    return res;
}

} // namespace ledgersim::chain
