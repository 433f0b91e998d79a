// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/settings.hpp>

#include <cstdint>

namespace ledgersim {

settings::settings(network net) {
    switch (net) {
        case network::mainnet: {
            genesis = genesis_info{1506203091000, 1000, 432000};
            break;
        }
        case network::preprod: {
            genesis = genesis_info{1654041600000, 1000, 432000};
            break;
        }
        case network::preview: {
            genesis = genesis_info{1666656000000, 1000, 86400};
            max_block_size = 65536;
            break;
        }
    }
}

slot_t settings::slots_per_block() const {
    // ceil(1 / f)
    auto const num = active_slot_coefficient.numerator();
    auto const den = active_slot_coefficient.denominator();
    if (num == 0) {
        return 0;
    }
    return (den + num - 1) / num;
}

size_t settings::mempool_capacity() const {
    return max_block_size * mempool_size_multiplier;
}

} // namespace ledgersim
