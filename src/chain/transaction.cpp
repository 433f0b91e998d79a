// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/chain/transaction.hpp>

#include <algorithm>
#include <utility>

namespace ledgersim::chain {

transaction::transaction(output_point::list inputs, output::list outputs, uint64_t fee, chain::value mint)
    : inputs_(std::move(inputs))
    , outputs_(std::move(outputs))
    , fee_(fee)
    , mint_(std::move(mint))
{
    std::sort(inputs_.begin(), inputs_.end());
    inputs_.erase(std::unique(inputs_.begin(), inputs_.end()), inputs_.end());
}

output_point::list const& transaction::inputs() const {
    return inputs_;
}

output::list const& transaction::outputs() const {
    return outputs_;
}

uint64_t transaction::fee() const {
    return fee_;
}

chain::value const& transaction::mint() const {
    return mint_;
}

bool transaction::has_mint() const {
    return ! mint_.is_zero();
}

chain::value transaction::outputs_value() const {
    chain::value res;
    for (auto const& out : outputs_) {
        res += out.value();
    }
    return res;
}

} // namespace ledgersim::chain
