// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/chain/output.hpp>

#include <utility>

namespace ledgersim::chain {

output::output(data_chunk address, chain::value value)
    : address_(std::move(address))
    , value_(std::move(value))
{}

output::output(data_chunk address, chain::value value, std::optional<data_chunk> datum, std::optional<data_chunk> script_ref)
    : address_(std::move(address))
    , value_(std::move(value))
    , datum_(std::move(datum))
    , script_ref_(std::move(script_ref))
{}

data_chunk const& output::address() const {
    return address_;
}

chain::value const& output::value() const {
    return value_;
}

std::optional<data_chunk> const& output::datum() const {
    return datum_;
}

std::optional<data_chunk> const& output::script_ref() const {
    return script_ref_;
}

} // namespace ledgersim::chain
