// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_CHAIN_OUTPUT_HPP
#define LEDGERSIM_CHAIN_OUTPUT_HPP

#include <optional>
#include <vector>

#include <ledgersim/chain/value.hpp>
#include <ledgersim/define.hpp>

namespace ledgersim::chain {

/// A transaction output: owner address, value and the optional inline
/// datum and reference script. Address, datum and script bytes are opaque.
class LEDGERSIM_API output {
public:
    using list = std::vector<output>;

    output() = default;
    output(data_chunk address, chain::value value);
    output(data_chunk address, chain::value value, std::optional<data_chunk> datum, std::optional<data_chunk> script_ref = std::nullopt);

    data_chunk const& address() const;
    chain::value const& value() const;
    std::optional<data_chunk> const& datum() const;
    std::optional<data_chunk> const& script_ref() const;

    friend
    bool operator==(output const& a, output const& b) {
        return a.address_ == b.address_
            && a.value_ == b.value_
            && a.datum_ == b.datum_
            && a.script_ref_ == b.script_ref_;
    }

    friend
    bool operator!=(output const& a, output const& b) {
        return !(a == b);
    }

private:
    data_chunk address_;
    chain::value value_;
    std::optional<data_chunk> datum_;
    std::optional<data_chunk> script_ref_;
};

} // namespace ledgersim::chain

#endif
