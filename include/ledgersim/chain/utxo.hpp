// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_CHAIN_UTXO_HPP
#define LEDGERSIM_CHAIN_UTXO_HPP

#include <vector>

#include <ledgersim/chain/output.hpp>
#include <ledgersim/chain/output_point.hpp>
#include <ledgersim/define.hpp>

namespace ledgersim::chain {

/// An unspent output together with the reference that produced it.
/// A utxo is a value, never a handle into the ledger.
class LEDGERSIM_API utxo {
public:
    using list = std::vector<utxo>;

    utxo() = default;
    utxo(output_point const& point, chain::output output);

    output_point const& point() const;
    chain::output const& output() const;

    friend
    bool operator==(utxo const& a, utxo const& b) {
        return a.point_ == b.point_ && a.output_ == b.output_;
    }

    friend
    bool operator!=(utxo const& a, utxo const& b) {
        return !(a == b);
    }

private:
    output_point point_;
    chain::output output_;
};

/// Funds `count` distinct synthetic references with `quantity` base currency
/// each, all owned by `address`. Deterministic: the same arguments always
/// yield the same references.
LEDGERSIM_API utxo::list make_genesis_utxos(size_t count, data_chunk const& address, amount_t const& quantity);

} // namespace ledgersim::chain

#endif
