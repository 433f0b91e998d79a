// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_INTERFACE_UTXO_VIEW_HPP
#define LEDGERSIM_INTERFACE_UTXO_VIEW_HPP

#include <ledgersim/chain/output.hpp>
#include <ledgersim/chain/output_point.hpp>
#include <ledgersim/define.hpp>

namespace ledgersim {

/// Read-only access to a UTXO set, the only thing phase-1 validation needs
/// from the ledger.
class LEDGERSIM_API utxo_view {
public:
    virtual ~utxo_view() = default;

    /// Get the output that is referenced by the point in the UTXO set.
    virtual bool get_utxo(chain::output& out_output, chain::output_point const& point) const = 0;
};

} // namespace ledgersim

#endif
