// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_CHAIN_TRANSACTION_HPP
#define LEDGERSIM_CHAIN_TRANSACTION_HPP

#include <cstdint>
#include <memory>
#include <vector>

#include <ledgersim/chain/output.hpp>
#include <ledgersim/chain/output_point.hpp>
#include <ledgersim/chain/value.hpp>
#include <ledgersim/define.hpp>

namespace ledgersim::chain {

/// Immutable transaction body. Inputs form an ordered set: they are sorted
/// and deduplicated on construction. Identity (hash) is derived by the
/// serializer.
class LEDGERSIM_API transaction {
public:
    using list = std::vector<transaction>;
    using const_ptr = std::shared_ptr<transaction const>;

    transaction() = default;
    transaction(output_point::list inputs, output::list outputs, uint64_t fee, chain::value mint = {});

    output_point::list const& inputs() const;
    output::list const& outputs() const;
    uint64_t fee() const;

    /// Signed: positive entries mint, negative entries burn.
    chain::value const& mint() const;
    bool has_mint() const;

    /// Sum of the values of every output.
    chain::value outputs_value() const;

    friend
    bool operator==(transaction const& a, transaction const& b) {
        return a.fee_ == b.fee_
            && a.inputs_ == b.inputs_
            && a.outputs_ == b.outputs_
            && a.mint_ == b.mint_;
    }

    friend
    bool operator!=(transaction const& a, transaction const& b) {
        return !(a == b);
    }

private:
    output_point::list inputs_;
    output::list outputs_;
    uint64_t fee_ = 0;
    chain::value mint_;
};

} // namespace ledgersim::chain

#endif
