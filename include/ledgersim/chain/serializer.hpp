// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_CHAIN_SERIALIZER_HPP
#define LEDGERSIM_CHAIN_SERIALIZER_HPP

#include <cstddef>
#include <memory>

#include <ledgersim/chain/output.hpp>
#include <ledgersim/chain/transaction.hpp>
#include <ledgersim/define.hpp>

namespace ledgersim::chain {

/// Wire encoding and identity of transactions. The ledger core never
/// interprets encoded bytes, only their length and the derived id.
/// Implementations must be deterministic and thread safe.
class LEDGERSIM_API serializer {
public:
    using const_ptr = std::shared_ptr<serializer const>;

    virtual ~serializer() = default;

    /// Size of the complete transaction, used by the size and fee rules.
    virtual size_t serialized_size(transaction const& tx) const = 0;

    /// Size of a single output, used by the minimum deposit rule.
    virtual size_t serialized_size(output const& out) const = 0;

    /// Transaction id, key of every output the transaction produces.
    virtual hash_digest hash(transaction const& tx) const = 0;
};

} // namespace ledgersim::chain

#endif
