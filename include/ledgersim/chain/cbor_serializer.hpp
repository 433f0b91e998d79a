// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_CHAIN_CBOR_SERIALIZER_HPP
#define LEDGERSIM_CHAIN_CBOR_SERIALIZER_HPP

#include <cstddef>

#include <ledgersim/chain/cbor_writer.hpp>
#include <ledgersim/chain/output.hpp>
#include <ledgersim/chain/serializer.hpp>
#include <ledgersim/chain/transaction.hpp>
#include <ledgersim/chain/value.hpp>
#include <ledgersim/define.hpp>

namespace ledgersim::chain {

/// Default serializer: Babbage-shaped CBOR.
///   transaction = [body, witness set, is valid, auxiliary data]
///   body        = {0: inputs, 1: outputs, 2: fee, ? 9: mint}
///   output      = {0: address, 1: value, ? 2: datum option, ? 3: script ref}
/// The id is the SHA-256 of the body encoding.
class LEDGERSIM_API cbor_serializer : public serializer {
public:
    size_t serialized_size(transaction const& tx) const override;
    size_t serialized_size(output const& out) const override;
    hash_digest hash(transaction const& tx) const override;

    static
    size_t serialized_size(value const& x);

    static
    data_chunk to_data(transaction const& tx);

    static
    data_chunk body_data(transaction const& tx);

    static
    data_chunk to_data(output const& out);

    static
    void write(cbor_writer& sink, transaction const& tx);

    static
    void write_body(cbor_writer& sink, transaction const& tx);

    static
    void write(cbor_writer& sink, output const& out);

    static
    void write(cbor_writer& sink, value const& x);

private:
    static
    void write_multi_asset(cbor_writer& sink, value const& x);
};

} // namespace ledgersim::chain

#endif
