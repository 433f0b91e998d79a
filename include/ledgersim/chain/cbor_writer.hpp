// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_CHAIN_CBOR_WRITER_HPP
#define LEDGERSIM_CHAIN_CBOR_WRITER_HPP

#include <cstddef>
#include <cstdint>

#include <ledgersim/define.hpp>

namespace ledgersim::chain {

/// Minimal canonical CBOR (RFC 8949) encoder, definite lengths only.
/// This class is not thread safe.
class LEDGERSIM_API cbor_writer {
public:
    void write_uint(uint64_t x);
    void write_nint(uint64_t magnitude_minus_one);

    /// Integers beyond 64 bits use the bignum tags (2 and 3).
    void write_int(amount_t const& x);

    void write_bytes(data_chunk const& x);
    void write_bytes(uint8_t const* data, size_t size);
    void write_array_header(size_t size);
    void write_map_header(size_t size);
    void write_tag(uint64_t tag);
    void write_bool(bool x);
    void write_null();

    data_chunk const& data() const;
    size_t size() const;

private:
    void write_head(uint8_t major, uint64_t x);

    data_chunk data_;
};

} // namespace ledgersim::chain

#endif
