// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/chain/cbor_writer.hpp>

#include <limits>

namespace ledgersim::chain {

namespace {

constexpr uint8_t major_uint = 0;
constexpr uint8_t major_nint = 1;
constexpr uint8_t major_bytes = 2;
constexpr uint8_t major_array = 4;
constexpr uint8_t major_map = 5;
constexpr uint8_t major_tag = 6;
constexpr uint8_t major_simple = 7;

constexpr uint64_t tag_positive_bignum = 2;
constexpr uint64_t tag_negative_bignum = 3;

amount_t const max_uint64 = amount_t(std::numeric_limits<uint64_t>::max());

data_chunk to_big_endian(amount_t x) {
    data_chunk res;
    while (x > 0) {
        res.insert(res.begin(), static_cast<uint8_t>(static_cast<uint64_t>(x & 0xff)));
        x >>= 8;
    }
    return res;
}

} // namespace

void cbor_writer::write_head(uint8_t major, uint64_t x) {
    auto const prefix = static_cast<uint8_t>(major << 5u);

    if (x < 24) {
        data_.push_back(prefix | static_cast<uint8_t>(x));
        return;
    }

    size_t width;
    if (x <= 0xff) {
        data_.push_back(prefix | 24u);
        width = 1;
    } else if (x <= 0xffff) {
        data_.push_back(prefix | 25u);
        width = 2;
    } else if (x <= 0xffffffff) {
        data_.push_back(prefix | 26u);
        width = 4;
    } else {
        data_.push_back(prefix | 27u);
        width = 8;
    }

    for (size_t i = width; i > 0; --i) {
        data_.push_back(static_cast<uint8_t>((x >> (8 * (i - 1))) & 0xffu));
    }
}

void cbor_writer::write_uint(uint64_t x) {
    write_head(major_uint, x);
}

void cbor_writer::write_nint(uint64_t magnitude_minus_one) {
    write_head(major_nint, magnitude_minus_one);
}

void cbor_writer::write_int(amount_t const& x) {
    if (x >= 0) {
        if (x <= max_uint64) {
            write_uint(static_cast<uint64_t>(x));
            return;
        }
        write_tag(tag_positive_bignum);
        write_bytes(to_big_endian(x));
        return;
    }

    amount_t const magnitude_minus_one = -x - 1;
    if (magnitude_minus_one <= max_uint64) {
        write_nint(static_cast<uint64_t>(magnitude_minus_one));
        return;
    }
    write_tag(tag_negative_bignum);
    write_bytes(to_big_endian(magnitude_minus_one));
}

void cbor_writer::write_bytes(data_chunk const& x) {
    write_bytes(x.data(), x.size());
}

void cbor_writer::write_bytes(uint8_t const* data, size_t size) {
    write_head(major_bytes, size);
    data_.insert(data_.end(), data, data + size);
}

void cbor_writer::write_array_header(size_t size) {
    write_head(major_array, size);
}

void cbor_writer::write_map_header(size_t size) {
    write_head(major_map, size);
}

void cbor_writer::write_tag(uint64_t tag) {
    write_head(major_tag, tag);
}

void cbor_writer::write_bool(bool x) {
    data_.push_back(static_cast<uint8_t>((major_simple << 5u) | (x ? 21u : 20u)));
}

void cbor_writer::write_null() {
    data_.push_back(static_cast<uint8_t>((major_simple << 5u) | 22u));
}

data_chunk const& cbor_writer::data() const {
    return data_;
}

size_t cbor_writer::size() const {
    return data_.size();
}

} // namespace ledgersim::chain
