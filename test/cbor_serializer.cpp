// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <test_helpers.hpp>

#include <limits>

using namespace ledgersim;
using namespace ledgersim::chain;
using namespace ledgersim::test;

// Start Test Suite: cbor serializer tests

static
data_chunk const short_address {0x01, 0x02};

static
transaction make_tx(uint64_t fee) {
    return transaction{{point(1)}, {output{short_address, value(1)}}, fee};
}

// cbor_writer

TEST_CASE("cbor writer  write uint  widths  shortest head", "[cbor serializer tests]") {
    cbor_writer sink;
    sink.write_uint(23);
    sink.write_uint(24);
    sink.write_uint(256);
    sink.write_uint(65536);
    sink.write_uint(4294967296ull);
    REQUIRE(sink.data() == data_chunk{
        0x17,
        0x18, 0x18,
        0x19, 0x01, 0x00,
        0x1a, 0x00, 0x01, 0x00, 0x00,
        0x1b, 0x00, 0x00, 0x00, 0x01, 0x00, 0x00, 0x00, 0x00});
}

TEST_CASE("cbor writer  write int  negative  major type one", "[cbor serializer tests]") {
    cbor_writer sink;
    sink.write_int(-1);
    sink.write_int(-500);
    REQUIRE(sink.data() == data_chunk{0x20, 0x39, 0x01, 0xf3});
}

TEST_CASE("cbor writer  write int  beyond 64 bits  bignum tag", "[cbor serializer tests]") {
    cbor_writer sink;
    amount_t const x = amount_t(std::numeric_limits<uint64_t>::max()) + 1;
    sink.write_int(x);
    REQUIRE(sink.data() == data_chunk{0xc2, 0x49, 0x01, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00, 0x00});
}

// outputs

TEST_CASE("cbor serializer  to data  base only output  map of two", "[cbor serializer tests]") {
    output const instance(short_address, value(1));
    REQUIRE(cbor_serializer::to_data(instance) == data_chunk{0xa2, 0x00, 0x42, 0x01, 0x02, 0x01, 0x01});
    REQUIRE(cbor_serializer{}.serialized_size(instance) == 7u);
}

TEST_CASE("cbor serializer  to data  output with asset  value pair", "[cbor serializer tests]") {
    value x(1);
    x.add(asset_id{data_chunk{0xaa}, data_chunk{0x41}}, 5);
    output const instance(short_address, x);
    REQUIRE(cbor_serializer::to_data(instance) == data_chunk{
        0xa2, 0x00, 0x42, 0x01, 0x02,
        0x01, 0x82, 0x01, 0xa1, 0x41, 0xaa, 0xa1, 0x41, 0x41, 0x05});
}

TEST_CASE("cbor serializer  to data  output with inline datum  tagged bytes", "[cbor serializer tests]") {
    output const instance(short_address, value(1), data_chunk{0x00});
    REQUIRE(cbor_serializer::to_data(instance) == data_chunk{
        0xa3, 0x00, 0x42, 0x01, 0x02, 0x01, 0x01,
        0x02, 0x82, 0x01, 0xd8, 0x18, 0x41, 0x00});
}

TEST_CASE("cbor serializer  serialized size  datum and script  additive", "[cbor serializer tests]") {
    cbor_serializer const instance;
    output const plain(short_address, value(1));
    output const with_datum(short_address, value(1), data_chunk(10, 0x00));
    output const with_both(short_address, value(1), data_chunk(10, 0x00), data_chunk(10, 0x00));
    REQUIRE(instance.serialized_size(with_datum) > instance.serialized_size(plain));
    REQUIRE(instance.serialized_size(with_both) > instance.serialized_size(with_datum));
}

// transactions

TEST_CASE("cbor serializer  body data  simple transaction  expected bytes", "[cbor serializer tests]") {
    data_chunk expected {0xa3, 0x00, 0x81, 0x82, 0x58, 0x20};
    auto const hash = hash_of(1);
    expected.insert(expected.end(), hash.begin(), hash.end());
    expected.insert(expected.end(), {0x00, 0x01, 0x81, 0xa2, 0x00, 0x42, 0x01, 0x02, 0x01, 0x01, 0x02, 0x00});
    REQUIRE(cbor_serializer::body_data(make_tx(0)) == expected);
}

TEST_CASE("cbor serializer  serialized size  full transaction  body plus four bytes", "[cbor serializer tests]") {
    auto const tx = make_tx(0);
    REQUIRE(cbor_serializer{}.serialized_size(tx) == cbor_serializer::body_data(tx).size() + 4u);
    REQUIRE(cbor_serializer::to_data(tx).size() == 54u);
}

TEST_CASE("cbor serializer  hash  simple transaction  sha256 of body", "[cbor serializer tests]") {
    auto const id = cbor_serializer{}.hash(make_tx(0));
    REQUIRE(encode_hash(id) == "8f99ca407e5e0601a769845ca486961c9d842bcac666c40b61b6bd77f5d24ac5");
}

TEST_CASE("cbor serializer  hash  different fee  different id", "[cbor serializer tests]") {
    cbor_serializer const instance;
    REQUIRE(instance.hash(make_tx(1)) != instance.hash(make_tx(2)));
    REQUIRE(instance.hash(make_tx(1)) == instance.hash(make_tx(1)));
}

TEST_CASE("cbor serializer  serialized size  extra output  grows", "[cbor serializer tests]") {
    cbor_serializer const instance;
    auto const one = make_tx(0);
    transaction const two{{point(1)}, {output{short_address, value(1)}, output{short_address, value(1)}}, 0};
    REQUIRE(instance.serialized_size(two) > instance.serialized_size(one));
}

TEST_CASE("cbor serializer  body data  mint  adds mint key", "[cbor serializer tests]") {
    value mint;
    mint.add(token("a"), 1000);
    transaction const minting{{point(1)}, {output{short_address, value(1)}}, 0, mint};
    auto const body = cbor_serializer::body_data(minting);
    REQUIRE(body.front() == 0xa4);
    REQUIRE(body.size() > cbor_serializer::body_data(make_tx(0)).size());
}

// inputs

TEST_CASE("transaction  construct  repeated inputs  sorted set", "[cbor serializer tests]") {
    transaction const tx{{point(2), point(1), point(2)}, {output{short_address, value(1)}}, 0};
    REQUIRE(tx.inputs().size() == 2u);
    REQUIRE(tx.inputs()[0] == point(1));
    REQUIRE(tx.inputs()[1] == point(2));
}

TEST_CASE("cbor serializer  encode base16  mixed bytes  lowercase pairs", "[cbor serializer tests]") {
    REQUIRE(encode_base16(data_chunk{}).empty());
    REQUIRE(encode_base16(data_chunk{0x00, 0xab, 0x0f, 0xf0}) == "00ab0ff0");
}
