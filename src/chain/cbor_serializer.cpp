// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/chain/cbor_serializer.hpp>

#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace ledgersim::chain {

namespace {

constexpr uint64_t body_inputs = 0;
constexpr uint64_t body_outputs = 1;
constexpr uint64_t body_fee = 2;
constexpr uint64_t body_mint = 9;

constexpr uint64_t output_address = 0;
constexpr uint64_t output_value = 1;
constexpr uint64_t output_datum = 2;
constexpr uint64_t output_script_ref = 3;

constexpr uint64_t datum_option_inline = 1;
constexpr uint64_t tag_encoded_cbor = 24;

} // namespace

// serializer interface.
//-----------------------------------------------------------------------------

size_t cbor_serializer::serialized_size(transaction const& tx) const {
    cbor_writer sink;
    write(sink, tx);
    return sink.size();
}

size_t cbor_serializer::serialized_size(output const& out) const {
    cbor_writer sink;
    write(sink, out);
    return sink.size();
}

hash_digest cbor_serializer::hash(transaction const& tx) const {
    auto const body = body_data(tx);

    hash_digest res;
    unsigned int length = 0;
    if (EVP_Digest(body.data(), body.size(), res.data(), &length, EVP_sha256(), nullptr) != 1 || length != hash_size) {
        throw std::runtime_error("sha256 digest failed");
    }
    return res;
}

// Encoders.
//-----------------------------------------------------------------------------

size_t cbor_serializer::serialized_size(value const& x) {
    cbor_writer sink;
    write(sink, x);
    return sink.size();
}

data_chunk cbor_serializer::to_data(transaction const& tx) {
    cbor_writer sink;
    write(sink, tx);
    return sink.data();
}

data_chunk cbor_serializer::body_data(transaction const& tx) {
    cbor_writer sink;
    write_body(sink, tx);
    return sink.data();
}

data_chunk cbor_serializer::to_data(output const& out) {
    cbor_writer sink;
    write(sink, out);
    return sink.data();
}

void cbor_serializer::write(cbor_writer& sink, transaction const& tx) {
    sink.write_array_header(4);
    write_body(sink, tx);
    sink.write_map_header(0);       // witnesses are out of scope
    sink.write_bool(true);
    sink.write_null();
}

void cbor_serializer::write_body(cbor_writer& sink, transaction const& tx) {
    auto const mint = tx.has_mint();
    sink.write_map_header(mint ? 4 : 3);

    sink.write_uint(body_inputs);
    sink.write_array_header(tx.inputs().size());
    for (auto const& point : tx.inputs()) {
        sink.write_array_header(2);
        sink.write_bytes(point.hash().data(), point.hash().size());
        sink.write_uint(point.index());
    }

    sink.write_uint(body_outputs);
    sink.write_array_header(tx.outputs().size());
    for (auto const& out : tx.outputs()) {
        write(sink, out);
    }

    sink.write_uint(body_fee);
    sink.write_uint(tx.fee());

    if (mint) {
        sink.write_uint(body_mint);
        // A base currency entry cannot be expressed in a real mint field,
        // it is kept so that such transactions stay measurable.
        if (tx.mint().base_currency_quantity() != 0) {
            write(sink, tx.mint());
        } else {
            write_multi_asset(sink, tx.mint());
        }
    }
}

void cbor_serializer::write(cbor_writer& sink, output const& out) {
    size_t fields = 2;
    if (out.datum()) ++fields;
    if (out.script_ref()) ++fields;

    sink.write_map_header(fields);

    sink.write_uint(output_address);
    sink.write_bytes(out.address());

    sink.write_uint(output_value);
    write(sink, out.value());

    if (out.datum()) {
        sink.write_uint(output_datum);
        sink.write_array_header(2);
        sink.write_uint(datum_option_inline);
        sink.write_tag(tag_encoded_cbor);
        sink.write_bytes(*out.datum());
    }

    if (out.script_ref()) {
        sink.write_uint(output_script_ref);
        sink.write_tag(tag_encoded_cbor);
        sink.write_bytes(*out.script_ref());
    }
}

void cbor_serializer::write(cbor_writer& sink, value const& x) {
    if ( ! x.has_assets()) {
        sink.write_int(x.base_currency_quantity());
        return;
    }

    sink.write_array_header(2);
    sink.write_int(x.base_currency_quantity());
    write_multi_asset(sink, x);
}

// private
void cbor_serializer::write_multi_asset(cbor_writer& sink, value const& x) {
    auto const& assets = x.assets();
    sink.write_map_header(x.policy_count());

    auto it = assets.begin();
    while (it != assets.end()) {
        auto const& policy = it->first.policy_id();

        auto last = it;
        size_t names = 0;
        while (last != assets.end() && last->first.policy_id() == policy) {
            ++names;
            ++last;
        }

        sink.write_bytes(policy);
        sink.write_map_header(names);
        for (; it != last; ++it) {
            sink.write_bytes(it->first.asset_name());
            sink.write_int(it->second);
        }
    }
}

} // namespace ledgersim::chain
