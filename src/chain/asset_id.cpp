// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/chain/asset_id.hpp>

#include <stdexcept>
#include <utility>

namespace ledgersim::chain {

asset_id::asset_id(data_chunk policy_id, data_chunk asset_name)
    : policy_id_(std::move(policy_id))
    , asset_name_(std::move(asset_name))
{
    if (policy_id_.empty()) {
        throw std::invalid_argument("native asset requires a policy id");
    }
}

asset_id asset_id::base_currency() {
    return asset_id{};
}

bool asset_id::is_base_currency() const {
    return policy_id_.empty();
}

data_chunk const& asset_id::policy_id() const {
    return policy_id_;
}

data_chunk const& asset_id::asset_name() const {
    return asset_name_;
}

std::string asset_id::to_string() const {
    if (is_base_currency()) {
        return "lovelace";
    }
    return encode_base16(policy_id_) + "." + encode_base16(asset_name_);
}

} // namespace ledgersim::chain
