// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_CHAIN_ASSET_ID_HPP
#define LEDGERSIM_CHAIN_ASSET_ID_HPP

#include <string>

#include <ledgersim/define.hpp>

namespace ledgersim::chain {

/// Identifies a quantity kind: either the base currency (lovelace) or a
/// (policy id, asset name) pair. The base currency has an empty policy id
/// and therefore orders before every native asset.
class LEDGERSIM_API asset_id {
public:
    /// The base currency.
    asset_id() = default;

    /// A native asset, policy_id must be non-empty.
    asset_id(data_chunk policy_id, data_chunk asset_name);

    static
    asset_id base_currency();

    bool is_base_currency() const;

    data_chunk const& policy_id() const;
    data_chunk const& asset_name() const;

    /// "lovelace" or "<policy hex>.<name hex>".
    std::string to_string() const;

    friend
    bool operator==(asset_id const& a, asset_id const& b) {
        return a.policy_id_ == b.policy_id_ && a.asset_name_ == b.asset_name_;
    }

    friend
    bool operator!=(asset_id const& a, asset_id const& b) {
        return !(a == b);
    }

    // Base currency first, then ascending policy id, then asset name.
    friend
    bool operator<(asset_id const& a, asset_id const& b) {
        if (a.policy_id_ != b.policy_id_) {
            return a.policy_id_ < b.policy_id_;
        }
        return a.asset_name_ < b.asset_name_;
    }

private:
    data_chunk policy_id_;
    data_chunk asset_name_;
};

} // namespace ledgersim::chain

template <>
struct fmt::formatter<ledgersim::chain::asset_id> : fmt::formatter<std::string> {
    template <typename FormatContext>
    auto format(ledgersim::chain::asset_id const& id, FormatContext& ctx) const {
        return fmt::formatter<std::string>::format(id.to_string(), ctx);
    }
};

#endif
