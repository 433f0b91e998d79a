// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_CHAIN_VALUE_HPP
#define LEDGERSIM_CHAIN_VALUE_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

#include <ledgersim/chain/asset_id.hpp>
#include <ledgersim/define.hpp>

namespace ledgersim::chain {

/// Multi-asset quantity: a base-currency quantity that is always present
/// (possibly zero) plus a sparse map of native assets. Zero entries are
/// pruned on every write, so equality and emptiness are structural.
/// This class is not thread safe.
class LEDGERSIM_API value {
public:
    using asset_map = std::map<asset_id, amount_t>;
    using list = std::vector<value>;

    value() = default;

    explicit
    value(amount_t base_quantity);

    value(amount_t base_quantity, asset_map assets);

    static
    value lovelaces(amount_t quantity);

    // Properties.
    //-------------------------------------------------------------------------

    amount_t const& base_currency_quantity() const;

    /// Zero when the asset is absent.
    amount_t quantity(asset_id const& id) const;

    /// Native assets only, never holds zero entries.
    asset_map const& assets() const;

    bool has_assets() const;
    size_t policy_count() const;

    /// Every asset id with a non-zero entry, base currency first (always
    /// present), then ascending policy id and asset name.
    std::vector<asset_id> asset_ids() const;

    bool is_zero() const;

    /// True when no entry (base currency included) is negative.
    bool is_non_negative() const;

    /// Byte length of the value encoding, used for size estimation.
    size_t serialized_size() const;

    std::string to_string() const;

    // Commands.
    //-------------------------------------------------------------------------

    void set(asset_id const& id, amount_t quantity);
    void add(asset_id const& id, amount_t quantity);

    value& operator+=(value const& x);
    value& operator-=(value const& x);

    // Algebra.
    //-------------------------------------------------------------------------

    value scale(amount_t k) const;

    /// Entries with positive quantities (minted part of a mint field).
    value positive_part() const;

    /// Magnitudes of entries with negative quantities (burned part).
    value negative_part() const;

    friend
    bool operator==(value const& a, value const& b) {
        return a.base_quantity_ == b.base_quantity_ && a.assets_ == b.assets_;
    }

    friend
    bool operator!=(value const& a, value const& b) {
        return !(a == b);
    }

private:
    amount_t base_quantity_ = 0;
    asset_map assets_;
};

LEDGERSIM_API value add(value const& a, value const& b);
LEDGERSIM_API value scale(value const& a, amount_t k);
LEDGERSIM_API value operator+(value const& a, value const& b);
LEDGERSIM_API value operator-(value const& a, value const& b);
LEDGERSIM_API value operator-(value const& a);

} // namespace ledgersim::chain

#endif
