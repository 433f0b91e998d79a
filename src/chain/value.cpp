// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/chain/value.hpp>

#include <algorithm>
#include <utility>

#include <ledgersim/chain/cbor_serializer.hpp>

namespace ledgersim::chain {

value::value(amount_t base_quantity)
    : base_quantity_(std::move(base_quantity))
{}

value::value(amount_t base_quantity, asset_map assets)
    : base_quantity_(std::move(base_quantity))
{
    for (auto& entry : assets) {
        add(entry.first, std::move(entry.second));
    }
}

value value::lovelaces(amount_t quantity) {
    return value(std::move(quantity));
}

// Properties.
//-----------------------------------------------------------------------------

amount_t const& value::base_currency_quantity() const {
    return base_quantity_;
}

amount_t value::quantity(asset_id const& id) const {
    if (id.is_base_currency()) {
        return base_quantity_;
    }

    auto const it = assets_.find(id);
    return it == assets_.end() ? amount_t(0) : it->second;
}

value::asset_map const& value::assets() const {
    return assets_;
}

bool value::has_assets() const {
    return ! assets_.empty();
}

size_t value::policy_count() const {
    size_t count = 0;
    data_chunk const* last = nullptr;
    for (auto const& entry : assets_) {
        if (last == nullptr || *last != entry.first.policy_id()) {
            ++count;
            last = &entry.first.policy_id();
        }
    }
    return count;
}

std::vector<asset_id> value::asset_ids() const {
    std::vector<asset_id> res;
    res.reserve(assets_.size() + 1);
    res.push_back(asset_id::base_currency());
    for (auto const& entry : assets_) {
        res.push_back(entry.first);
    }
    return res;
}

bool value::is_zero() const {
    return base_quantity_ == 0 && assets_.empty();
}

bool value::is_non_negative() const {
    if (base_quantity_ < 0) {
        return false;
    }
    return std::all_of(assets_.begin(), assets_.end(), [](auto const& entry) {
        return entry.second >= 0;
    });
}

size_t value::serialized_size() const {
    return cbor_serializer::serialized_size(*this);
}

std::string value::to_string() const {
    auto res = fmt::format("{{lovelace: {}", base_quantity_);
    for (auto const& entry : assets_) {
        res += fmt::format(", {}: {}", entry.first, entry.second);
    }
    res += "}";
    return res;
}

// Commands.
//-----------------------------------------------------------------------------

void value::set(asset_id const& id, amount_t quantity) {
    if (id.is_base_currency()) {
        base_quantity_ = std::move(quantity);
        return;
    }

    if (quantity == 0) {
        assets_.erase(id);
        return;
    }

    assets_[id] = std::move(quantity);
}

void value::add(asset_id const& id, amount_t quantity) {
    if (id.is_base_currency()) {
        base_quantity_ += quantity;
        return;
    }

    if (quantity == 0) {
        return;
    }

    auto it = assets_.find(id);
    if (it == assets_.end()) {
        assets_.emplace(id, std::move(quantity));
        return;
    }

    it->second += quantity;
    if (it->second == 0) {
        assets_.erase(it);
    }
}

value& value::operator+=(value const& x) {
    base_quantity_ += x.base_quantity_;
    for (auto const& entry : x.assets_) {
        add(entry.first, entry.second);
    }
    return *this;
}

value& value::operator-=(value const& x) {
    base_quantity_ -= x.base_quantity_;
    for (auto const& entry : x.assets_) {
        add(entry.first, -entry.second);
    }
    return *this;
}

// Algebra.
//-----------------------------------------------------------------------------

value value::scale(amount_t k) const {
    if (k == 0) {
        return value{};
    }

    value res(base_quantity_ * k);
    for (auto const& entry : assets_) {
        res.assets_.emplace(entry.first, entry.second * k);
    }
    return res;
}

value value::positive_part() const {
    value res(base_quantity_ > 0 ? base_quantity_ : amount_t(0));
    for (auto const& entry : assets_) {
        if (entry.second > 0) {
            res.assets_.emplace(entry.first, entry.second);
        }
    }
    return res;
}

value value::negative_part() const {
    value res(base_quantity_ < 0 ? amount_t(-base_quantity_) : amount_t(0));
    for (auto const& entry : assets_) {
        if (entry.second < 0) {
            res.assets_.emplace(entry.first, -entry.second);
        }
    }
    return res;
}

value add(value const& a, value const& b) {
    value res = a;
    res += b;
    return res;
}

value scale(value const& a, amount_t k) {
    return a.scale(std::move(k));
}

value operator+(value const& a, value const& b) {
    return add(a, b);
}

value operator-(value const& a, value const& b) {
    value res = a;
    res -= b;
    return res;
}

value operator-(value const& a) {
    return a.scale(-1);
}

} // namespace ledgersim::chain
