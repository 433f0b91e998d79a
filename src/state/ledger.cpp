// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/state/ledger.hpp>

#include <algorithm>
#include <stdexcept>
#include <utility>

#include <boost/thread/locks.hpp>
#include <spdlog/spdlog.h>

namespace ledgersim {

using chain::output;
using chain::output_point;
using chain::transaction;
using chain::utxo;

// snapshot_view
//-----------------------------------------------------------------------------

ledger::snapshot_view::snapshot_view(utxo_map_const_ptr utxos)
    : utxos_(std::move(utxos))
{}

bool ledger::snapshot_view::get_utxo(output& out_output, output_point const& point) const {
    auto const it = utxos_->find(point);
    if (it == utxos_->end()) {
        return false;
    }

    out_output = it->second;
    return true;
}

ledger::utxo_map const& ledger::snapshot_view::utxos() const {
    return *utxos_;
}

size_t ledger::snapshot_view::size() const {
    return utxos_->size();
}

// ledger
//-----------------------------------------------------------------------------

ledger::ledger()
    : utxos_(std::make_shared<utxo_map>())
{}

ledger::ledger(utxo::list const& initial)
    : utxos_(std::make_shared<utxo_map>())
{
    utxos_->reserve(initial.size());
    for (auto const& x : initial) {
        auto const inserted = utxos_->emplace(x.point(), x.output()).second;
        if ( ! inserted) {
            spdlog::error("[{}] Duplicated initial utxo {}.", LOG_LEDGERSIM, x.point().to_string());
            throw std::invalid_argument("duplicated initial utxo " + x.point().to_string());
        }
    }
}

// Queries.
// ---------------------------------------------------------------------------------

bool ledger::get_utxo(output& out_output, output_point const& point) const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    auto const it = utxos_->find(point);
    if (it == utxos_->end()) {
        return false;
    }

    out_output = it->second;
    return true;
}

std::optional<utxo> ledger::resolve(output_point const& point) const {
    output out;
    if ( ! get_utxo(out, point)) {
        return std::nullopt;
    }
    return utxo{point, std::move(out)};
}

ledger::snapshot_view ledger::snapshot() const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return snapshot_view{utxos_};
}

// private
template <typename Predicate>
utxo::list ledger::collect(Predicate const& pred) const {
    // Copy under the lock, sort outside of it.
    auto const view = snapshot();

    utxo::list res;
    for (auto const& x : view.utxos()) {
        if (pred(x.second)) {
            res.emplace_back(x.first, x.second);
        }
    }

    std::sort(res.begin(), res.end(), [](utxo const& a, utxo const& b) {
        return a.point() < b.point();
    });
    return res;
}

utxo::list ledger::get_utxos() const {
    return collect([](output const&) { return true; });
}

utxo::list ledger::get_utxos_at(data_chunk const& address) const {
    return collect([&address](output const& out) {
        return out.address() == address;
    });
}

size_t ledger::size() const {
    boost::shared_lock<boost::shared_mutex> lock(mutex_);
    return utxos_->size();
}

// Commands.
// ---------------------------------------------------------------------------------

void ledger::apply(transaction const& tx, hash_digest const& id) {
    boost::unique_lock<boost::shared_mutex> lock(mutex_);

    for (auto const& point : tx.inputs()) {
        if (utxos_->find(point) == utxos_->end()) {
            spdlog::error("[{}] Applying transaction {} with unresolved input {}.", LOG_LEDGERSIM, encode_hash(id), point.to_string());
            throw std::logic_error("apply of an unvalidated transaction, missing input " + point.to_string());
        }
    }

    auto const& inputs = tx.inputs();
    for (uint32_t index = 0; index < tx.outputs().size(); ++index) {
        output_point const produced{id, index};
        auto const consumed = std::find(inputs.begin(), inputs.end(), produced) != inputs.end();
        if ( ! consumed && utxos_->find(produced) != utxos_->end()) {
            spdlog::error("[{}] Applying transaction {} would replace unspent output {}.", LOG_LEDGERSIM, encode_hash(id), produced.to_string());
            throw std::logic_error("apply of a transaction whose id collides with unspent output " + produced.to_string());
        }
    }

    // Snapshots keep the old map alive, mutate a private copy instead.
    // No snapshot can be taken while the unique lock is held.
    if (utxos_.use_count() > 1) {
        utxos_ = std::make_shared<utxo_map>(*utxos_);
    }

    for (auto const& point : tx.inputs()) {
        utxos_->erase(point);
    }

    uint32_t index = 0;
    for (auto const& out : tx.outputs()) {
        utxos_->emplace(output_point{id, index}, out);
        ++index;
    }
}

} // namespace ledgersim
