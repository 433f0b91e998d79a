// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_STATE_LEDGER_HPP
#define LEDGERSIM_STATE_LEDGER_HPP

#include <cstddef>
#include <memory>
#include <optional>
#include <unordered_map>

#include <boost/thread/shared_mutex.hpp>

#include <ledgersim/chain/output.hpp>
#include <ledgersim/chain/output_point.hpp>
#include <ledgersim/chain/transaction.hpp>
#include <ledgersim/chain/utxo.hpp>
#include <ledgersim/define.hpp>
#include <ledgersim/interface/utxo_view.hpp>

namespace ledgersim {

/// The authoritative UTXO set. Single writer (apply), any number of readers.
/// The map is shared copy-on-write with the snapshots taken from it, so a
/// snapshot never observes a partially applied transaction.
/// This class is thread safe.
class LEDGERSIM_API ledger : public utxo_view {
public:
    using utxo_map = std::unordered_map<chain::output_point, chain::output>;
    using utxo_map_const_ptr = std::shared_ptr<utxo_map const>;

    /// Immutable view of the UTXO set at the time it was taken.
    class LEDGERSIM_API snapshot_view : public utxo_view {
    public:
        explicit
        snapshot_view(utxo_map_const_ptr utxos);

        bool get_utxo(chain::output& out_output, chain::output_point const& point) const override;

        utxo_map const& utxos() const;
        size_t size() const;

    private:
        utxo_map_const_ptr utxos_;
    };

    ledger();

    /// Throws std::invalid_argument if two utxos share a point.
    explicit
    ledger(chain::utxo::list const& initial);

    // non-copyable and non-movable class
    ledger(ledger const&) = delete;
    ledger operator=(ledger const&) = delete;

    // Queries.
    // ---------------------------------------------------------------------------------
    bool get_utxo(chain::output& out_output, chain::output_point const& point) const override;
    std::optional<chain::utxo> resolve(chain::output_point const& point) const;
    snapshot_view snapshot() const;

    /// Every unspent output, ordered by point.
    chain::utxo::list get_utxos() const;

    /// Unspent outputs owned by the address, ordered by point.
    chain::utxo::list get_utxos_at(data_chunk const& address) const;

    size_t size() const;

    // Commands.
    // ---------------------------------------------------------------------------------

    /// Precondition: tx was validated against the current state.
    /// Removes every consumed output and inserts the produced ones at
    /// (id, index) in one step. Throws std::logic_error, leaving the set
    /// untouched, when an input does not resolve.
    void apply(chain::transaction const& tx, hash_digest const& id);

private:
    template <typename Predicate>
    chain::utxo::list collect(Predicate const& pred) const;

    std::shared_ptr<utxo_map> utxos_;

    // Synchronization
    mutable boost::shared_mutex mutex_;
};

} // namespace ledgersim

#endif
