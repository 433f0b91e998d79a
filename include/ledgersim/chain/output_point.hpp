// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_CHAIN_OUTPUT_POINT_HPP
#define LEDGERSIM_CHAIN_OUTPUT_POINT_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

#include <boost/functional/hash.hpp>

#include <ledgersim/define.hpp>

namespace ledgersim::chain {

/// Reference to a produced output: (origin transaction id, output index).
class LEDGERSIM_API output_point {
public:
    using list = std::vector<output_point>;

    output_point() = default;
    output_point(hash_digest const& hash, uint32_t index);

    hash_digest const& hash() const;
    uint32_t index() const;

    /// "<hash hex>#<index>".
    std::string to_string() const;

    friend
    bool operator==(output_point const& a, output_point const& b) {
        return a.index_ == b.index_ && a.hash_ == b.hash_;
    }

    friend
    bool operator!=(output_point const& a, output_point const& b) {
        return !(a == b);
    }

    friend
    bool operator<(output_point const& a, output_point const& b) {
        return std::tie(a.hash_, a.index_) < std::tie(b.hash_, b.index_);
    }

private:
    hash_digest hash_ {};
    uint32_t index_ = 0;
};

} // namespace ledgersim::chain

// Standard hash.
//-----------------------------------------------------------------------------

namespace std {

template <>
struct hash<ledgersim::chain::output_point> {
    size_t operator()(ledgersim::chain::output_point const& point) const {
        size_t seed = 0;
        boost::hash_combine(seed, boost::hash_range(point.hash().begin(), point.hash().end()));
        boost::hash_combine(seed, point.index());
        return seed;
    }
};

} // namespace std

#endif
