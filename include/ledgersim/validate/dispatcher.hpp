// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_VALIDATE_DISPATCHER_HPP
#define LEDGERSIM_VALIDATE_DISPATCHER_HPP

#include <cstddef>
#include <tuple>

#include <ledgersim/chain/transaction.hpp>
#include <ledgersim/error.hpp>
#include <ledgersim/validate/rules.hpp>
#include <ledgersim/validate/validation_result.hpp>

namespace ledgersim::rules {

template <typename T>
struct dispatcher;

/// Runs the rules in tuple order and stops at the first failure.
/// Every rule reports under its own rule_code, a list naming one twice
/// does not compile.
template <typename... Rules>
struct dispatcher<std::tuple<Rules...>> {

    static constexpr
    bool distinct_rule_codes() {
        if constexpr (sizeof...(Rules) < 2) {
            return true;
        } else {
            error::error_code_t const codes[] = {Rules::rule_code...};
            for (size_t i = 0; i < sizeof...(Rules); ++i) {
                for (size_t j = i + 1; j < sizeof...(Rules); ++j) {
                    if (codes[i] == codes[j]) {
                        return false;
                    }
                }
            }
            return true;
        }
    }

    validation_result operator()(chain::transaction const& tx, context const& ctx) const {
        static_assert(distinct_rule_codes(), "repeated rules in rule list");
        validation_result res;
        // && short-circuits, later rules never see a rejected transaction.
        (((res = Rules{}(tx, ctx)).is_valid()) && ...);
        return res;
    }
};

} // namespace ledgersim::rules

#endif
