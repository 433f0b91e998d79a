// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_ERROR_HPP_
#define LEDGERSIM_ERROR_HPP_

#include <string>
#include <system_error>

#include <ledgersim/define.hpp>

namespace ledgersim {

using code = std::error_code;

namespace error {

// The numeric values of these codes may change without notice.
enum error_code_t {
    success = 0,

    // structural rule
    missing_input = 1,
    empty_inputs = 2,
    empty_outputs = 3,
    negative_output_value = 4,

    // size and fee rules
    oversized_transaction = 5,
    insufficient_fee = 6,

    // minimum deposit rule
    insufficient_deposit = 7,

    // value preservation rule
    illegal_base_currency_mint = 8,
    value_preservation_violation = 9,

    // clock
    invalid_time = 64,

    // mempool admission
    queue_full = 128,
    duplicate_transaction
};

LEDGERSIM_API std::error_category const& error_category();
LEDGERSIM_API code make_error_code(error_code_t ec);

} // namespace error
} // namespace ledgersim

namespace std {

template <>
struct is_error_code_enum<ledgersim::error::error_code_t>
    : public true_type
{};

} // namespace std

#endif //LEDGERSIM_ERROR_HPP_
