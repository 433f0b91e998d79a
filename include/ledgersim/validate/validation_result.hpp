// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef LEDGERSIM_VALIDATE_VALIDATION_RESULT_HPP
#define LEDGERSIM_VALIDATE_VALIDATION_RESULT_HPP

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <ledgersim/chain/asset_id.hpp>
#include <ledgersim/chain/output_point.hpp>
#include <ledgersim/define.hpp>
#include <ledgersim/error.hpp>

namespace ledgersim {

// Rejection details. Each one carries the exact quantities compared.
//-----------------------------------------------------------------------------

struct missing_input {
    chain::output_point::list unresolved;
};

/// No inputs (error::empty_inputs) or no outputs (error::empty_outputs).
struct malformed_transaction {
    error::error_code_t reason;
};

struct negative_output_value {
    size_t output_index;
    chain::asset_id asset;
    amount_t quantity;
};

struct oversized_transaction {
    size_t actual;
    size_t limit;
};

struct insufficient_fee {
    uint64_t required;
    uint64_t actual;
};

struct insufficient_deposit {
    size_t output_index;
    amount_t required;
    amount_t actual;
};

/// Magnitudes of the positive and negative base currency mint entry.
struct illegal_base_currency_mint {
    amount_t attempted_mint;
    amount_t attempted_burn;
};

enum class imbalance_kind {
    created_from_nothing,       // outputs + fee exceed inputs + minted
    destroyed                   // inputs + minted exceed outputs + fee
};

/// expected = input + minted, actual = output + fee, difference = |actual - expected|.
struct asset_imbalance {
    chain::asset_id asset;
    amount_t input;
    amount_t output;
    amount_t minted;            // signed, negative when burned
    amount_t fee;
    amount_t expected;
    amount_t actual;
    amount_t difference;
    imbalance_kind kind;
};

/// Every unbalanced asset, base currency first then ascending asset id.
struct value_preservation_violation {
    std::vector<asset_imbalance> imbalances;
};

struct queue_full {
    size_t required;
    size_t available;
};

struct duplicate_transaction {
    hash_digest id;
};

/// Closed outcome of validation and admission: valid, or exactly one
/// rejection detail. This class is not thread safe.
class LEDGERSIM_API validation_result {
public:
    using detail_t = std::variant<
        missing_input,
        malformed_transaction,
        negative_output_value,
        oversized_transaction,
        insufficient_fee,
        insufficient_deposit,
        illegal_base_currency_mint,
        value_preservation_violation,
        queue_full,
        duplicate_transaction
    >;

    /// Valid.
    validation_result() = default;

    /// Invalid, with the detail of the failed rule.
    explicit
    validation_result(detail_t detail);

    bool is_valid() const;

    /// error::success when valid.
    code error_code() const;

    /// Precondition: ! is_valid().
    detail_t const& detail() const;

    /// nullptr when valid or when the detail is of another kind.
    template <typename T>
    T const* get_if() const {
        return detail_ ? std::get_if<T>(&*detail_) : nullptr;
    }

    /// Diagnostic with the literal quantities, empty when valid.
    std::string message() const;

private:
    std::optional<detail_t> detail_;
};

} // namespace ledgersim

#endif
