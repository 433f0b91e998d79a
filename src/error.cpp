// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/error.hpp>

namespace ledgersim::error {

namespace {

class error_category_impl : public std::error_category {
public:
    char const* name() const noexcept override {
        return "ledgersim";
    }

    std::string message(int ev) const override {
        switch (static_cast<error_code_t>(ev)) {
            case success:
                return "success";
            case missing_input:
                return "input does not resolve in the ledger";
            case empty_inputs:
                return "transaction has no inputs";
            case empty_outputs:
                return "transaction has no outputs";
            case negative_output_value:
                return "output holds a negative quantity";
            case oversized_transaction:
                return "transaction exceeds the maximum size";
            case insufficient_fee:
                return "fee is below the minimum fee";
            case insufficient_deposit:
                return "output holds less than the minimum deposit";
            case illegal_base_currency_mint:
                return "base currency cannot be minted or burned";
            case value_preservation_violation:
                return "value is not preserved";
            case invalid_time:
                return "time precedes the genesis start time";
            case queue_full:
                return "mempool aggregate size limit reached";
            case duplicate_transaction:
                return "transaction is already in the mempool";
        }
        return "unknown error";
    }
};

} // namespace

std::error_category const& error_category() {
    static error_category_impl const instance;
    return instance;
}

code make_error_code(error_code_t ec) {
    return code(static_cast<int>(ec), error_category());
}

} // namespace ledgersim::error
