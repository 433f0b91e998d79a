// Copyright (c) 2016-2024 Knuth Project developers.
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include <ledgersim/validate/validation_result.hpp>

#include <stdexcept>
#include <utility>

#include <fmt/format.h>

namespace ledgersim {

namespace {

struct code_of {
    code operator()(missing_input const&) const { return error::missing_input; }
    code operator()(malformed_transaction const& x) const { return x.reason; }
    code operator()(negative_output_value const&) const { return error::negative_output_value; }
    code operator()(oversized_transaction const&) const { return error::oversized_transaction; }
    code operator()(insufficient_fee const&) const { return error::insufficient_fee; }
    code operator()(insufficient_deposit const&) const { return error::insufficient_deposit; }
    code operator()(illegal_base_currency_mint const&) const { return error::illegal_base_currency_mint; }
    code operator()(value_preservation_violation const&) const { return error::value_preservation_violation; }
    code operator()(queue_full const&) const { return error::queue_full; }
    code operator()(duplicate_transaction const&) const { return error::duplicate_transaction; }
};

std::string imbalance_message(asset_imbalance const& x) {
    if (x.kind == imbalance_kind::destroyed) {
        return fmt::format("destroying {} {}", x.difference, x.asset);
    }
    return fmt::format("creating {} {} from nothing", x.difference, x.asset);
}

struct message_of {
    std::string operator()(missing_input const& x) const {
        std::string res = "missing inputs:";
        for (auto const& point : x.unresolved) {
            res += " " + point.to_string();
        }
        return res;
    }

    std::string operator()(malformed_transaction const& x) const {
        return make_error_code(x.reason).message();
    }

    std::string operator()(negative_output_value const& x) const {
        return fmt::format("output {} holds a negative quantity {} of {}", x.output_index, x.quantity, x.asset);
    }

    std::string operator()(oversized_transaction const& x) const {
        return fmt::format("transaction size {} exceeds the limit {}", x.actual, x.limit);
    }

    std::string operator()(insufficient_fee const& x) const {
        return fmt::format("insufficient fee: required {}, actual {}", x.required, x.actual);
    }

    std::string operator()(insufficient_deposit const& x) const {
        return fmt::format("output {} below minimum deposit: required {}, actual {}", x.output_index, x.required, x.actual);
    }

    std::string operator()(illegal_base_currency_mint const& x) const {
        return fmt::format("cannot mint or burn lovelace: mint {}, burn {}", x.attempted_mint, x.attempted_burn);
    }

    std::string operator()(value_preservation_violation const& x) const {
        std::string res = "value not preserved:";
        auto first = true;
        for (auto const& imbalance : x.imbalances) {
            res += first ? " " : ", ";
            res += imbalance_message(imbalance);
            first = false;
        }
        return res;
    }

    std::string operator()(queue_full const& x) const {
        return fmt::format("mempool full: required {} bytes, available {}", x.required, x.available);
    }

    std::string operator()(duplicate_transaction const& x) const {
        return fmt::format("transaction {} already queued", encode_hash(x.id));
    }
};

} // namespace

validation_result::validation_result(detail_t detail)
    : detail_(std::move(detail))
{}

bool validation_result::is_valid() const {
    return ! detail_.has_value();
}

code validation_result::error_code() const {
    if ( ! detail_) {
        return error::success;
    }
    return std::visit(code_of{}, *detail_);
}

validation_result::detail_t const& validation_result::detail() const {
    if ( ! detail_) {
        throw std::logic_error("valid result has no rejection detail");
    }
    return *detail_;
}

std::string validation_result::message() const {
    if ( ! detail_) {
        return {};
    }
    return std::visit(message_of{}, *detail_);
}

} // namespace ledgersim
