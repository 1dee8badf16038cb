// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "vesting.hpp"

#include "math.hpp"

namespace custody::ledger {
    namespace {
        constexpr uint64_t precision = 1000000000000000000;
    }

    auto vested_amount(const evmc::uint256be& principal,
                       uint64_t lock_weeks,
                       uint64_t max_weeks)
        -> std::variant<evmc::uint256be, error_code> {
        if(lock_weeks > max_weeks) {
            return error_code::invalid_lock_weeks;
        }
        const auto scale = evmc::uint256be(precision);
        const auto one = evmc::uint256be(1);
        auto ratio = (evmc::uint256be(lock_weeks) + one) * scale
                   / (evmc::uint256be(max_weeks) + one);
        auto root = isqrt(ratio * scale);
        auto scaled = checked_mul(principal, root);
        if(!scaled.has_value()) {
            return error_code::arithmetic_overflow;
        }
        return scaled.value() / scale;
    }

    auto preview_amount(const evmc::uint256be& principal,
                        uint64_t lock_weeks,
                        uint64_t max_weeks) -> evmc::uint256be {
        auto res = vested_amount(principal, lock_weeks, max_weeks);
        if(std::holds_alternative<error_code>(res)) {
            return {};
        }
        return std::get<evmc::uint256be>(res);
    }
}
