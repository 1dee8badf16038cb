// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "reserve_policy.hpp"

#include "math.hpp"

namespace custody::ledger {
    auto validate(const reserve_parameters& params)
        -> std::optional<error_code> {
        const auto full = evmc::uint256be(basis_points);
        if(params.m_min_coefficient < full) {
            return error_code::min_coefficient_too_low;
        }
        if(params.m_max_coefficient < full) {
            return error_code::max_coefficient_too_low;
        }
        if(params.m_max_coefficient < params.m_min_coefficient) {
            return error_code::invalid_coefficient_order;
        }
        return std::nullopt;
    }

    auto sweep_amount(const reserve_parameters& params,
                      const evmc::uint256be& system_balance,
                      const evmc::uint256be& vault_balance)
        -> std::variant<evmc::uint256be, error_code> {
        const auto full = evmc::uint256be(basis_points);
        auto upper = checked_mul(system_balance, params.m_max_coefficient);
        if(!upper.has_value()) {
            return error_code::arithmetic_overflow;
        }
        auto upper_bound = upper.value() / full;
        if(!(upper_bound < vault_balance)) {
            return evmc::uint256be{};
        }

        auto lower = checked_mul(system_balance, params.m_min_coefficient);
        auto floor = checked_add(system_balance, params.m_absolute_min);
        if(!lower.has_value() || !floor.has_value()) {
            return error_code::arithmetic_overflow;
        }
        auto target = max(lower.value() / full, floor.value());
        if(!(target < vault_balance)) {
            return evmc::uint256be{};
        }
        return vault_balance - target;
    }
}
