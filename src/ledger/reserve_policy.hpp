// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_RESERVE_POLICY_H_
#define CUSTODY_SRC_LEDGER_RESERVE_POLICY_H_

#include "messages.hpp"

#include <optional>
#include <variant>

namespace custody::ledger {
    /// Basis points representing 100%.
    static constexpr uint64_t basis_points = 10000;
    static constexpr uint64_t default_min_coefficient = 11000;
    static constexpr uint64_t default_max_coefficient = 12000;

    /// Reserve band of one asset, relative to the system balance reported
    /// in deposit vouchers.
    struct reserve_parameters {
        /// Reserve kept after a sweep, in basis points.
        evmc::uint256be m_min_coefficient{default_min_coefficient};
        /// Balance above which a sweep is triggered, in basis points.
        evmc::uint256be m_max_coefficient{default_max_coefficient};
        /// Minimum margin kept above the system balance after a sweep.
        evmc::uint256be m_absolute_min{};
    };

    /// Checks that both coefficients are at least 100% and ordered.
    /// \return min_coefficient_too_low, max_coefficient_too_low or
    ///         invalid_coefficient_order, checked in that order.
    auto validate(const reserve_parameters& params)
        -> std::optional<error_code>;

    /// Computes the surplus to sweep after a deposit. Nothing is swept
    /// unless the balance exceeds system_balance * max / 10000, in which
    /// case the balance is brought down to
    /// max(system_balance * min / 10000, system_balance + absolute_min).
    /// \param params reserve band of the asset.
    /// \param system_balance reference balance from the deposit voucher.
    /// \param vault_balance book balance after the deposit was credited.
    /// \return amount to sweep, zero for none.
    auto sweep_amount(const reserve_parameters& params,
                      const evmc::uint256be& system_balance,
                      const evmc::uint256be& vault_balance)
        -> std::variant<evmc::uint256be, error_code>;
}

#endif
