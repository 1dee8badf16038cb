// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_VESTING_H_
#define CUSTODY_SRC_LEDGER_VESTING_H_

#include "messages.hpp"

#include <variant>

namespace custody::ledger {
    static constexpr uint64_t default_max_lock_weeks = 208;
    static constexpr uint64_t seconds_per_week = 7 * 24 * 60 * 60;

    /// Computes principal * sqrt((lock_weeks + 1) / (max_weeks + 1)) in
    /// 18-decimal fixed point.
    /// \param principal maximum payout, received for the longest lock.
    /// \param lock_weeks requested lock duration.
    /// \param max_weeks longest allowed lock duration.
    /// \return payout, or invalid_lock_weeks if lock_weeks > max_weeks.
    auto vested_amount(const evmc::uint256be& principal,
                       uint64_t lock_weeks,
                       uint64_t max_weeks)
        -> std::variant<evmc::uint256be, error_code>;

    /// As vested_amount but returns zero for any rejected input.
    auto preview_amount(const evmc::uint256be& principal,
                        uint64_t lock_weeks,
                        uint64_t max_weeks) -> evmc::uint256be;
}

#endif
