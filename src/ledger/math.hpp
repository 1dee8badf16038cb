// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_MATH_H_
#define CUSTODY_SRC_LEDGER_MATH_H_

#include <evmc/evmc.hpp>
#include <optional>

namespace custody::ledger {
    /// Wrapping 256-bit addition.
    auto operator+(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    /// Wrapping 256-bit subtraction.
    auto operator-(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    /// Wrapping 256-bit multiplication.
    auto operator*(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    /// Truncating division. Division by zero returns zero.
    auto operator/(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    /// Remainder. Modulo zero returns zero.
    auto operator%(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    /// Logical left shift by the given number of bits.
    auto operator<<(const evmc::uint256be& lhs, size_t count)
        -> evmc::uint256be;

    /// Logical right shift by the given number of bits.
    auto operator>>(const evmc::uint256be& lhs, size_t count)
        -> evmc::uint256be;

    auto operator&(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;

    /// Addition that fails instead of wrapping.
    /// \return sum or std::nullopt on overflow.
    auto checked_add(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be>;

    /// Subtraction that fails instead of wrapping.
    /// \return difference or std::nullopt if rhs > lhs.
    auto checked_sub(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be>;

    /// Multiplication that fails instead of wrapping.
    /// \return product or std::nullopt on overflow.
    auto checked_mul(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be>;

    /// Integer square root using Newton's method starting from the input
    /// value, stopping once the sequence stops decreasing.
    /// \param v value to take the root of.
    /// \return floor(sqrt(v)).
    auto isqrt(const evmc::uint256be& v) -> evmc::uint256be;

    /// Returns the larger of two values.
    auto max(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be;
}

#endif
