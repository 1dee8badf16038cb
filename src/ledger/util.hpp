// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_UTIL_H_
#define CUSTODY_SRC_LEDGER_UTIL_H_

#include "messages.hpp"
#include "util/common/buffer.hpp"
#include "util/common/hash.hpp"

#include <cstring>
#include <evmc/evmc.hpp>
#include <evmc/hex.hpp>
#include <optional>
#include <string>
#include <type_traits>

namespace custody::ledger {
    /// Returns the low 64 bits of a 256-bit value.
    auto to_uint64(const evmc::uint256be& v) -> uint64_t;

    /// Returns true if the value does not fit in 64 bits.
    auto exceeds_uint64(const evmc::uint256be& v) -> bool;

    template<typename T>
    auto to_hex(const T& v) -> std::string {
        return evmc::hex(evmc::bytes(v.bytes, sizeof(v.bytes)));
    }

    /// Parses hexadecimal representation in string format to T
    /// \param hex hex string to parse. May be prefixed with 0x
    /// \return object containing the parsed T or std::nullopt if
    /// parse failed
    template<typename T>
    auto from_hex(const std::string& hex) ->
        typename std::enable_if_t<std::is_same<T, evmc::bytes32>::value
                                      || std::is_same<T, evmc::address>::value,
                                  std::optional<T>> {
        auto maybe_bytes = custody::buffer::from_hex_prefixed(hex);
        if(!maybe_bytes.has_value()) {
            return std::nullopt;
        }
        if(maybe_bytes.value().size() != sizeof(T)) {
            return std::nullopt;
        }

        auto val = T();
        std::memcpy(val.bytes,
                    maybe_bytes.value().data(),
                    maybe_bytes.value().size());
        return val;
    }

    /// Parses a decimal or 0x-prefixed hexadecimal unsigned integer.
    /// \param str string to parse.
    /// \return value or std::nullopt if the string is not a number or
    ///         does not fit in 256 bits.
    auto parse_uint256(const std::string& str)
        -> std::optional<evmc::uint256be>;

    /// Formats a 256-bit value as a decimal string.
    auto to_decimal(const evmc::uint256be& v) -> std::string;

    /// Converts a hash to a 32-byte word.
    auto to_bytes32(const hash_t& h) -> evmc::bytes32;

    /// Returns a human readable name for the error code.
    auto to_string(error_code err) -> const char*;
}

#endif
