// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_COMMON_HASH_H_
#define CUSTODY_SRC_COMMON_HASH_H_

#include <array>
#include <cstddef>
#include <string>

namespace custody {
    static constexpr size_t hash_size = 32;

    /// 32-byte digest.
    using hash_t = std::array<unsigned char, hash_size>;

    /// Returns the hex representation of a hash.
    /// \param val hash to convert.
    /// \return hex string without a 0x prefix.
    auto to_string(const hash_t& val) -> std::string;

    /// Calculates the keccak256 digest of the given data.
    /// \param data pointer to the data to hash.
    /// \param size number of bytes to hash.
    /// \return keccak256 digest.
    auto keccak_data(const void* data, size_t size) noexcept -> hash_t;
}

#endif
