// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_COMMON_KEYS_H_
#define CUSTODY_SRC_COMMON_KEYS_H_

#include <array>
#include <cstddef>

namespace custody {
    static constexpr size_t privkey_size = 32;
    static constexpr size_t uncompressed_pubkey_size = 65;

    /// A private key of a secp256k1 key pair.
    using privkey_t = std::array<unsigned char, privkey_size>;

    /// An uncompressed secp256k1 public key, 0x04 || X || Y.
    using uncompressed_pubkey_t
        = std::array<unsigned char, uncompressed_pubkey_size>;
}

#endif
