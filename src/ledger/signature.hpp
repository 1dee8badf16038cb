// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_SIGNATURE_H_
#define CUSTODY_SRC_LEDGER_SIGNATURE_H_

#include "messages.hpp"
#include "util/common/hash.hpp"
#include "util/common/keys.hpp"

#include <evmc/evmc.hpp>
#include <memory>
#include <optional>
#include <secp256k1.h>
#include <secp256k1_recovery.h>

namespace custody::ledger {
    using secp256k1_context_ptr
        = std::unique_ptr<secp256k1_context,
                          decltype(&secp256k1_context_destroy)>;

    /// Creates a secp256k1 context able to sign and verify.
    auto make_secp256k1_context() -> secp256k1_context_ptr;

    /// Signs a hash using a privkey_t using ecdsa and produces an evm_sig
    /// struct with v set to 27 or 28. Used by voucher issuers and in unit
    /// tests.
    /// \param key key to sign with
    /// \param hash hash to sign
    /// \param ctx secp256k1 context to use
    /// \return the signature value encoded in r,s,v values in an evm_sig
    ///         struct
    auto eth_sign(const privkey_t& key,
                  const hash_t& hash,
                  const secp256k1_context_ptr& ctx) -> evm_sig;

    /// Derives the Ethereum address controlled by a private key.
    /// \param key private key.
    /// \param ctx secp256k1 context to use.
    /// \return address or std::nullopt if the key is invalid.
    auto address_of(const privkey_t& key, const secp256k1_context_ptr& ctx)
        -> std::optional<evmc::address>;

    /// Returns the address for an uncompressed public key: the last 20
    /// bytes of the keccak256 hash of its X and Y coordinates.
    auto pubkey_to_address(const uncompressed_pubkey_t& pubkey)
        -> evmc::address;

    /// Recovers the address that signed a message digest.
    class signature_authority {
      public:
        virtual ~signature_authority() = default;

        signature_authority() = default;
        signature_authority(const signature_authority&) = delete;
        auto operator=(const signature_authority&)
            -> signature_authority& = delete;
        signature_authority(signature_authority&&) = delete;
        auto operator=(signature_authority&&)
            -> signature_authority& = delete;

        /// Recovers the signer of the given digest.
        /// \param hash message digest that was signed.
        /// \param sig signature over the digest.
        /// \return signing address or std::nullopt if the signature is
        ///         malformed.
        [[nodiscard]] virtual auto recover(const hash_t& hash,
                                           const evm_sig& sig) const
            -> std::optional<evmc::address> = 0;
    };

    /// ECDSA public key recovery over secp256k1. Accepts v as 27/28 or 0/1
    /// and rejects signatures with s in the upper half of the curve order.
    class secp256k1_authority final : public signature_authority {
      public:
        secp256k1_authority();

        [[nodiscard]] auto recover(const hash_t& hash,
                                   const evm_sig& sig) const
            -> std::optional<evmc::address> override;

      private:
        secp256k1_context_ptr m_secp;
    };
}

#endif
