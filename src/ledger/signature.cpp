// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "signature.hpp"

#include "util.hpp"

#include <array>
#include <cassert>
#include <cstring>

namespace custody::ledger {
    namespace {
        constexpr uint64_t eth_v_offset = 27;
        constexpr size_t compact_sig_size = 64;
        constexpr size_t word_size = 32;

        // secp256k1 curve order divided by two
        constexpr auto half_order = evmc::bytes32{
            {{0x7f, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
              0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff, 0xff,
              0x5d, 0x57, 0x6e, 0x73, 0x57, 0xa4, 0x50, 0x1d,
              0xdf, 0xe9, 0x2f, 0x46, 0x68, 0x1b, 0x20, 0xa0}}};
    }

    auto make_secp256k1_context() -> secp256k1_context_ptr {
        return secp256k1_context_ptr(
            secp256k1_context_create(SECP256K1_CONTEXT_SIGN
                                     | SECP256K1_CONTEXT_VERIFY),
            &secp256k1_context_destroy);
    }

    auto eth_sign(const privkey_t& key,
                  const hash_t& hash,
                  const secp256k1_context_ptr& ctx) -> evm_sig {
        secp256k1_ecdsa_recoverable_signature sig;
        [[maybe_unused]] const auto sig_ret
            = secp256k1_ecdsa_sign_recoverable(ctx.get(),
                                               &sig,
                                               hash.data(),
                                               key.data(),
                                               nullptr,
                                               nullptr);
        assert(sig_ret == 1);

        auto sig_buf = std::array<unsigned char, compact_sig_size>();
        int recid{};
        [[maybe_unused]] const auto ser_ret
            = secp256k1_ecdsa_recoverable_signature_serialize_compact(
                ctx.get(),
                sig_buf.data(),
                &recid,
                &sig);
        assert(ser_ret == 1);

        auto sig_ret_val = evm_sig();
        std::memcpy(sig_ret_val.m_r.bytes, sig_buf.data(), word_size);
        std::memcpy(sig_ret_val.m_s.bytes,
                    &sig_buf[word_size],
                    word_size);
        sig_ret_val.m_v
            = evmc::uint256be(static_cast<uint64_t>(recid) + eth_v_offset);
        return sig_ret_val;
    }

    auto pubkey_to_address(const uncompressed_pubkey_t& pubkey)
        -> evmc::address {
        // Skip the 0x04 prefix byte
        auto h = keccak_data(&pubkey[1], pubkey.size() - 1);
        auto addr = evmc::address();
        std::memcpy(addr.bytes,
                    &h[h.size() - sizeof(addr.bytes)],
                    sizeof(addr.bytes));
        return addr;
    }

    auto address_of(const privkey_t& key, const secp256k1_context_ptr& ctx)
        -> std::optional<evmc::address> {
        secp256k1_pubkey pubkey;
        if(secp256k1_ec_pubkey_create(ctx.get(), &pubkey, key.data()) != 1) {
            return std::nullopt;
        }
        auto out = uncompressed_pubkey_t();
        auto out_len = out.size();
        secp256k1_ec_pubkey_serialize(ctx.get(),
                                      out.data(),
                                      &out_len,
                                      &pubkey,
                                      SECP256K1_EC_UNCOMPRESSED);
        return pubkey_to_address(out);
    }

    secp256k1_authority::secp256k1_authority()
        : m_secp(make_secp256k1_context()) {}

    auto secp256k1_authority::recover(const hash_t& hash,
                                      const evm_sig& sig) const
        -> std::optional<evmc::address> {
        if(exceeds_uint64(sig.m_v)) {
            return std::nullopt;
        }
        auto v = to_uint64(sig.m_v);
        if(v >= eth_v_offset) {
            v -= eth_v_offset;
        }
        if(v > 1) {
            return std::nullopt;
        }
        if(half_order < sig.m_s) {
            return std::nullopt;
        }

        auto sig_buf = std::array<unsigned char, compact_sig_size>();
        std::memcpy(sig_buf.data(), sig.m_r.bytes, word_size);
        std::memcpy(&sig_buf[word_size], sig.m_s.bytes, word_size);

        secp256k1_ecdsa_recoverable_signature rsig;
        if(secp256k1_ecdsa_recoverable_signature_parse_compact(
               m_secp.get(),
               &rsig,
               sig_buf.data(),
               static_cast<int>(v))
           != 1) {
            return std::nullopt;
        }

        secp256k1_pubkey pubkey;
        if(secp256k1_ecdsa_recover(m_secp.get(), &pubkey, &rsig, hash.data())
           != 1) {
            return std::nullopt;
        }

        auto out = uncompressed_pubkey_t();
        auto out_len = out.size();
        secp256k1_ec_pubkey_serialize(m_secp.get(),
                                      out.data(),
                                      &out_len,
                                      &pubkey,
                                      SECP256K1_EC_UNCOMPRESSED);
        return pubkey_to_address(out);
    }
}
