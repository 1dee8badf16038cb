// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_ABI_H_
#define CUSTODY_SRC_LEDGER_ABI_H_

#include "util/common/buffer.hpp"

#include <evmc/evmc.hpp>
#include <string>
#include <vector>

namespace custody::ledger {
    /// Builds the Ethereum ABI encoding of a tuple. Static members occupy
    /// one 32-byte head word each; dynamic members place an offset in the
    /// head and their length-prefixed, zero-padded contents in the tail.
    class abi_encoder {
      public:
        static constexpr size_t word_size = 32;

        /// Appends a uint256 member.
        auto add_uint(const evmc::uint256be& v) -> abi_encoder&;

        /// Appends a uint256 member from a 64-bit value.
        auto add_uint(uint64_t v) -> abi_encoder&;

        /// Appends an address member, left-padded to a full word.
        auto add_address(const evmc::address& addr) -> abi_encoder&;

        /// Appends a bytes32 member.
        auto add_bytes32(const evmc::bytes32& b) -> abi_encoder&;

        /// Appends a dynamic string member.
        auto add_string(const std::string& s) -> abi_encoder&;

        /// Appends a dynamic bytes member.
        auto add_bytes(const std::vector<uint8_t>& data) -> abi_encoder&;

        /// Returns the encoded tuple.
        [[nodiscard]] auto encode() const -> buffer;

      private:
        struct member {
            bool m_dynamic{false};
            evmc::bytes32 m_word{};
            std::vector<uint8_t> m_data{};
        };

        std::vector<member> m_members;

        auto add_dynamic(const uint8_t* data, size_t len) -> abi_encoder&;
    };
}

#endif
