// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "abi.hpp"

#include <cstring>

namespace custody::ledger {
    auto abi_encoder::add_uint(const evmc::uint256be& v) -> abi_encoder& {
        return add_bytes32(v);
    }

    auto abi_encoder::add_uint(uint64_t v) -> abi_encoder& {
        return add_bytes32(evmc::uint256be(v));
    }

    auto abi_encoder::add_address(const evmc::address& addr)
        -> abi_encoder& {
        auto word = evmc::bytes32{};
        std::memcpy(&word.bytes[word_size - sizeof(addr.bytes)],
                    addr.bytes,
                    sizeof(addr.bytes));
        return add_bytes32(word);
    }

    auto abi_encoder::add_bytes32(const evmc::bytes32& b) -> abi_encoder& {
        auto m = member();
        m.m_word = b;
        m_members.emplace_back(std::move(m));
        return *this;
    }

    auto abi_encoder::add_string(const std::string& s) -> abi_encoder& {
        return add_bytes(std::vector<uint8_t>(s.begin(), s.end()));
    }

    auto abi_encoder::add_bytes(const std::vector<uint8_t>& data)
        -> abi_encoder& {
        return add_dynamic(data.data(), data.size());
    }

    auto abi_encoder::add_dynamic(const uint8_t* data, size_t len)
        -> abi_encoder& {
        auto m = member();
        m.m_dynamic = true;
        if(len > 0) {
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            m.m_data.assign(data, data + len);
        }
        m_members.emplace_back(std::move(m));
        return *this;
    }

    auto abi_encoder::encode() const -> buffer {
        auto head = buffer();
        auto tail = buffer();
        const auto head_size = m_members.size() * word_size;
        for(const auto& m : m_members) {
            if(!m.m_dynamic) {
                head.append(m.m_word.bytes, word_size);
                continue;
            }
            auto offset = evmc::uint256be(
                static_cast<uint64_t>(head_size + tail.size()));
            head.append(offset.bytes, word_size);

            auto len = evmc::uint256be(static_cast<uint64_t>(m.m_data.size()));
            tail.append(len.bytes, word_size);
            tail.append(m.m_data.data(), m.m_data.size());
            auto rem = m.m_data.size() % word_size;
            if(rem != 0) {
                tail.extend(word_size - rem);
            }
        }
        head.append(tail.data(), tail.size());
        return head;
    }
}
