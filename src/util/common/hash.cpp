// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "hash.hpp"

#include "buffer.hpp"

#include <cstring>
#include <ethash/keccak.hpp>

namespace custody {
    auto to_string(const hash_t& val) -> std::string {
        auto buf = buffer();
        buf.append(val.data(), val.size());
        return buf.to_hex();
    }

    auto keccak_data(const void* data, size_t size) noexcept -> hash_t {
        auto ret = hash_t();
        auto hash
            = ethash::keccak256(static_cast<const uint8_t*>(data), size);
        std::memcpy(ret.data(), hash.bytes, sizeof(hash.bytes));
        return ret;
    }
}
