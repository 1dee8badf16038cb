// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "math.hpp"

#include <array>
#include <limits>

namespace custody::ledger {
    namespace {
        constexpr size_t limb_count = 8;
        constexpr size_t limb_bits = 32;
        constexpr size_t limb_bytes = 4;
        constexpr size_t word_bits = 256;
        constexpr uint64_t limb_mask = std::numeric_limits<uint32_t>::max();

        /// Little-endian 32-bit limbs.
        using limbs_t = std::array<uint32_t, limb_count>;

        auto to_limbs(const evmc::uint256be& v) -> limbs_t {
            auto ret = limbs_t{};
            for(size_t i = 0; i < limb_count; i++) {
                auto offset = sizeof(v.bytes) - (i + 1) * limb_bytes;
                ret[i] = evmc::load32be(&v.bytes[offset]);
            }
            return ret;
        }

        auto from_limbs(const limbs_t& l) -> evmc::uint256be {
            auto ret = evmc::uint256be{};
            for(size_t i = 0; i < limb_count; i++) {
                auto offset = sizeof(ret.bytes) - (i + 1) * limb_bytes;
                for(size_t j = 0; j < limb_bytes; j++) {
                    ret.bytes[offset + j] = static_cast<uint8_t>(
                        l[i] >> ((limb_bytes - 1 - j) * 8));
                }
            }
            return ret;
        }

        auto bit_length(const evmc::uint256be& v) -> size_t {
            for(size_t i = 0; i < sizeof(v.bytes); i++) {
                if(v.bytes[i] != 0) {
                    auto top = v.bytes[i];
                    size_t bits = 0;
                    while(top != 0) {
                        bits++;
                        top = static_cast<uint8_t>(top >> 1);
                    }
                    return (sizeof(v.bytes) - i - 1) * 8 + bits;
                }
            }
            return 0;
        }

        auto test_bit(const evmc::uint256be& v, size_t bit) -> bool {
            auto idx = sizeof(v.bytes) - 1 - bit / 8;
            return ((v.bytes[idx] >> (bit % 8)) & 1) != 0;
        }

        /// Full-width product as sixteen limbs.
        auto wide_mul(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
            -> std::array<uint32_t, limb_count * 2> {
            auto a = to_limbs(lhs);
            auto b = to_limbs(rhs);
            auto out = std::array<uint32_t, limb_count * 2>{};
            for(size_t i = 0; i < limb_count; i++) {
                auto carry = uint64_t{};
                for(size_t j = 0; j < limb_count; j++) {
                    auto cur = static_cast<uint64_t>(a[i])
                                 * static_cast<uint64_t>(b[j])
                             + out[i + j] + carry;
                    out[i + j] = static_cast<uint32_t>(cur & limb_mask);
                    carry = cur >> limb_bits;
                }
                out[i + limb_count] = static_cast<uint32_t>(carry);
            }
            return out;
        }

        auto divmod(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
            -> std::pair<evmc::uint256be, evmc::uint256be> {
            if(evmc::is_zero(rhs)) {
                return {evmc::uint256be{}, evmc::uint256be{}};
            }
            auto quot = evmc::uint256be{};
            auto rem = evmc::uint256be{};
            for(auto i = bit_length(lhs); i > 0; i--) {
                rem = rem << 1;
                if(test_bit(lhs, i - 1)) {
                    rem.bytes[sizeof(rem.bytes) - 1] |= 1;
                }
                if(!(rem < rhs)) {
                    rem = rem - rhs;
                    auto idx = sizeof(quot.bytes) - 1 - (i - 1) / 8;
                    quot.bytes[idx] = static_cast<uint8_t>(
                        quot.bytes[idx] | (1U << ((i - 1) % 8)));
                }
            }
            return {quot, rem};
        }
    }

    auto operator+(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        auto ret = evmc::uint256be{};
        auto tmp = uint64_t{};
        auto carry = uint8_t{};
        constexpr uint64_t max_val = std::numeric_limits<uint8_t>::max();
        for(int i = sizeof(lhs.bytes) - 1; i >= 0; i--) {
            tmp = lhs.bytes[i] + rhs.bytes[i] + carry;
            carry = (tmp > max_val);
            ret.bytes[i] = (tmp & max_val);
        }
        return ret;
    }

    auto operator-(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        auto ret = evmc::uint256be{};
        auto tmp1 = uint64_t{};
        auto tmp2 = uint64_t{};
        auto res = uint64_t{};
        auto borrow = uint8_t{};
        constexpr uint64_t max_val = std::numeric_limits<uint8_t>::max();
        for(int i = sizeof(lhs.bytes) - 1; i >= 0; i--) {
            tmp1 = lhs.bytes[i] + (max_val + 1);
            tmp2 = rhs.bytes[i] + borrow;
            res = tmp1 - tmp2;
            ret.bytes[i] = (res & max_val);
            borrow = (res <= max_val);
        }
        return ret;
    }

    auto operator*(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        auto wide = wide_mul(lhs, rhs);
        auto low = limbs_t{};
        for(size_t i = 0; i < limb_count; i++) {
            low[i] = wide[i];
        }
        return from_limbs(low);
    }

    auto operator/(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        return divmod(lhs, rhs).first;
    }

    auto operator%(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        return divmod(lhs, rhs).second;
    }

    auto operator<<(const evmc::uint256be& lhs, size_t count)
        -> evmc::uint256be {
        auto ret = evmc::uint256be{};
        if(count >= word_bits) {
            return ret;
        }
        auto byte_shift = count / 8;
        auto bit_shift = count % 8;
        for(size_t i = 0; i + byte_shift < sizeof(lhs.bytes); i++) {
            auto src = i + byte_shift;
            auto val = static_cast<unsigned>(lhs.bytes[src]) << bit_shift;
            if(bit_shift != 0 && src + 1 < sizeof(lhs.bytes)) {
                val |= static_cast<unsigned>(lhs.bytes[src + 1])
                    >> (8 - bit_shift);
            }
            ret.bytes[i] = static_cast<uint8_t>(val);
        }
        return ret;
    }

    auto operator>>(const evmc::uint256be& lhs, size_t count)
        -> evmc::uint256be {
        auto ret = evmc::uint256be{};
        if(count >= word_bits) {
            return ret;
        }
        auto byte_shift = count / 8;
        auto bit_shift = count % 8;
        for(size_t i = byte_shift; i < sizeof(lhs.bytes); i++) {
            auto src = i - byte_shift;
            auto val = static_cast<unsigned>(lhs.bytes[src]) >> bit_shift;
            if(bit_shift != 0 && src > 0) {
                val |= static_cast<unsigned>(lhs.bytes[src - 1])
                    << (8 - bit_shift);
            }
            ret.bytes[i] = static_cast<uint8_t>(val);
        }
        return ret;
    }

    auto operator&(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        auto ret = evmc::uint256be{};
        for(size_t i = 0; i < sizeof(ret.bytes); i++) {
            ret.bytes[i] = lhs.bytes[i] & rhs.bytes[i];
        }
        return ret;
    }

    auto checked_add(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be> {
        auto ret = lhs + rhs;
        if(ret < lhs) {
            return std::nullopt;
        }
        return ret;
    }

    auto checked_sub(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be> {
        if(lhs < rhs) {
            return std::nullopt;
        }
        return lhs - rhs;
    }

    auto checked_mul(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> std::optional<evmc::uint256be> {
        auto wide = wide_mul(lhs, rhs);
        for(size_t i = limb_count; i < wide.size(); i++) {
            if(wide[i] != 0) {
                return std::nullopt;
            }
        }
        return lhs * rhs;
    }

    auto isqrt(const evmc::uint256be& v) -> evmc::uint256be {
        if(evmc::is_zero(v)) {
            return v;
        }
        const auto one = evmc::uint256be(1);
        auto x = v;
        while(true) {
            auto q = v / x;
            // (x + q) / 2 without overflowing the 256-bit word
            auto next = (x >> 1) + (q >> 1) + (x & q & one);
            if(!(next < x)) {
                return x;
            }
            x = next;
        }
    }

    auto max(const evmc::uint256be& lhs, const evmc::uint256be& rhs)
        -> evmc::uint256be {
        return lhs < rhs ? rhs : lhs;
    }
}
