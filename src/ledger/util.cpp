// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include "math.hpp"

#include <algorithm>

namespace custody::ledger {
    auto to_uint64(const evmc::uint256be& v) -> uint64_t {
        return evmc::load64be(&v.bytes[sizeof(v.bytes) - sizeof(uint64_t)]);
    }

    auto exceeds_uint64(const evmc::uint256be& v) -> bool {
        for(size_t i = 0; i < sizeof(v.bytes) - sizeof(uint64_t); i++) {
            if(v.bytes[i] != 0) {
                return true;
            }
        }
        return false;
    }

    auto parse_uint256(const std::string& str)
        -> std::optional<evmc::uint256be> {
        if(str.empty()) {
            return std::nullopt;
        }
        if(str.rfind("0x", 0) == 0) {
            auto digits = str.substr(2);
            static constexpr size_t max_digits = 64;
            if(digits.empty() || digits.size() > max_digits) {
                return std::nullopt;
            }
            digits.insert(0, max_digits - digits.size(), '0');
            return from_hex<evmc::bytes32>(digits);
        }
        static constexpr uint64_t radix = 10;
        auto ret = evmc::uint256be{};
        for(const auto c : str) {
            if(c < '0' || c > '9') {
                return std::nullopt;
            }
            auto scaled = checked_mul(ret, evmc::uint256be(radix));
            if(!scaled.has_value()) {
                return std::nullopt;
            }
            auto sum = checked_add(
                scaled.value(),
                evmc::uint256be(static_cast<uint64_t>(c - '0')));
            if(!sum.has_value()) {
                return std::nullopt;
            }
            ret = sum.value();
        }
        return ret;
    }

    auto to_decimal(const evmc::uint256be& v) -> std::string {
        if(evmc::is_zero(v)) {
            return "0";
        }
        static constexpr uint64_t radix = 10;
        const auto ten = evmc::uint256be(radix);
        auto ret = std::string();
        auto cur = v;
        while(!evmc::is_zero(cur)) {
            auto digit = to_uint64(cur % ten);
            ret.push_back(static_cast<char>('0' + digit));
            cur = cur / ten;
        }
        std::reverse(ret.begin(), ret.end());
        return ret;
    }

    auto to_bytes32(const hash_t& h) -> evmc::bytes32 {
        auto ret = evmc::bytes32{};
        std::memcpy(ret.bytes, h.data(), h.size());
        return ret;
    }

    auto to_string(error_code err) -> const char* {
        switch(err) {
            case error_code::zero_address:
                return "zero address";
            case error_code::zero_value:
                return "zero value";
            case error_code::arrays_length_mismatch:
                return "arrays length mismatch";
            case error_code::wrong_signature:
                return "wrong signature";
            case error_code::invalid_signature:
                return "invalid signature";
            case error_code::access_control_unauthorized_account:
                return "unauthorized account";
            case error_code::deadline_expired:
                return "deadline expired";
            case error_code::order_already_processed:
                return "order already processed";
            case error_code::sign_id_already_used:
                return "sign id already used";
            case error_code::insufficient_balance:
                return "insufficient balance";
            case error_code::insufficient_fee:
                return "insufficient fee";
            case error_code::exceeds_token_limit:
                return "exceeds token limit";
            case error_code::invalid_refund_amount:
                return "invalid refund amount";
            case error_code::invalid_coefficient_order:
                return "invalid coefficient order";
            case error_code::min_coefficient_too_low:
                return "min coefficient too low";
            case error_code::max_coefficient_too_low:
                return "max coefficient too low";
            case error_code::invalid_lock_weeks:
                return "invalid lock weeks";
            case error_code::transfer_failed:
                return "transfer failed";
            case error_code::arithmetic_overflow:
                return "arithmetic overflow";
            case error_code::accounting_drift:
                return "accounting drift";
        }
        return "unknown error";
    }
}
