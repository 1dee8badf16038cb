// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"

#include "util.hpp"

#include <cstring>
#include <string>
#include <vector>

namespace custody::ledger {
    static constexpr auto contract_address_key = "contract_address";
    static constexpr auto chain_id_key = "chain_id";
    static constexpr auto signer_key_key = "signer_key";
    static constexpr auto reserve_min_key = "reserve_min_coefficient";
    static constexpr auto reserve_max_key = "reserve_max_coefficient";
    static constexpr auto reserve_absolute_min_key = "reserve_absolute_min";
    static constexpr auto max_lock_weeks_key = "max_lock_weeks";
    static constexpr auto loglevel_key = "loglevel";

    auto read_config(const custody::config::parser& cfg)
        -> std::optional<config> {
        if(!cfg.valid()) {
            return std::nullopt;
        }

        auto ret = config();

        auto contract = cfg.get_string(contract_address_key);
        if(!contract.has_value()) {
            return std::nullopt;
        }
        auto contract_addr = from_hex<evmc::address>(contract.value());
        if(!contract_addr.has_value()) {
            return std::nullopt;
        }
        ret.m_contract_address = contract_addr.value();

        ret.m_chain_id = cfg.get_ulong_or(chain_id_key, ret.m_chain_id);

        auto key_str = cfg.get_string(signer_key_key);
        if(key_str.has_value()) {
            auto key = from_hex<evmc::bytes32>(key_str.value());
            if(!key.has_value()) {
                return std::nullopt;
            }
            auto privkey = privkey_t();
            std::memcpy(privkey.data(), key->bytes, privkey.size());
            ret.m_signer_key = privkey;
        }

        auto& reserve = ret.m_default_reserve;
        reserve.m_min_coefficient = evmc::uint256be(
            cfg.get_ulong_or(reserve_min_key, default_min_coefficient));
        reserve.m_max_coefficient = evmc::uint256be(
            cfg.get_ulong_or(reserve_max_key, default_max_coefficient));
        reserve.m_absolute_min = evmc::uint256be(
            cfg.get_ulong_or(reserve_absolute_min_key, 0));
        if(validate(reserve).has_value()) {
            return std::nullopt;
        }

        ret.m_max_lock_weeks
            = cfg.get_ulong_or(max_lock_weeks_key, ret.m_max_lock_weeks);

        if(cfg.get_string(loglevel_key).has_value()) {
            auto level = cfg.get_loglevel(loglevel_key);
            if(!level.has_value()) {
                return std::nullopt;
            }
            ret.m_loglevel = level.value();
        }

        return ret;
    }

    auto read_config(int argc, char** argv) -> std::optional<config> {
        auto args = std::vector<std::string>(argv, argv + argc);
        if(args.size() < 2) {
            return std::nullopt;
        }
        auto cfg = custody::config::parser(args[1]);
        return read_config(cfg);
    }
}
