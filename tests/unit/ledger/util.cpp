// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "util.hpp"

#include "ledger/math.hpp"
#include "ledger/util.hpp"

#include <cstring>
#include <stdexcept>

namespace custody::ledger::test {
    auto memory_transport::pull(const asset_id& asset,
                                const evmc::address& from,
                                const evmc::uint256be& amount) -> bool {
        auto& bal = m_accounts[{asset, from}];
        if(bal < amount) {
            return false;
        }
        bal = bal - amount;
        auto received = checked_sub(amount, m_pull_fee);
        if(received.has_value()) {
            m_custody[asset] = m_custody[asset] + received.value();
        }
        return true;
    }

    auto memory_transport::push(const asset_id& asset,
                                const evmc::address& to,
                                const evmc::uint256be& amount) -> bool {
        if(m_rejected.count(to) != 0 || custody_balance(asset) < amount) {
            return false;
        }
        m_custody[asset] = m_custody[asset] - amount;
        m_accounts[{asset, to}] = m_accounts[{asset, to}] + amount;
        if(m_on_push) {
            m_on_push();
        }
        if(m_fail_push) {
            m_accounts[{asset, to}] = m_accounts[{asset, to}] - amount;
            m_custody[asset] = m_custody[asset] + amount;
            return false;
        }
        return true;
    }

    auto memory_transport::custody_balance(const asset_id& asset) const
        -> evmc::uint256be {
        auto it = m_custody.find(asset);
        if(it == m_custody.end()) {
            return {};
        }
        return it->second;
    }

    void memory_transport::fund(const asset_id& asset,
                                const evmc::address& account,
                                const evmc::uint256be& amount) {
        auto& bal = m_accounts[{asset, account}];
        bal = bal + amount;
    }

    void memory_transport::airdrop(const asset_id& asset,
                                   const evmc::uint256be& amount) {
        m_custody[asset] = m_custody[asset] + amount;
    }

    auto memory_transport::balance_of(const asset_id& asset,
                                      const evmc::address& account) const
        -> evmc::uint256be {
        auto it = m_accounts.find({asset, account});
        if(it == m_accounts.end()) {
            return {};
        }
        return it->second;
    }

    memory_escrow::memory_escrow(std::shared_ptr<memory_transport> transport)
        : m_transport(std::move(transport)) {}

    auto memory_escrow::address() const -> evmc::address {
        return make_address("0000000000000000000000000000000000e5c40e");
    }

    auto memory_escrow::create_lock_for(const asset_id& asset,
                                        const evmc::uint256be& amount,
                                        uint64_t duration,
                                        const evmc::address& beneficiary)
        -> std::optional<evmc::uint256be> {
        if(m_fail || !m_transport->push(asset, address(), amount)) {
            return std::nullopt;
        }
        m_locks.push_back(lock{asset, amount, duration, beneficiary});
        return evmc::uint256be(m_locks.size());
    }

    auto make_key(const std::string& hex) -> privkey_t {
        auto bytes = from_hex<evmc::bytes32>(hex);
        if(!bytes.has_value()) {
            throw std::invalid_argument("bad key");
        }
        auto key = privkey_t();
        std::memcpy(key.data(), bytes->bytes, key.size());
        return key;
    }

    auto make_address(const std::string& hex) -> evmc::address {
        auto addr = from_hex<evmc::address>(hex);
        if(!addr.has_value()) {
            throw std::invalid_argument("bad address");
        }
        return addr.value();
    }

    auto sign(const voucher& v, const privkey_t& key) -> evm_sig {
        static const auto secp = make_secp256k1_context();
        return eth_sign(key, digest(v), secp);
    }

    auto error_of(const exec_return_type& res) -> std::optional<error_code> {
        if(std::holds_alternative<error_code>(res)) {
            return std::get<error_code>(res);
        }
        return std::nullopt;
    }

    auto events_of(const exec_return_type& res) -> std::vector<event> {
        if(std::holds_alternative<error_code>(res)) {
            return {};
        }
        return std::get<std::vector<event>>(res);
    }
}
