// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "role_gate.hpp"

#include "util.hpp"

namespace custody::ledger {
    auto role_id(const std::string& name) -> role_t {
        return to_bytes32(keccak_data(name.data(), name.size()));
    }

    auto admin_role() -> const role_t& {
        static const auto role = role_t{};
        return role;
    }

    auto signer_role() -> const role_t& {
        static const auto role = role_id("SIGNER_ROLE");
        return role;
    }

    auto withdraw_role() -> const role_t& {
        static const auto role = role_id("WITHDRAW_ROLE");
        return role;
    }

    auto operator_role() -> const role_t& {
        static const auto role = role_id("OPERATOR_ROLE");
        return role;
    }

    auto refund_role() -> const role_t& {
        static const auto role = role_id("REFUND_ROLE");
        return role;
    }

    auto minter_role() -> const role_t& {
        static const auto role = role_id("MINTER_ROLE");
        return role;
    }

    auto burner_role() -> const role_t& {
        static const auto role = role_id("BURNER_ROLE");
        return role;
    }

    role_gate::role_gate(std::shared_ptr<journal> j,
                         const evmc::address& admin)
        : m_journal(std::move(j)) {
        grant(admin_role(), admin);
    }

    auto role_gate::has_role(const role_t& role,
                             const evmc::address& account) const -> bool {
        auto it = m_roles.find(role);
        if(it == m_roles.end()) {
            return false;
        }
        return it->second.find(account) != it->second.end();
    }

    auto role_gate::check_role(const role_t& role,
                               const evmc::address& account) const
        -> std::optional<error_code> {
        if(!has_role(role, account)) {
            return error_code::access_control_unauthorized_account;
        }
        return std::nullopt;
    }

    auto role_gate::grant(const role_t& role, const evmc::address& account)
        -> bool {
        return m_journal->insert(m_roles[role], account);
    }

    auto role_gate::revoke(const role_t& role, const evmc::address& account)
        -> bool {
        auto it = m_roles.find(role);
        if(it == m_roles.end()) {
            return false;
        }
        return m_journal->erase(it->second, account);
    }

    auto role_gate::holders(const role_t& role) const
        -> std::vector<evmc::address> {
        auto it = m_roles.find(role);
        if(it == m_roles.end()) {
            return {};
        }
        return {it->second.begin(), it->second.end()};
    }
}
