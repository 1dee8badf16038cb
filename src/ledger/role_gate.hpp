// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_ROLE_GATE_H_
#define CUSTODY_SRC_LEDGER_ROLE_GATE_H_

#include "journal.hpp"
#include "messages.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace custody::ledger {
    /// Returns the identifier of a named role, keccak256 of the name.
    auto role_id(const std::string& name) -> role_t;

    /// Administrator role. Grants and revokes every role.
    auto admin_role() -> const role_t&;
    /// Holder's signatures authorize vouchers.
    auto signer_role() -> const role_t&;
    /// May withdraw funds manually.
    auto withdraw_role() -> const role_t&;
    /// May push funds out under the per-asset send limit.
    auto operator_role() -> const role_t&;
    /// May refund recorded deposits.
    auto refund_role() -> const role_t&;
    /// May mint inventory items.
    auto minter_role() -> const role_t&;
    /// May burn inventory items from any account.
    auto burner_role() -> const role_t&;

    /// Set of (role, account) assignments.
    class role_gate {
      public:
        /// Constructor. Grants the administrator role to the given account.
        /// \param j journal recording changes to the assignments.
        /// \param admin initial administrator.
        role_gate(std::shared_ptr<journal> j, const evmc::address& admin);

        /// Returns true if the account holds the role.
        [[nodiscard]] auto has_role(const role_t& role,
                                    const evmc::address& account) const
            -> bool;

        /// Checks that the account holds the role.
        /// \return access_control_unauthorized_account if it does not.
        [[nodiscard]] auto check_role(const role_t& role,
                                      const evmc::address& account) const
            -> std::optional<error_code>;

        /// Assigns a role.
        /// \return true if the account did not already hold the role.
        auto grant(const role_t& role, const evmc::address& account) -> bool;

        /// Removes a role.
        /// \return true if the account held the role.
        auto revoke(const role_t& role, const evmc::address& account) -> bool;

        /// Returns every account currently holding the role.
        [[nodiscard]] auto holders(const role_t& role) const
            -> std::vector<evmc::address>;

      private:
        std::shared_ptr<journal> m_journal;
        std::map<role_t, std::set<evmc::address>> m_roles;
    };
}

#endif
