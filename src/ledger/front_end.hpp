// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_FRONT_END_H_
#define CUSTODY_SRC_LEDGER_FRONT_END_H_

#include "executor.hpp"
#include "role_gate.hpp"
#include "signature.hpp"
#include "voucher.hpp"

#include <memory>

namespace custody::ledger {
    /// Role administration and voucher verification shared by every
    /// ledger front-end.
    /// \tparam State ledger state; must hold a role_gate named m_roles and
    ///               the journal its components record in, m_journal.
    template<typename State>
    class front_end {
      public:
        /// Constructor.
        /// \param log log instance.
        /// \param contract address of this ledger, bound into every
        ///                 voucher it accepts.
        /// \param authority recovers voucher signers.
        /// \param state initial state.
        front_end(std::shared_ptr<logging::log> log,
                  const evmc::address& contract,
                  std::shared_ptr<signature_authority> authority,
                  State state)
            : m_log(std::move(log)),
              m_contract(contract),
              m_authority(std::move(authority)),
              m_exec(m_log, std::move(state)) {}

        /// Grants a role. Requires the administrator role.
        auto grant_role(const call_context& ctx,
                        const role_t& role,
                        const evmc::address& account) -> exec_return_type {
            return m_exec.run("grant_role", [&](State& s) {
                if(auto err = s.m_roles.check_role(admin_role(),
                                                   ctx.m_sender)) {
                    return err;
                }
                if(s.m_roles.grant(role, account)) {
                    m_log->info("Granted role",
                                to_hex(role),
                                "to",
                                to_hex(account));
                    m_exec.emit(role_granted{role, account, ctx.m_sender});
                }
                return std::optional<error_code>();
            });
        }

        /// Revokes a role. Requires the administrator role. The
        /// administrator may revoke its own role.
        auto revoke_role(const call_context& ctx,
                         const role_t& role,
                         const evmc::address& account) -> exec_return_type {
            return m_exec.run("revoke_role", [&](State& s) {
                if(auto err = s.m_roles.check_role(admin_role(),
                                                   ctx.m_sender)) {
                    return err;
                }
                if(s.m_roles.revoke(role, account)) {
                    m_log->info("Revoked role",
                                to_hex(role),
                                "from",
                                to_hex(account));
                    m_exec.emit(role_revoked{role, account, ctx.m_sender});
                }
                return std::optional<error_code>();
            });
        }

        /// Replaces the voucher signer. Every current holder of the
        /// signer role loses it. Requires the administrator role.
        auto set_signer(const call_context& ctx, const evmc::address& signer)
            -> exec_return_type {
            return m_exec.run("set_signer", [&](State& s) {
                if(auto err = s.m_roles.check_role(admin_role(),
                                                   ctx.m_sender)) {
                    return err;
                }
                if(signer == evmc::address{}) {
                    return std::optional<error_code>(
                        error_code::zero_address);
                }
                for(const auto& holder : s.m_roles.holders(signer_role())) {
                    s.m_roles.revoke(signer_role(), holder);
                }
                s.m_roles.grant(signer_role(), signer);
                m_log->info("Signer set to", to_hex(signer));
                m_exec.emit(signer_updated{signer});
                return std::optional<error_code>();
            });
        }

        [[nodiscard]] auto has_role(const role_t& role,
                                    const evmc::address& account) const
            -> bool {
            return m_exec.state().m_roles.has_role(role, account);
        }

        [[nodiscard]] auto contract_address() const -> const evmc::address& {
            return m_contract;
        }

        /// Sets the callback receiving events of successful operations.
        void set_event_sink(
            typename executor<State>::event_sink_type sink) {
            m_exec.set_event_sink(std::move(sink));
        }

      protected:
        /// Checks the deadline and signer of a voucher built from the
        /// call's arguments.
        /// \param s current state.
        /// \param v voucher to check.
        /// \param sig signature supplied by the caller.
        /// \param now current block timestamp.
        /// \return deadline_expired, or the layout's signature error if
        ///         the signer does not hold the signer role.
        [[nodiscard]] auto verify_voucher(const State& s,
                                          const voucher& v,
                                          const evm_sig& sig,
                                          uint64_t now) const
            -> std::optional<error_code> {
            if(has_deadline(v.m_layout) && now > v.m_deadline) {
                return error_code::deadline_expired;
            }
            auto signer = m_authority->recover(digest(v), sig);
            if(!signer.has_value()
               || !s.m_roles.has_role(signer_role(), signer.value())) {
                m_log->warn("Voucher",
                            to_decimal(v.m_sign_id),
                            "not signed by the signer");
                return signature_error(v.m_layout);
            }
            return std::nullopt;
        }

        std::shared_ptr<logging::log> m_log;
        evmc::address m_contract;
        std::shared_ptr<signature_authority> m_authority;
        executor<State> m_exec;
    };
}

#endif
