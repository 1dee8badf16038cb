// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_RESERVE_VAULT_H_
#define CUSTODY_SRC_LEDGER_RESERVE_VAULT_H_

#include "asset_ledger.hpp"
#include "config.hpp"
#include "front_end.hpp"
#include "replay_guard.hpp"
#include "reserve_policy.hpp"

#include <map>
#include <utility>

namespace custody::ledger {
    /// Mutable state of a reserve vault.
    struct reserve_vault_state {
        std::shared_ptr<journal> m_journal;
        role_gate m_roles;
        replay_guard m_replay;
        asset_ledger m_ledger;
        /// Latest unrefunded deposit per (account, asset).
        std::map<std::pair<evmc::address, asset_id>, evmc::uint256be>
            m_deposits;
        /// Explicitly configured reserve bands.
        std::map<asset_id, reserve_parameters> m_parameters;
        /// Band used for assets without explicit parameters.
        reserve_parameters m_default_parameters;
        /// Destination of automatic sweeps.
        evmc::address m_withdraw_address;
    };

    /// Custodial vault accepting voucher-authorized deposits and claims
    /// of the native currency and tokens. Deposits that advance the
    /// per-asset voucher id run the reserve policy, sweeping surplus
    /// custody to the withdraw address.
    class reserve_vault : public front_end<reserve_vault_state> {
      public:
        /// Constructor.
        /// \param log log instance.
        /// \param cfg ledger configuration.
        /// \param admin initial administrator, also the initial withdraw
        ///              address.
        /// \param signer initial voucher signer.
        /// \param authority recovers voucher signers.
        /// \param transport moves funds in and out of custody.
        reserve_vault(std::shared_ptr<logging::log> log,
                      const config& cfg,
                      const evmc::address& admin,
                      const evmc::address& signer,
                      std::shared_ptr<signature_authority> authority,
                      std::shared_ptr<asset_transport> transport);

        /// Deposits the native currency attached to the call.
        auto deposit(const call_context& ctx,
                     const evmc::uint256be& sign_id,
                     uint64_t deadline,
                     const evmc::uint256be& system_balance,
                     const evm_sig& sig) -> exec_return_type;

        /// Deposits a token pulled from the caller.
        auto deposit_token(const call_context& ctx,
                           const asset_id& token,
                           const evmc::uint256be& sign_id,
                           const evmc::uint256be& value,
                           uint64_t deadline,
                           const evmc::uint256be& system_balance,
                           const evm_sig& sig) -> exec_return_type;

        /// Pays out native currency to the recipient named in a claim
        /// voucher. Any caller may submit the voucher.
        auto claim(const call_context& ctx,
                   const evmc::uint256be& sign_id,
                   const evmc::address& recipient,
                   const evmc::uint256be& value,
                   const evm_sig& sig) -> exec_return_type;

        /// Pays out a token to the recipient named in a claim voucher.
        auto claim_token(const call_context& ctx,
                         const evmc::uint256be& sign_id,
                         const evmc::address& recipient,
                         const asset_id& token,
                         const evmc::uint256be& value,
                         const evm_sig& sig) -> exec_return_type;

        /// Returns up to the recorded deposit to an account and clears the
        /// record. Requires the refund role.
        auto refund(const call_context& ctx,
                    const evmc::address& account,
                    const asset_id& asset,
                    const evmc::uint256be& amount) -> exec_return_type;

        /// Sends everything above the reserved amount to the caller.
        /// Requires the withdraw role.
        auto withdraw(const call_context& ctx,
                      const asset_id& asset,
                      const evmc::uint256be& reserved) -> exec_return_type;

        /// Adds the attached native currency without a voucher.
        auto topup(const call_context& ctx) -> exec_return_type;

        /// Adds a token pulled from the caller without a voucher.
        auto topup_token(const call_context& ctx,
                         const asset_id& token,
                         const evmc::uint256be& amount) -> exec_return_type;

        /// Sets the reserve band of an asset. Requires the administrator
        /// role.
        auto set_reserve_parameters(const call_context& ctx,
                                    const asset_id& asset,
                                    const reserve_parameters& params)
            -> exec_return_type;

        /// Sets the destination of automatic sweeps. Requires the
        /// administrator role.
        auto set_withdraw_address(const call_context& ctx,
                                  const evmc::address& addr)
            -> exec_return_type;

        /// Credits funds that reached custody without going through the
        /// ledger.
        auto reconcile(const call_context& ctx, const asset_id& asset)
            -> exec_return_type;

        [[nodiscard]] auto balance(const asset_id& asset) const
            -> evmc::uint256be;

        [[nodiscard]] auto deposit_of(const evmc::address& account,
                                      const asset_id& asset) const
            -> evmc::uint256be;

        /// Checks whether a deposit or claim voucher id was consumed.
        /// Ids are scoped per asset.
        [[nodiscard]] auto is_used(const asset_id& asset,
                                   const evmc::uint256be& sign_id) const
            -> bool;

        [[nodiscard]] auto last_sign_id(const asset_id& asset) const
            -> evmc::uint256be;

        [[nodiscard]] auto parameters(const asset_id& asset) const
            -> reserve_parameters;

        [[nodiscard]] auto withdraw_address() const -> evmc::address;

      private:
        auto run_deposit(reserve_vault_state& s,
                         const call_context& ctx,
                         const voucher& v,
                         const evm_sig& sig) -> std::optional<error_code>;

        auto run_claim(reserve_vault_state& s,
                       const call_context& ctx,
                       const voucher& v,
                       const evm_sig& sig) -> std::optional<error_code>;

        auto run_topup(reserve_vault_state& s,
                       const call_context& ctx,
                       const asset_id& asset,
                       const evmc::uint256be& amount)
            -> std::optional<error_code>;
    };
}

#endif
