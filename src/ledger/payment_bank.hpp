// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_PAYMENT_BANK_H_
#define CUSTODY_SRC_LEDGER_PAYMENT_BANK_H_

#include "asset_ledger.hpp"
#include "config.hpp"
#include "front_end.hpp"
#include "replay_guard.hpp"

#include <map>
#include <vector>

namespace custody::ledger {
    /// Mutable state of a payment bank.
    struct payment_bank_state {
        std::shared_ptr<journal> m_journal;
        role_gate m_roles;
        replay_guard m_replay;
        asset_ledger m_ledger;
        /// Per-call ceiling of operator sends. Zero disables sending.
        std::map<asset_id, evmc::uint256be> m_send_limits;
    };

    /// Ledger accepting voucher-authorized payments ("use") and paying
    /// out voucher-authorized claims, each with a native currency fee.
    /// Operators may push funds out under a per-asset limit.
    class payment_bank : public front_end<payment_bank_state> {
      public:
        /// Constructor.
        /// \param log log instance.
        /// \param cfg ledger configuration.
        /// \param admin initial administrator.
        /// \param signer initial voucher signer.
        /// \param authority recovers voucher signers.
        /// \param transport moves funds in and out of custody.
        payment_bank(std::shared_ptr<logging::log> log,
                     const config& cfg,
                     const evmc::address& admin,
                     const evmc::address& signer,
                     std::shared_ptr<signature_authority> authority,
                     std::shared_ptr<asset_transport> transport);

        /// Pays with native currency. The attached value must equal the
        /// payment plus the fee.
        auto use_eth(const call_context& ctx,
                     const evmc::uint256be& sign_id,
                     const evmc::uint256be& value,
                     const evmc::uint256be& param,
                     const evmc::uint256be& fee,
                     uint64_t deadline,
                     const evm_sig& sig) -> exec_return_type;

        /// Pays with a token pulled from the caller. The attached native
        /// value must equal the fee. The native currency is rejected;
        /// use_eth pays with it.
        auto use_token(const call_context& ctx,
                       const asset_id& token,
                       const evmc::uint256be& sign_id,
                       const evmc::uint256be& value,
                       const evmc::uint256be& param,
                       const evmc::uint256be& fee,
                       uint64_t deadline,
                       const evm_sig& sig) -> exec_return_type;

        /// Pays out a tagged claim voucher of a token to the caller.
        auto claim(const call_context& ctx,
                   const asset_id& asset,
                   const evmc::uint256be& sign_id,
                   const evmc::uint256be& value,
                   const evmc::uint256be& fee,
                   uint64_t deadline,
                   const evm_sig& sig) -> exec_return_type;

        /// Pays out an untagged fee claim voucher to the caller. The
        /// native currency is selected by the zero asset id.
        auto fee_claim(const call_context& ctx,
                       const asset_id& asset,
                       const evmc::uint256be& sign_id,
                       const evmc::uint256be& value,
                       const evmc::uint256be& fee,
                       uint64_t deadline,
                       const evm_sig& sig) -> exec_return_type;

        /// Sends funds within the asset's send limit. Requires the
        /// operator role.
        auto send(const call_context& ctx,
                  const asset_id& asset,
                  const evmc::address& to,
                  const evmc::uint256be& amount) -> exec_return_type;

        /// Sends funds to several recipients, each within the send limit.
        /// Requires the operator role.
        auto send_batch(const call_context& ctx,
                        const asset_id& asset,
                        const std::vector<evmc::address>& recipients,
                        const std::vector<evmc::uint256be>& amounts)
            -> exec_return_type;

        /// Sets the per-call send ceiling of an asset. Requires the
        /// administrator role.
        auto set_send_limit(const call_context& ctx,
                            const asset_id& asset,
                            const evmc::uint256be& limit) -> exec_return_type;

        /// Withdraws an amount to the given address. Requires the withdraw
        /// role.
        auto withdraw(const call_context& ctx,
                      const asset_id& asset,
                      const evmc::address& to,
                      const evmc::uint256be& amount) -> exec_return_type;

        /// Withdraws the entire balance to the caller. Requires the
        /// withdraw role.
        auto withdraw_all(const call_context& ctx, const asset_id& asset)
            -> exec_return_type;

        /// Credits funds that reached custody without going through the
        /// ledger.
        auto reconcile(const call_context& ctx, const asset_id& asset)
            -> exec_return_type;

        [[nodiscard]] auto balance(const asset_id& asset) const
            -> evmc::uint256be;

        [[nodiscard]] auto is_used(const evmc::uint256be& sign_id) const
            -> bool;

        [[nodiscard]] auto send_limit(const asset_id& asset) const
            -> evmc::uint256be;

      private:
        [[nodiscard]] auto use_voucher(const call_context& ctx,
                                       const asset_id& asset,
                                       const evmc::uint256be& sign_id,
                                       const evmc::uint256be& value,
                                       const evmc::uint256be& param,
                                       const evmc::uint256be& fee,
                                       uint64_t deadline) const -> voucher;

        auto run_use(payment_bank_state& s,
                     const call_context& ctx,
                     const voucher& v,
                     const evm_sig& sig) -> std::optional<error_code>;

        auto run_claim(payment_bank_state& s,
                       const call_context& ctx,
                       const voucher& v,
                       const evm_sig& sig) -> std::optional<error_code>;

        auto run_send(payment_bank_state& s,
                      const asset_id& asset,
                      const evmc::address& to,
                      const evmc::uint256be& amount)
            -> std::optional<error_code>;
    };
}

#endif
