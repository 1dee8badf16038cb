// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_RETRO_DROP_H_
#define CUSTODY_SRC_LEDGER_RETRO_DROP_H_

#include "asset_ledger.hpp"
#include "config.hpp"
#include "front_end.hpp"
#include "replay_guard.hpp"

namespace custody::ledger {
    /// Mutable state of a retro drop.
    struct retro_drop_state {
        std::shared_ptr<journal> m_journal;
        role_gate m_roles;
        replay_guard m_replay;
        asset_ledger m_ledger;
    };

    /// Distributes a single token against vouchers naming a maximum
    /// amount. The claimant chooses a lock duration: the payout scales
    /// with its square root and is either sent directly (no lock) or
    /// locked in an escrow position on the claimant's behalf.
    class retro_drop : public front_end<retro_drop_state> {
      public:
        /// Constructor.
        /// \param log log instance.
        /// \param cfg ledger configuration.
        /// \param token token being distributed.
        /// \param admin initial administrator, also granted the withdraw
        ///              role.
        /// \param signer initial voucher signer.
        /// \param authority recovers voucher signers.
        /// \param transport moves funds in and out of custody.
        /// \param escrow time-lock escrow for locked claims.
        retro_drop(std::shared_ptr<logging::log> log,
                   const config& cfg,
                   const asset_id& token,
                   const evmc::address& admin,
                   const evmc::address& signer,
                   std::shared_ptr<signature_authority> authority,
                   std::shared_ptr<asset_transport> transport,
                   std::shared_ptr<lock_escrow> escrow);

        /// Claims a drop for the caller.
        /// \param ctx call context.
        /// \param sign_id voucher identifier.
        /// \param max_amount payout for the longest lock.
        /// \param lock_weeks requested lock duration, zero for a direct
        ///                   payout.
        /// \param deadline voucher deadline.
        /// \param sig voucher signature.
        auto claim(const call_context& ctx,
                   const evmc::uint256be& sign_id,
                   const evmc::uint256be& max_amount,
                   uint64_t lock_weeks,
                   uint64_t deadline,
                   const evm_sig& sig) -> exec_return_type;

        /// Returns the payout for a lock duration.
        /// \return payout or invalid_lock_weeks.
        [[nodiscard]] auto calculate_amount(const evmc::uint256be& max_amount,
                                            uint64_t lock_weeks) const
            -> std::variant<evmc::uint256be, error_code>;

        /// Returns the payout for a lock duration, zero if the duration is
        /// not allowed.
        [[nodiscard]] auto preview_claim(const evmc::uint256be& max_amount,
                                         uint64_t lock_weeks) const
            -> evmc::uint256be;

        /// Sends an amount of the token. Requires the withdraw role.
        auto withdraw(const call_context& ctx,
                      const evmc::address& to,
                      const evmc::uint256be& amount) -> exec_return_type;

        /// Sends the whole token balance to the caller. Requires the
        /// withdraw role.
        auto withdraw_all(const call_context& ctx) -> exec_return_type;

        /// Credits tokens sent directly to custody.
        auto reconcile(const call_context& ctx) -> exec_return_type;

        [[nodiscard]] auto balance() const -> evmc::uint256be;

        [[nodiscard]] auto is_used(const evmc::uint256be& sign_id) const
            -> bool;

        [[nodiscard]] auto token() const -> const asset_id&;

        [[nodiscard]] auto max_lock_weeks() const -> uint64_t;

      private:
        asset_id m_token;
        uint64_t m_chain_id;
        uint64_t m_max_lock_weeks;
        std::shared_ptr<lock_escrow> m_escrow;
    };
}

#endif
