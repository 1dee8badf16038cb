// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_ITEM_INVENTORY_H_
#define CUSTODY_SRC_LEDGER_ITEM_INVENTORY_H_

#include "asset_ledger.hpp"
#include "config.hpp"
#include "front_end.hpp"
#include "replay_guard.hpp"

#include <map>
#include <utility>
#include <vector>

namespace custody::ledger {
    /// Mutable state of an item inventory.
    struct item_inventory_state {
        std::shared_ptr<journal> m_journal;
        role_gate m_roles;
        replay_guard m_replay;
        /// Collected native currency fees.
        asset_ledger m_ledger;
        /// Item balances per (account, item id).
        std::map<std::pair<evmc::address, evmc::uint256be>, evmc::uint256be>
            m_items;
    };

    /// Multi-item balances minted and burned against vouchers carrying a
    /// native currency fee, or directly by privileged roles.
    class item_inventory : public front_end<item_inventory_state> {
      public:
        /// Constructor.
        /// \param log log instance.
        /// \param cfg ledger configuration.
        /// \param admin initial administrator, also granted the withdraw
        ///              role.
        /// \param signer initial voucher signer.
        /// \param authority recovers voucher signers.
        /// \param transport holds collected fees.
        item_inventory(std::shared_ptr<logging::log> log,
                       const config& cfg,
                       const evmc::address& admin,
                       const evmc::address& signer,
                       std::shared_ptr<signature_authority> authority,
                       std::shared_ptr<asset_transport> transport);

        /// Mints items to the caller against a claim voucher.
        auto claim(const call_context& ctx,
                   const evmc::uint256be& sign_id,
                   const evmc::uint256be& id,
                   const evmc::uint256be& amount,
                   const evmc::uint256be& fee,
                   uint64_t deadline,
                   const std::vector<uint8_t>& data,
                   const evm_sig& sig) -> exec_return_type;

        /// Burns items of the caller against a use voucher.
        auto use(const call_context& ctx,
                 const evmc::uint256be& sign_id,
                 const evmc::uint256be& id,
                 const evmc::uint256be& amount,
                 const evmc::uint256be& fee,
                 uint64_t deadline,
                 const std::vector<uint8_t>& data,
                 const evm_sig& sig) -> exec_return_type;

        /// Mints items. Requires the minter role.
        auto mint(const call_context& ctx,
                  const evmc::address& to,
                  const evmc::uint256be& id,
                  const evmc::uint256be& amount) -> exec_return_type;

        /// Burns the caller's own items.
        auto burn(const call_context& ctx,
                  const evmc::address& account,
                  const evmc::uint256be& id,
                  const evmc::uint256be& amount) -> exec_return_type;

        /// Burns items of any account. Requires the burner role.
        auto burn_admin(const call_context& ctx,
                        const evmc::address& account,
                        const evmc::uint256be& id,
                        const evmc::uint256be& amount,
                        const std::vector<uint8_t>& data)
            -> exec_return_type;

        /// Sends collected fees. Requires the withdraw role.
        auto withdraw(const call_context& ctx,
                      const evmc::address& to,
                      const evmc::uint256be& amount) -> exec_return_type;

        [[nodiscard]] auto balance_of(const evmc::address& account,
                                      const evmc::uint256be& id) const
            -> evmc::uint256be;

        /// Returns the collected fees.
        [[nodiscard]] auto fees() const -> evmc::uint256be;

        [[nodiscard]] auto is_used(const evmc::uint256be& sign_id) const
            -> bool;

      private:
        auto run_voucher(item_inventory_state& s,
                         const call_context& ctx,
                         const voucher& v,
                         const evm_sig& sig) -> std::optional<error_code>;

        static auto add_items(item_inventory_state& s,
                              const evmc::address& account,
                              const evmc::uint256be& id,
                              const evmc::uint256be& amount)
            -> std::optional<error_code>;

        static auto remove_items(item_inventory_state& s,
                                 const evmc::address& account,
                                 const evmc::uint256be& id,
                                 const evmc::uint256be& amount)
            -> std::optional<error_code>;
    };
}

#endif
