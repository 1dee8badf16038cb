// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_ASSET_LEDGER_H_
#define CUSTODY_SRC_LEDGER_ASSET_LEDGER_H_

#include "journal.hpp"
#include "messages.hpp"
#include "transport.hpp"
#include "util/common/logging.hpp"

#include <map>
#include <memory>
#include <optional>
#include <variant>

namespace custody::ledger {
    /// Book balances of the assets held in custody. A balance never goes
    /// negative and every transfer out is debited before funds leave.
    /// External transfers record a compensating transfer in the journal:
    /// rolling back returns pulled funds to their sender and claws pushed
    /// funds back. If a compensating transfer fails the book balance
    /// follows actual custody instead.
    class asset_ledger {
      public:
        /// Constructor.
        /// \param j journal recording balance changes and transfers.
        /// \param transport moves funds in and out of custody.
        /// \param log log instance.
        asset_ledger(std::shared_ptr<journal> j,
                     std::shared_ptr<asset_transport> transport,
                     std::shared_ptr<logging::log> log);

        /// Returns the book balance of the asset.
        [[nodiscard]] auto balance(const asset_id& asset) const
            -> evmc::uint256be;

        /// Increases the book balance.
        /// \return arithmetic_overflow if the balance would overflow.
        auto credit(const asset_id& asset, const evmc::uint256be& amount)
            -> std::optional<error_code>;

        /// Decreases the book balance.
        /// \return insufficient_balance if amount exceeds the balance.
        auto debit(const asset_id& asset, const evmc::uint256be& amount)
            -> std::optional<error_code>;

        /// Pulls funds from an account into custody and credits the
        /// amount custody actually grew by.
        /// \param asset asset to pull.
        /// \param from account to pull from.
        /// \param amount amount requested.
        /// \return amount credited or the reason for failure.
        auto accept(const asset_id& asset,
                    const evmc::address& from,
                    const evmc::uint256be& amount)
            -> std::variant<evmc::uint256be, error_code>;

        /// Debits the balance and then pushes the funds to an account.
        /// \param asset asset to send.
        /// \param to recipient.
        /// \param amount amount to send.
        /// \return error if the arguments are invalid, the balance is too
        ///         low or the push failed. After a failed push the debit
        ///         stays in the journal for the caller to roll back.
        auto transfer_out(const asset_id& asset,
                          const evmc::address& to,
                          const evmc::uint256be& amount)
            -> std::optional<error_code>;

        /// Aligns the book balance with actual custody. Any surplus from
        /// transfers that bypassed the ledger is credited.
        /// \param asset asset to reconcile.
        /// \return amount credited, or accounting_drift if custody holds
        ///         less than the book balance.
        auto reconcile(const asset_id& asset)
            -> std::variant<evmc::uint256be, error_code>;

      private:
        void return_funds(const asset_id& asset,
                          const evmc::address& to,
                          const evmc::uint256be& amount);

        void claw_back(const asset_id& asset,
                       const evmc::address& from,
                       const evmc::uint256be& amount);

        std::shared_ptr<journal> m_journal;
        std::shared_ptr<asset_transport> m_transport;
        std::shared_ptr<logging::log> m_log;
        std::map<asset_id, evmc::uint256be> m_balances;
    };
}

#endif
