// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_TRANSPORT_H_
#define CUSTODY_SRC_LEDGER_TRANSPORT_H_

#include "messages.hpp"

#include <optional>

namespace custody::ledger {
    /// Moves funds between the ledger's custody and external accounts.
    /// Calls may re-enter the ledger.
    class asset_transport {
      public:
        virtual ~asset_transport() = default;

        asset_transport() = default;
        asset_transport(const asset_transport&) = delete;
        auto operator=(const asset_transport&) -> asset_transport& = delete;
        asset_transport(asset_transport&&) = delete;
        auto operator=(asset_transport&&) -> asset_transport& = delete;

        /// Moves funds from an account into custody. For the native asset
        /// this takes the value attached to the current call.
        /// \param asset asset to move.
        /// \param from account to take the funds from.
        /// \param amount amount requested.
        /// \return true if the transfer succeeded.
        virtual auto pull(const asset_id& asset,
                          const evmc::address& from,
                          const evmc::uint256be& amount) -> bool
            = 0;

        /// Moves funds out of custody to an account. A failed push moves
        /// nothing.
        /// \param asset asset to move.
        /// \param to recipient.
        /// \param amount amount to send.
        /// \return true if the transfer succeeded.
        virtual auto push(const asset_id& asset,
                          const evmc::address& to,
                          const evmc::uint256be& amount) -> bool
            = 0;

        /// Returns the amount of the asset actually held in custody.
        [[nodiscard]] virtual auto custody_balance(const asset_id& asset) const
            -> evmc::uint256be
            = 0;
    };

    /// Time-lock escrow that holds funds on behalf of a beneficiary.
    class lock_escrow {
      public:
        virtual ~lock_escrow() = default;

        lock_escrow() = default;
        lock_escrow(const lock_escrow&) = delete;
        auto operator=(const lock_escrow&) -> lock_escrow& = delete;
        lock_escrow(lock_escrow&&) = delete;
        auto operator=(lock_escrow&&) -> lock_escrow& = delete;

        /// Address holding locked funds.
        [[nodiscard]] virtual auto address() const -> evmc::address = 0;

        /// Takes funds from the caller's custody and locks them. Nothing
        /// moves if the lock is not created.
        /// \param asset asset to lock.
        /// \param amount amount to lock.
        /// \param duration lock duration in seconds.
        /// \param beneficiary owner of the lock position.
        /// \return id of the new position or std::nullopt on failure.
        virtual auto create_lock_for(const asset_id& asset,
                                     const evmc::uint256be& amount,
                                     uint64_t duration,
                                     const evmc::address& beneficiary)
            -> std::optional<evmc::uint256be>
            = 0;
    };
}

#endif
