// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_REPLAY_GUARD_H_
#define CUSTODY_SRC_LEDGER_REPLAY_GUARD_H_

#include "journal.hpp"
#include "messages.hpp"

#include <map>
#include <memory>
#include <optional>
#include <set>
#include <utility>

namespace custody::ledger {
    /// Set of consumed voucher identifiers. Identifiers are never removed.
    /// Each asset has its own identifier scope; identifiers consumed
    /// without an asset share the scope of the native currency.
    class replay_guard {
      public:
        /// Constructor.
        /// \param j journal recording consumed identifiers.
        /// \param replay_error error reported when an identifier is reused.
        replay_guard(std::shared_ptr<journal> j, error_code replay_error);

        /// Returns true if the identifier has been consumed.
        [[nodiscard]] auto is_used(const evmc::uint256be& id) const -> bool;

        /// Returns true if the identifier has been consumed in the asset's
        /// scope.
        [[nodiscard]] auto is_used(const asset_id& asset,
                                   const evmc::uint256be& id) const -> bool;

        /// Consumes an identifier.
        /// \param id identifier to consume.
        /// \return the replay error if the identifier was already consumed.
        auto mark_used(const evmc::uint256be& id) -> std::optional<error_code>;

        /// Consumes an identifier in the asset's scope.
        /// \param asset scope of the identifier.
        /// \param id identifier to consume.
        /// \return the replay error if the identifier was already consumed
        ///         for this asset.
        auto mark_used(const asset_id& asset, const evmc::uint256be& id)
            -> std::optional<error_code>;

        /// Records forward progress of identifiers for an asset.
        /// \param asset asset the identifier belongs to.
        /// \param id identifier of the current operation.
        /// \return true if id is greater than every identifier previously
        ///         recorded for the asset.
        auto advance(const asset_id& asset, const evmc::uint256be& id)
            -> bool;

        /// Returns the highest identifier recorded for the asset.
        [[nodiscard]] auto last_sign_id(const asset_id& asset) const
            -> evmc::uint256be;

      private:
        std::shared_ptr<journal> m_journal;
        error_code m_replay_error;
        std::set<std::pair<asset_id, evmc::uint256be>> m_used;
        std::map<asset_id, evmc::uint256be> m_last_sign_id;
    };
}

#endif
