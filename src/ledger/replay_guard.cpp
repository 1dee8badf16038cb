// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "replay_guard.hpp"

namespace custody::ledger {
    replay_guard::replay_guard(std::shared_ptr<journal> j,
                               error_code replay_error)
        : m_journal(std::move(j)),
          m_replay_error(replay_error) {}

    auto replay_guard::is_used(const evmc::uint256be& id) const -> bool {
        return is_used(native_asset, id);
    }

    auto replay_guard::is_used(const asset_id& asset,
                               const evmc::uint256be& id) const -> bool {
        return m_used.find({asset, id}) != m_used.end();
    }

    auto replay_guard::mark_used(const evmc::uint256be& id)
        -> std::optional<error_code> {
        return mark_used(native_asset, id);
    }

    auto replay_guard::mark_used(const asset_id& asset,
                                 const evmc::uint256be& id)
        -> std::optional<error_code> {
        if(!m_journal->insert(m_used, {asset, id})) {
            return m_replay_error;
        }
        return std::nullopt;
    }

    auto replay_guard::advance(const asset_id& asset,
                               const evmc::uint256be& id) -> bool {
        auto it = m_last_sign_id.find(asset);
        if(it != m_last_sign_id.end() && !(it->second < id)) {
            return false;
        }
        m_journal->put(m_last_sign_id, asset, id);
        return true;
    }

    auto replay_guard::last_sign_id(const asset_id& asset) const
        -> evmc::uint256be {
        auto it = m_last_sign_id.find(asset);
        if(it == m_last_sign_id.end()) {
            return {};
        }
        return it->second;
    }
}
