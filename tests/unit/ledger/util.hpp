// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_TESTS_UNIT_LEDGER_UTIL_H_
#define CUSTODY_TESTS_UNIT_LEDGER_UTIL_H_

#include "ledger/messages.hpp"
#include "ledger/signature.hpp"
#include "ledger/transport.hpp"
#include "ledger/voucher.hpp"

#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace custody::ledger::test {
    /// In-memory asset movements. Every external account holds a balance
    /// per asset. Pulling the native asset models the value attached to
    /// the call, so tests fund the sender first.
    class memory_transport : public asset_transport {
      public:
        auto pull(const asset_id& asset,
                  const evmc::address& from,
                  const evmc::uint256be& amount) -> bool override;

        auto push(const asset_id& asset,
                  const evmc::address& to,
                  const evmc::uint256be& amount) -> bool override;

        [[nodiscard]] auto custody_balance(const asset_id& asset) const
            -> evmc::uint256be override;

        /// Credits an external account.
        void fund(const asset_id& asset,
                  const evmc::address& account,
                  const evmc::uint256be& amount);

        /// Adds funds to custody without going through the ledger.
        void airdrop(const asset_id& asset, const evmc::uint256be& amount);

        [[nodiscard]] auto balance_of(const asset_id& asset,
                                      const evmc::address& account) const
            -> evmc::uint256be;

        /// Amount burned on every pull, modelling fee-on-transfer tokens.
        evmc::uint256be m_pull_fee{};
        /// Makes every push fail after running the hook. The funds return
        /// to custody.
        bool m_fail_push{false};
        /// Recipients whose pushes fail without moving anything.
        std::set<evmc::address> m_rejected;
        /// Called after funds leave custody, before push returns.
        std::function<void()> m_on_push;

      private:
        std::map<std::pair<asset_id, evmc::address>, evmc::uint256be>
            m_accounts;
        std::map<asset_id, evmc::uint256be> m_custody;
    };

    /// Escrow recording every lock it creates. Locked funds move from
    /// custody to the escrow's address.
    class memory_escrow : public lock_escrow {
      public:
        struct lock {
            asset_id m_asset;
            evmc::uint256be m_amount;
            uint64_t m_duration;
            evmc::address m_beneficiary;
        };

        explicit memory_escrow(std::shared_ptr<memory_transport> transport);

        [[nodiscard]] auto address() const -> evmc::address override;

        auto create_lock_for(const asset_id& asset,
                             const evmc::uint256be& amount,
                             uint64_t duration,
                             const evmc::address& beneficiary)
            -> std::optional<evmc::uint256be> override;

        std::shared_ptr<memory_transport> m_transport;

        bool m_fail{false};
        std::vector<lock> m_locks;
    };

    /// Returns the private key for the given hex string.
    auto make_key(const std::string& hex) -> privkey_t;

    /// Returns the address for the given hex string.
    auto make_address(const std::string& hex) -> evmc::address;

    /// Signs the voucher's digest.
    auto sign(const voucher& v, const privkey_t& key) -> evm_sig;

    /// Returns the error of a rejected operation, or std::nullopt if it
    /// succeeded.
    auto error_of(const exec_return_type& res) -> std::optional<error_code>;

    /// Returns the events of a successful operation. Empty if it failed.
    auto events_of(const exec_return_type& res) -> std::vector<event>;

    /// Well-known development keys and their addresses.
    static constexpr auto key0
        = "ac0974bec39a17e36ba4a6b4d238ff944bacb478cbed5efcae784d7bf4f2ff80";
    static constexpr auto addr0 = "f39fd6e51aad88f6f4ce6ab8827279cfffb92266";
    static constexpr auto key1
        = "59c6995e998f97a5a0044966f0945389dc9e86dae88c7a8412f4603b6b78690d";
    static constexpr auto addr1 = "70997970c51812dc3a010c7d01b50e0d17dc79c8";
    static constexpr auto key2
        = "5de4111afa1a4b94908f83103eb1f1706367c2e68ca870fc3fb9a804cdab365a";
    static constexpr auto addr2 = "3c44cdddb6a900fa2b585dd299e03d12fa4293bc";
}

#endif
