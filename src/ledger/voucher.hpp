// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_VOUCHER_H_
#define CUSTODY_SRC_LEDGER_VOUCHER_H_

#include "messages.hpp"
#include "util/common/buffer.hpp"
#include "util/common/hash.hpp"

#include <evmc/evmc.hpp>
#include <optional>
#include <string>
#include <vector>

namespace custody::ledger {
    /// Canonical message layouts accepted by the ledger front-ends.
    enum class voucher_layout : uint8_t {
        /// signId, account, [token], value, deadline, systemBalance,
        /// contract.
        reserve_deposit = 0,
        /// signId, recipient, [token], value, contract.
        reserve_claim = 1,
        /// "use", signId, value, token, account, param, fee, deadline,
        /// contract.
        bank_use = 2,
        /// "claim", signId, account, token, value, fee, deadline, contract.
        bank_claim = 3,
        /// signId, account, token, value, fee, deadline, contract.
        fee_claim = 4,
        /// signId, account, maxAmount, deadline, chainId, contract.
        drop_claim = 5,
        /// signId, account, id, amount, fee, deadline, data, contract,
        /// "claim".
        inventory_claim = 6,
        /// signId, account, id, amount, fee, deadline, data, contract,
        /// "use".
        inventory_use = 7
    };

    /// Off-chain issued authorization for exactly one ledger operation.
    /// Members not part of the selected layout are ignored when encoding.
    struct voucher {
        voucher_layout m_layout{};
        evmc::uint256be m_sign_id{};
        evmc::address m_account{};
        /// Token address. For the reserve layouts the native currency
        /// selects the variant without a token member.
        asset_id m_asset{};
        /// Value, amount or maximum drop amount.
        evmc::uint256be m_value{};
        evmc::uint256be m_fee{};
        uint64_t m_deadline{};
        evmc::uint256be m_system_balance{};
        evmc::uint256be m_param{};
        evmc::uint256be m_item_id{};
        uint64_t m_chain_id{};
        std::vector<uint8_t> m_data{};
        /// Address of the verifying ledger.
        evmc::address m_contract{};
    };

    /// Returns the ABI tuple encoding of the voucher's canonical message.
    /// \param v voucher to encode.
    /// \return encoded message.
    auto encode(const voucher& v) -> buffer;

    /// Returns the keccak256 digest of the canonical message. This is the
    /// value signed by the issuer, without any message prefix.
    /// \param v voucher to hash.
    /// \return message digest.
    auto digest(const voucher& v) -> hash_t;

    /// Returns true if vouchers of this layout carry a deadline.
    auto has_deadline(voucher_layout layout) -> bool;

    /// Returns the error reported when a voucher of this layout fails
    /// signature verification.
    auto signature_error(voucher_layout layout) -> error_code;

    /// Parses a layout name such as "reserve_deposit".
    auto parse_layout(const std::string& name)
        -> std::optional<voucher_layout>;
}

#endif
