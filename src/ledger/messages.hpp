// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_MESSAGES_H_
#define CUSTODY_SRC_LEDGER_MESSAGES_H_

#include <evmc/evmc.hpp>
#include <optional>
#include <variant>
#include <vector>

namespace custody::ledger {
    /// Asset identifier. The zero address denotes the native currency.
    using asset_id = evmc::address;

    /// Sentinel asset id for the native currency.
    static constexpr asset_id native_asset = evmc::address{};

    /// Role identifier.
    using role_t = evmc::bytes32;

    /// Recoverable ECDSA signature in Ethereum r, s, v form.
    struct evm_sig {
        evmc::uint256be m_r;
        evmc::uint256be m_s;
        evmc::uint256be m_v;
    };

    /// Properties of the call invoking a ledger operation.
    struct call_context {
        /// Address of the caller.
        evmc::address m_sender{};
        /// Native currency attached to the call.
        evmc::uint256be m_value{};
        /// Current block timestamp in seconds.
        uint64_t m_timestamp{};
    };

    /// Reasons a ledger operation is rejected. Every failure discards all
    /// state changes and events of the operation.
    enum class error_code : uint8_t {
        zero_address,
        zero_value,
        arrays_length_mismatch,
        wrong_signature,
        invalid_signature,
        access_control_unauthorized_account,
        deadline_expired,
        order_already_processed,
        sign_id_already_used,
        insufficient_balance,
        insufficient_fee,
        exceeds_token_limit,
        invalid_refund_amount,
        invalid_coefficient_order,
        min_coefficient_too_low,
        max_coefficient_too_low,
        invalid_lock_weeks,
        /// An external push or pull of funds failed.
        transfer_failed,
        /// A checked addition or multiplication overflowed.
        arithmetic_overflow,
        /// Actual custody is below the ledger's own bookkeeping.
        accounting_drift
    };

    struct deposited {
        evmc::uint256be m_sign_id{};
        evmc::address m_account{};
        asset_id m_asset{};
        evmc::uint256be m_value{};
    };

    struct claimed {
        evmc::uint256be m_sign_id{};
        evmc::address m_account{};
        asset_id m_asset{};
        evmc::uint256be m_value{};
        /// Voucher deadline, zero for layouts without one.
        uint64_t m_deadline{};
    };

    struct used {
        evmc::uint256be m_sign_id{};
        evmc::uint256be m_value{};
        asset_id m_asset{};
        evmc::address m_account{};
        evmc::uint256be m_param{};
        /// Native currency fee paid with the payment.
        evmc::uint256be m_fee{};
    };

    struct auto_withdrawal {
        asset_id m_asset{};
        evmc::address m_to{};
        evmc::uint256be m_amount{};
    };

    struct refunded {
        evmc::address m_account{};
        asset_id m_asset{};
        evmc::uint256be m_amount{};
    };

    struct withdrawn {
        evmc::address m_to{};
        asset_id m_asset{};
        evmc::uint256be m_amount{};
        /// Amount deliberately left behind by the withdrawal.
        evmc::uint256be m_reserved{};
    };

    struct sent {
        asset_id m_asset{};
        evmc::address m_to{};
        evmc::uint256be m_amount{};
    };

    struct topup {
        evmc::address m_account{};
        asset_id m_asset{};
        evmc::uint256be m_amount{};
    };

    struct reserve_parameters_updated {
        asset_id m_asset{};
        evmc::uint256be m_min_coefficient{};
        evmc::uint256be m_max_coefficient{};
        evmc::uint256be m_absolute_min{};
    };

    struct withdraw_address_updated {
        evmc::address m_address{};
    };

    struct send_limit_updated {
        asset_id m_asset{};
        evmc::uint256be m_limit{};
    };

    struct signer_updated {
        evmc::address m_signer{};
    };

    struct role_granted {
        role_t m_role{};
        evmc::address m_account{};
        evmc::address m_sender{};
    };

    struct role_revoked {
        role_t m_role{};
        evmc::address m_account{};
        evmc::address m_sender{};
    };

    struct drop_claimed {
        evmc::address m_account{};
        evmc::uint256be m_sign_id{};
        evmc::uint256be m_max_amount{};
        uint64_t m_lock_weeks{};
        evmc::uint256be m_amount{};
        /// Escrow position id, zero for a direct payout.
        evmc::uint256be m_token_id{};
    };

    struct item_claimed {
        evmc::uint256be m_sign_id{};
        evmc::address m_account{};
        evmc::uint256be m_id{};
        evmc::uint256be m_amount{};
        std::vector<uint8_t> m_data{};
    };

    struct item_used {
        evmc::address m_account{};
        evmc::uint256be m_id{};
        evmc::uint256be m_amount{};
        std::vector<uint8_t> m_data{};
        /// Voucher id when the use was voucher-authorized.
        std::optional<evmc::uint256be> m_sign_id{};
    };

    /// Notification emitted by a successful operation.
    using event = std::variant<deposited,
                               claimed,
                               used,
                               auto_withdrawal,
                               refunded,
                               withdrawn,
                               sent,
                               topup,
                               reserve_parameters_updated,
                               withdraw_address_updated,
                               send_limit_updated,
                               signer_updated,
                               role_granted,
                               role_revoked,
                               drop_claimed,
                               item_claimed,
                               item_used>;

    /// Result of a ledger operation: the events it emitted, or the reason
    /// it was rejected.
    using exec_return_type = std::variant<std::vector<event>, error_code>;
}

#endif
