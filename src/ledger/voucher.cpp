// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "voucher.hpp"

#include "abi.hpp"

#include <map>

namespace custody::ledger {
    auto encode(const voucher& v) -> buffer {
        auto enc = abi_encoder();
        switch(v.m_layout) {
            case voucher_layout::reserve_deposit:
                enc.add_uint(v.m_sign_id).add_address(v.m_account);
                if(v.m_asset != native_asset) {
                    enc.add_address(v.m_asset);
                }
                enc.add_uint(v.m_value)
                    .add_uint(v.m_deadline)
                    .add_uint(v.m_system_balance)
                    .add_address(v.m_contract);
                break;
            case voucher_layout::reserve_claim:
                enc.add_uint(v.m_sign_id).add_address(v.m_account);
                if(v.m_asset != native_asset) {
                    enc.add_address(v.m_asset);
                }
                enc.add_uint(v.m_value).add_address(v.m_contract);
                break;
            case voucher_layout::bank_use:
                enc.add_string("use")
                    .add_uint(v.m_sign_id)
                    .add_uint(v.m_value)
                    .add_address(v.m_asset)
                    .add_address(v.m_account)
                    .add_uint(v.m_param)
                    .add_uint(v.m_fee)
                    .add_uint(v.m_deadline)
                    .add_address(v.m_contract);
                break;
            case voucher_layout::bank_claim:
                enc.add_string("claim");
                [[fallthrough]];
            case voucher_layout::fee_claim:
                enc.add_uint(v.m_sign_id)
                    .add_address(v.m_account)
                    .add_address(v.m_asset)
                    .add_uint(v.m_value)
                    .add_uint(v.m_fee)
                    .add_uint(v.m_deadline)
                    .add_address(v.m_contract);
                break;
            case voucher_layout::drop_claim:
                enc.add_uint(v.m_sign_id)
                    .add_address(v.m_account)
                    .add_uint(v.m_value)
                    .add_uint(v.m_deadline)
                    .add_uint(v.m_chain_id)
                    .add_address(v.m_contract);
                break;
            case voucher_layout::inventory_claim:
            case voucher_layout::inventory_use:
                enc.add_uint(v.m_sign_id)
                    .add_address(v.m_account)
                    .add_uint(v.m_item_id)
                    .add_uint(v.m_value)
                    .add_uint(v.m_fee)
                    .add_uint(v.m_deadline)
                    .add_bytes(v.m_data)
                    .add_address(v.m_contract)
                    .add_string(v.m_layout == voucher_layout::inventory_claim
                                    ? "claim"
                                    : "use");
                break;
        }
        return enc.encode();
    }

    auto digest(const voucher& v) -> hash_t {
        auto msg = encode(v);
        return keccak_data(msg.data(), msg.size());
    }

    auto has_deadline(voucher_layout layout) -> bool {
        return layout != voucher_layout::reserve_claim;
    }

    auto signature_error(voucher_layout layout) -> error_code {
        switch(layout) {
            case voucher_layout::fee_claim:
            case voucher_layout::drop_claim:
                return error_code::invalid_signature;
            default:
                return error_code::wrong_signature;
        }
    }

    auto parse_layout(const std::string& name)
        -> std::optional<voucher_layout> {
        static const auto layouts = std::map<std::string, voucher_layout>{
            {"reserve_deposit", voucher_layout::reserve_deposit},
            {"reserve_claim", voucher_layout::reserve_claim},
            {"bank_use", voucher_layout::bank_use},
            {"bank_claim", voucher_layout::bank_claim},
            {"fee_claim", voucher_layout::fee_claim},
            {"drop_claim", voucher_layout::drop_claim},
            {"inventory_claim", voucher_layout::inventory_claim},
            {"inventory_use", voucher_layout::inventory_use}};
        auto it = layouts.find(name);
        if(it == layouts.end()) {
            return std::nullopt;
        }
        return it->second;
    }
}
