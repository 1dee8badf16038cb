// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "format.hpp"

#include "util/serialization/format.hpp"

namespace custody {
    auto operator<<(serializer& ser, const evmc::address& addr)
        -> serializer& {
        ser.write(addr.bytes, sizeof(addr.bytes));
        return ser;
    }

    auto operator>>(serializer& deser, evmc::address& addr) -> serializer& {
        deser.read(addr.bytes, sizeof(addr.bytes));
        return deser;
    }

    auto operator<<(serializer& ser, const evmc::bytes32& b) -> serializer& {
        ser.write(b.bytes, sizeof(b.bytes));
        return ser;
    }

    auto operator>>(serializer& deser, evmc::bytes32& b) -> serializer& {
        deser.read(b.bytes, sizeof(b.bytes));
        return deser;
    }

    auto operator<<(serializer& ser, const ledger::evm_sig& sig)
        -> serializer& {
        return ser << sig.m_r << sig.m_s << sig.m_v;
    }

    auto operator>>(serializer& deser, ledger::evm_sig& sig) -> serializer& {
        return deser >> sig.m_r >> sig.m_s >> sig.m_v;
    }

    auto operator<<(serializer& ser, const ledger::voucher& v)
        -> serializer& {
        return ser << static_cast<uint8_t>(v.m_layout) << v.m_sign_id
                   << v.m_account << v.m_asset << v.m_value << v.m_fee
                   << v.m_deadline << v.m_system_balance << v.m_param
                   << v.m_item_id << v.m_chain_id << v.m_data
                   << v.m_contract;
    }

    auto operator>>(serializer& deser, ledger::voucher& v) -> serializer& {
        uint8_t layout{};
        if(!(deser >> layout)) {
            return deser;
        }
        v.m_layout = static_cast<ledger::voucher_layout>(layout);
        return deser >> v.m_sign_id >> v.m_account >> v.m_asset >> v.m_value
            >> v.m_fee >> v.m_deadline >> v.m_system_balance >> v.m_param
            >> v.m_item_id >> v.m_chain_id >> v.m_data >> v.m_contract;
    }
}
