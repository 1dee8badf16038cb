// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_FORMAT_H_
#define CUSTODY_SRC_LEDGER_FORMAT_H_

#include "messages.hpp"
#include "util/serialization/serializer.hpp"
#include "voucher.hpp"

namespace custody {
    auto operator<<(serializer& ser, const evmc::address& addr)
        -> serializer&;
    auto operator>>(serializer& deser, evmc::address& addr) -> serializer&;

    auto operator<<(serializer& ser, const evmc::bytes32& b) -> serializer&;
    auto operator>>(serializer& deser, evmc::bytes32& b) -> serializer&;

    auto operator<<(serializer& ser, const ledger::evm_sig& sig)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::evm_sig& sig) -> serializer&;

    /// Serializes every member of a voucher, regardless of its layout.
    auto operator<<(serializer& ser, const ledger::voucher& v)
        -> serializer&;
    auto operator>>(serializer& deser, ledger::voucher& v) -> serializer&;
}

#endif
