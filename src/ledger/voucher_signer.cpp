// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "config.hpp"
#include "format.hpp"
#include "signature.hpp"
#include "util.hpp"
#include "util/common/logging.hpp"
#include "util/serialization/util.hpp"
#include "voucher.hpp"

#include <iostream>
#include <string>
#include <utility>
#include <vector>

using namespace custody::ledger;

namespace {
    auto set_field(voucher& v,
                   const std::string& key,
                   const std::string& value) -> bool {
        if(key == "account") {
            auto addr = from_hex<evmc::address>(value);
            if(!addr.has_value()) {
                return false;
            }
            v.m_account = addr.value();
            return true;
        }
        if(key == "asset") {
            auto addr = from_hex<evmc::address>(value);
            if(!addr.has_value()) {
                return false;
            }
            v.m_asset = addr.value();
            return true;
        }
        if(key == "data") {
            auto buf = custody::buffer::from_hex_prefixed(value);
            if(!buf.has_value()) {
                return false;
            }
            const auto* ptr = buf->c_ptr();
            // NOLINTNEXTLINE(cppcoreguidelines-pro-bounds-pointer-arithmetic)
            v.m_data = std::vector<uint8_t>(ptr, ptr + buf->size());
            return true;
        }

        auto num = parse_uint256(value);
        if(!num.has_value()) {
            return false;
        }
        if(key == "deadline") {
            if(exceeds_uint64(num.value())) {
                return false;
            }
            v.m_deadline = to_uint64(num.value());
            return true;
        }
        static const auto uint_fields
            = std::vector<std::pair<std::string, evmc::uint256be voucher::*>>{
                {"sign_id", &voucher::m_sign_id},
                {"value", &voucher::m_value},
                {"fee", &voucher::m_fee},
                {"system_balance", &voucher::m_system_balance},
                {"param", &voucher::m_param},
                {"item_id", &voucher::m_item_id}};
        for(const auto& [name, member] : uint_fields) {
            if(name == key) {
                v.*member = num.value();
                return true;
            }
        }
        return false;
    }
}

auto main(int argc, char** argv) -> int {
    auto log = std::make_shared<custody::logging::log>(
        custody::logging::log_level::warn);

    auto args = std::vector<std::string>(argv, argv + argc);
    if(args.size() < 3) {
        std::cerr << "Usage: " << args[0]
                  << " <config file> <layout> [field=value ...]"
                  << std::endl;
        return 1;
    }

    auto cfg = read_config(argc, argv);
    if(!cfg.has_value()) {
        log->error("Error parsing options");
        return 1;
    }
    log->set_loglevel(cfg->m_loglevel);

    if(!cfg->m_signer_key.has_value()) {
        log->error("No signer_key in configuration");
        return 1;
    }

    auto layout = parse_layout(args[2]);
    if(!layout.has_value()) {
        log->error("Unknown voucher layout", args[2]);
        return 1;
    }

    auto v = voucher();
    v.m_layout = layout.value();
    v.m_contract = cfg->m_contract_address;
    v.m_chain_id = cfg->m_chain_id;
    for(size_t i = 3; i < args.size(); i++) {
        const auto& arg = args[i];
        auto sep = arg.find('=');
        if(sep == std::string::npos) {
            log->error("Expected field=value, got", arg);
            return 1;
        }
        if(!set_field(v, arg.substr(0, sep), arg.substr(sep + 1))) {
            log->error("Invalid voucher field", arg);
            return 1;
        }
    }

    auto secp = make_secp256k1_context();
    auto signer = address_of(cfg->m_signer_key.value(), secp);
    if(!signer.has_value()) {
        log->error("Invalid signer key");
        return 1;
    }

    auto hash = digest(v);
    auto sig = eth_sign(cfg->m_signer_key.value(), hash, secp);
    log->info("Signed voucher",
              to_decimal(v.m_sign_id),
              "as",
              "0x" + to_hex(signer.value()));

    std::cout << "signer: 0x" << to_hex(signer.value()) << std::endl;
    std::cout << "digest: 0x" << custody::to_string(hash) << std::endl;
    std::cout << "r: 0x" << to_hex(sig.m_r) << std::endl;
    std::cout << "s: 0x" << to_hex(sig.m_s) << std::endl;
    std::cout << "v: 0x" << to_hex(sig.m_v) << std::endl;
    std::cout << "voucher: " << custody::make_buffer(v).to_hex_prefixed()
              << std::endl;

    return 0;
}
