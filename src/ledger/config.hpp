// Copyright (c) 2021 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#ifndef CUSTODY_SRC_LEDGER_CONFIG_H_
#define CUSTODY_SRC_LEDGER_CONFIG_H_

#include "reserve_policy.hpp"
#include "util/common/config.hpp"
#include "util/common/keys.hpp"
#include "util/common/logging.hpp"
#include "vesting.hpp"

#include <evmc/evmc.hpp>
#include <optional>

namespace custody::ledger {
    /// Configuration parameters for a ledger deployment.
    struct config {
        /// Address of the ledger, bound into every voucher it accepts.
        evmc::address m_contract_address{};
        /// Chain ID bound into retro drop vouchers.
        uint64_t m_chain_id{1};
        /// Voucher signing key, only needed by voucher issuers.
        std::optional<privkey_t> m_signer_key;
        /// Reserve band used for assets without explicit parameters.
        reserve_parameters m_default_reserve{};
        /// Longest lock accepted by the retro drop, in weeks.
        uint64_t m_max_lock_weeks{default_max_lock_weeks};
        /// Minimum level of log statements.
        logging::log_level m_loglevel{logging::log_level::info};
    };

    /// Reads the configuration parameters from a parsed configuration
    /// file.
    /// \param cfg parsed configuration.
    /// \return configuration parameters or std::nullopt if a value was
    ///         malformed or the parameters are inconsistent.
    auto read_config(const custody::config::parser& cfg)
        -> std::optional<config>;

    /// Reads the configuration parameters from the program arguments.
    /// \param argc number of program arguments.
    /// \param argv program arguments. The first argument after the
    ///             program name is the path of the configuration file.
    /// \return configuration parametrs or std::nullopt if there was an error
    ///         while parsing the arguments.
    auto read_config(int argc, char** argv) -> std::optional<config>;
}

#endif
