// Copyright (c) 2022 MIT Digital Currency Initiative,
//                    Federal Reserve Bank of Boston
// Distributed under the MIT software license, see the accompanying
// file COPYING or http://www.opensource.org/licenses/mit-license.php.

#include "reserve_vault.hpp"

#include "math.hpp"

namespace custody::ledger {
    namespace {
        auto make_state(const std::shared_ptr<logging::log>& log,
                        const config& cfg,
                        const evmc::address& admin,
                        const evmc::address& signer,
                        std::shared_ptr<asset_transport> transport)
            -> reserve_vault_state {
            auto j = std::make_shared<journal>();
            auto s = reserve_vault_state{
                j,
                role_gate(j, admin),
                replay_guard(j, error_code::order_already_processed),
                asset_ledger(j, std::move(transport), log),
                {},
                {},
                cfg.m_default_reserve,
                admin};
            s.m_roles.grant(signer_role(), signer);
            return s;
        }
    }

    reserve_vault::reserve_vault(
        std::shared_ptr<logging::log> log,
        const config& cfg,
        const evmc::address& admin,
        const evmc::address& signer,
        std::shared_ptr<signature_authority> authority,
        std::shared_ptr<asset_transport> transport)
        : front_end(log,
                    cfg.m_contract_address,
                    std::move(authority),
                    make_state(log, cfg, admin, signer, std::move(transport))) {}

    auto reserve_vault::deposit(const call_context& ctx,
                                const evmc::uint256be& sign_id,
                                uint64_t deadline,
                                const evmc::uint256be& system_balance,
                                const evm_sig& sig) -> exec_return_type {
        auto v = voucher();
        v.m_layout = voucher_layout::reserve_deposit;
        v.m_sign_id = sign_id;
        v.m_account = ctx.m_sender;
        v.m_asset = native_asset;
        v.m_value = ctx.m_value;
        v.m_deadline = deadline;
        v.m_system_balance = system_balance;
        v.m_contract = m_contract;
        return m_exec.run("deposit", [&](reserve_vault_state& s) {
            return run_deposit(s, ctx, v, sig);
        });
    }

    auto reserve_vault::deposit_token(const call_context& ctx,
                                      const asset_id& token,
                                      const evmc::uint256be& sign_id,
                                      const evmc::uint256be& value,
                                      uint64_t deadline,
                                      const evmc::uint256be& system_balance,
                                      const evm_sig& sig)
        -> exec_return_type {
        auto v = voucher();
        v.m_layout = voucher_layout::reserve_deposit;
        v.m_sign_id = sign_id;
        v.m_account = ctx.m_sender;
        v.m_asset = token;
        v.m_value = value;
        v.m_deadline = deadline;
        v.m_system_balance = system_balance;
        v.m_contract = m_contract;
        return m_exec.run("deposit_token", [&](reserve_vault_state& s) {
            if(token == native_asset) {
                return std::optional<error_code>(error_code::zero_address);
            }
            return run_deposit(s, ctx, v, sig);
        });
    }

    auto reserve_vault::run_deposit(reserve_vault_state& s,
                                    const call_context& ctx,
                                    const voucher& v,
                                    const evm_sig& sig)
        -> std::optional<error_code> {
        if(evmc::is_zero(v.m_value)) {
            return error_code::zero_value;
        }
        if(auto err = verify_voucher(s, v, sig, ctx.m_timestamp)) {
            return err;
        }
        if(auto err = s.m_replay.mark_used(v.m_asset, v.m_sign_id)) {
            return err;
        }

        auto accepted = s.m_ledger.accept(v.m_asset, v.m_account, v.m_value);
        if(std::holds_alternative<error_code>(accepted)) {
            return std::get<error_code>(accepted);
        }
        const auto& amount = std::get<evmc::uint256be>(accepted);
        s.m_journal->put(s.m_deposits, {v.m_account, v.m_asset}, amount);
        m_exec.emit(deposited{v.m_sign_id, v.m_account, v.m_asset, amount});

        if(!s.m_replay.advance(v.m_asset, v.m_sign_id)) {
            m_log->debug("Deposit",
                         to_decimal(v.m_sign_id),
                         "does not advance the sign id, skipping reserve "
                         "check");
            return std::nullopt;
        }

        auto it = s.m_parameters.find(v.m_asset);
        const auto& params = it != s.m_parameters.end()
                               ? it->second
                               : s.m_default_parameters;
        auto sweep = sweep_amount(params,
                                  v.m_system_balance,
                                  s.m_ledger.balance(v.m_asset));
        if(std::holds_alternative<error_code>(sweep)) {
            return std::get<error_code>(sweep);
        }
        const auto surplus = std::get<evmc::uint256be>(sweep);
        if(evmc::is_zero(surplus)) {
            return std::nullopt;
        }

        const auto to = s.m_withdraw_address;
        if(auto err = s.m_ledger.transfer_out(v.m_asset, to, surplus)) {
            return err;
        }
        m_log->info("Swept",
                    to_decimal(surplus),
                    "of",
                    to_hex(v.m_asset),
                    "to",
                    to_hex(to));
        m_exec.emit(auto_withdrawal{v.m_asset, to, surplus});
        return std::nullopt;
    }

    auto reserve_vault::claim(const call_context& ctx,
                              const evmc::uint256be& sign_id,
                              const evmc::address& recipient,
                              const evmc::uint256be& value,
                              const evm_sig& sig) -> exec_return_type {
        auto v = voucher();
        v.m_layout = voucher_layout::reserve_claim;
        v.m_sign_id = sign_id;
        v.m_account = recipient;
        v.m_asset = native_asset;
        v.m_value = value;
        v.m_contract = m_contract;
        return m_exec.run("claim", [&](reserve_vault_state& s) {
            return run_claim(s, ctx, v, sig);
        });
    }

    auto reserve_vault::claim_token(const call_context& ctx,
                                    const evmc::uint256be& sign_id,
                                    const evmc::address& recipient,
                                    const asset_id& token,
                                    const evmc::uint256be& value,
                                    const evm_sig& sig) -> exec_return_type {
        auto v = voucher();
        v.m_layout = voucher_layout::reserve_claim;
        v.m_sign_id = sign_id;
        v.m_account = recipient;
        v.m_asset = token;
        v.m_value = value;
        v.m_contract = m_contract;
        return m_exec.run("claim_token", [&](reserve_vault_state& s) {
            if(token == native_asset) {
                return std::optional<error_code>(error_code::zero_address);
            }
            return run_claim(s, ctx, v, sig);
        });
    }

    auto reserve_vault::run_claim(reserve_vault_state& s,
                                  const call_context& ctx,
                                  const voucher& v,
                                  const evm_sig& sig)
        -> std::optional<error_code> {
        if(v.m_account == evmc::address{}) {
            return error_code::zero_address;
        }
        if(evmc::is_zero(v.m_value)) {
            return error_code::zero_value;
        }
        if(auto err = verify_voucher(s, v, sig, ctx.m_timestamp)) {
            return err;
        }
        if(auto err = s.m_replay.mark_used(v.m_asset, v.m_sign_id)) {
            return err;
        }
        s.m_journal->remove(s.m_deposits, {v.m_account, v.m_asset});
        m_exec.emit(claimed{v.m_sign_id, v.m_account, v.m_asset, v.m_value});
        return s.m_ledger.transfer_out(v.m_asset, v.m_account, v.m_value);
    }

    auto reserve_vault::refund(const call_context& ctx,
                               const evmc::address& account,
                               const asset_id& asset,
                               const evmc::uint256be& amount)
        -> exec_return_type {
        return m_exec.run("refund", [&](reserve_vault_state& s) {
            if(auto err = s.m_roles.check_role(refund_role(), ctx.m_sender)) {
                return err;
            }
            if(account == evmc::address{}) {
                return std::optional<error_code>(error_code::zero_address);
            }
            if(evmc::is_zero(amount)) {
                return std::optional<error_code>(error_code::zero_value);
            }
            auto it = s.m_deposits.find({account, asset});
            if(it == s.m_deposits.end() || it->second < amount) {
                return std::optional<error_code>(
                    error_code::invalid_refund_amount);
            }
            s.m_journal->remove(s.m_deposits, {account, asset});
            m_exec.emit(refunded{account, asset, amount});
            return s.m_ledger.transfer_out(asset, account, amount);
        });
    }

    auto reserve_vault::withdraw(const call_context& ctx,
                                 const asset_id& asset,
                                 const evmc::uint256be& reserved)
        -> exec_return_type {
        return m_exec.run("withdraw", [&](reserve_vault_state& s) {
            if(auto err = s.m_roles.check_role(withdraw_role(),
                                               ctx.m_sender)) {
                return err;
            }
            auto amount = checked_sub(s.m_ledger.balance(asset), reserved);
            if(!amount.has_value()) {
                return std::optional<error_code>(
                    error_code::insufficient_balance);
            }
            m_exec.emit(
                withdrawn{ctx.m_sender, asset, amount.value(), reserved});
            return s.m_ledger.transfer_out(asset,
                                           ctx.m_sender,
                                           amount.value());
        });
    }

    auto reserve_vault::topup(const call_context& ctx) -> exec_return_type {
        return m_exec.run("topup", [&](reserve_vault_state& s) {
            return run_topup(s, ctx, native_asset, ctx.m_value);
        });
    }

    auto reserve_vault::topup_token(const call_context& ctx,
                                    const asset_id& token,
                                    const evmc::uint256be& amount)
        -> exec_return_type {
        return m_exec.run("topup_token", [&](reserve_vault_state& s) {
            if(token == native_asset) {
                return std::optional<error_code>(error_code::zero_address);
            }
            return run_topup(s, ctx, token, amount);
        });
    }

    auto reserve_vault::run_topup(reserve_vault_state& s,
                                  const call_context& ctx,
                                  const asset_id& asset,
                                  const evmc::uint256be& amount)
        -> std::optional<error_code> {
        auto accepted = s.m_ledger.accept(asset, ctx.m_sender, amount);
        if(std::holds_alternative<error_code>(accepted)) {
            return std::get<error_code>(accepted);
        }
        m_exec.emit(topup{ctx.m_sender,
                          asset,
                          std::get<evmc::uint256be>(accepted)});
        return std::nullopt;
    }

    auto reserve_vault::set_reserve_parameters(
        const call_context& ctx,
        const asset_id& asset,
        const reserve_parameters& params) -> exec_return_type {
        return m_exec.run("set_reserve_parameters",
                          [&](reserve_vault_state& s) {
                              if(auto err
                                 = s.m_roles.check_role(admin_role(),
                                                        ctx.m_sender)) {
                                  return err;
                              }
                              if(auto err = validate(params)) {
                                  return err;
                              }
                              s.m_journal->put(s.m_parameters, asset, params);
                              m_log->info("Reserve parameters of",
                                          to_hex(asset),
                                          "set to",
                                          to_decimal(params.m_min_coefficient),
                                          to_decimal(params.m_max_coefficient),
                                          to_decimal(params.m_absolute_min));
                              m_exec.emit(reserve_parameters_updated{
                                  asset,
                                  params.m_min_coefficient,
                                  params.m_max_coefficient,
                                  params.m_absolute_min});
                              return std::optional<error_code>();
                          });
    }

    auto reserve_vault::set_withdraw_address(const call_context& ctx,
                                             const evmc::address& addr)
        -> exec_return_type {
        return m_exec.run("set_withdraw_address",
                          [&](reserve_vault_state& s) {
                              if(auto err
                                 = s.m_roles.check_role(admin_role(),
                                                        ctx.m_sender)) {
                                  return err;
                              }
                              if(addr == evmc::address{}) {
                                  return std::optional<error_code>(
                                      error_code::zero_address);
                              }
                              s.m_journal->assign(s.m_withdraw_address,
                                                  addr);
                              m_log->info("Withdraw address set to",
                                          to_hex(addr));
                              m_exec.emit(withdraw_address_updated{addr});
                              return std::optional<error_code>();
                          });
    }

    auto reserve_vault::reconcile(const call_context& /* ctx */,
                                  const asset_id& asset)
        -> exec_return_type {
        return m_exec.run("reconcile", [&](reserve_vault_state& s) {
            auto res = s.m_ledger.reconcile(asset);
            if(std::holds_alternative<error_code>(res)) {
                m_log->error("Custody of",
                             to_hex(asset),
                             "is below the book balance");
                return std::optional<error_code>(std::get<error_code>(res));
            }
            const auto& surplus = std::get<evmc::uint256be>(res);
            if(!evmc::is_zero(surplus)) {
                m_exec.emit(topup{evmc::address{}, asset, surplus});
            }
            return std::optional<error_code>();
        });
    }

    auto reserve_vault::balance(const asset_id& asset) const
        -> evmc::uint256be {
        return m_exec.state().m_ledger.balance(asset);
    }

    auto reserve_vault::deposit_of(const evmc::address& account,
                                   const asset_id& asset) const
        -> evmc::uint256be {
        const auto& deposits = m_exec.state().m_deposits;
        auto it = deposits.find({account, asset});
        if(it == deposits.end()) {
            return {};
        }
        return it->second;
    }

    auto reserve_vault::is_used(const asset_id& asset,
                                const evmc::uint256be& sign_id) const
        -> bool {
        return m_exec.state().m_replay.is_used(asset, sign_id);
    }

    auto reserve_vault::last_sign_id(const asset_id& asset) const
        -> evmc::uint256be {
        return m_exec.state().m_replay.last_sign_id(asset);
    }

    auto reserve_vault::parameters(const asset_id& asset) const
        -> reserve_parameters {
        const auto& s = m_exec.state();
        auto it = s.m_parameters.find(asset);
        if(it == s.m_parameters.end()) {
            return s.m_default_parameters;
        }
        return it->second;
    }

    auto reserve_vault::withdraw_address() const -> evmc::address {
        return m_exec.state().m_withdraw_address;
    }
}
